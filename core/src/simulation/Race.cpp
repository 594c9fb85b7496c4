#include "simulation/Race.h"
#include "utils/Errors.h"

namespace helio {
namespace sim {

namespace {
constexpr int DAY_LENGTH = 24 * 60 * 60;

bool window_is_valid(int begin, int end) {
    return begin >= 0 && begin <= end && end <= DAY_LENGTH;
}
} // anonymous namespace

RaceType parse_race_type(const std::string& name) {
    if (name == "ASC") return RaceType::ASC;
    if (name == "FSGP") return RaceType::FSGP;
    throw PreconditionError("Unsupported race type: " + name);
}

std::string to_string(RaceType type) {
    switch (type) {
        case RaceType::ASC: return "ASC";
        case RaceType::FSGP: return "FSGP";
    }
    return "unknown";
}

RaceConfig::RaceConfig(RaceType type, const RaceProps& props)
    : type_(type)
    , props_(props) {
    if (props_.days.empty()) {
        throw PreconditionError("Race " + to_string(type) + " has no race days");
    }
    if (props_.tiling < 1) {
        throw PreconditionError("Race tiling must be >= 1");
    }
    for (std::size_t d = 0; d < props_.days.size(); ++d) {
        const DayWindows& w = props_.days[d];
        if (!window_is_valid(w.driving_begin, w.driving_end) ||
            !window_is_valid(w.charging_begin, w.charging_end)) {
            throw PreconditionError("Race day " + std::to_string(d) + " has a window outside [0, 86400]");
        }
    }

    driving_ = make_time_mask(WindowKind::Driving);
    charging_ = make_time_mask(WindowKind::Charging);
}

RaceConfig RaceConfig::from_config(const std::string& race_name, const ConfigManager& config) {
    RaceType type = parse_race_type(race_name);

    auto props = config.get_race(race_name);
    if (!props) {
        throw PreconditionError("Race " + race_name + " is not configured");
    }
    return RaceConfig(type, *props);
}

std::vector<bool> RaceConfig::make_time_mask(WindowKind kind) const {
    std::vector<bool> mask(props_.days.size() * DAY_LENGTH, false);

    for (std::size_t day = 0; day < props_.days.size(); ++day) {
        const DayWindows& w = props_.days[day];
        int begin = (kind == WindowKind::Driving) ? w.driving_begin : w.charging_begin;
        int end = (kind == WindowKind::Driving) ? w.driving_end : w.charging_end;

        std::size_t offset = day * DAY_LENGTH;
        for (int second = begin; second < end; ++second) {
            mask[offset + static_cast<std::size_t>(second)] = true;
        }
    }
    return mask;
}

} // namespace sim
} // namespace helio
