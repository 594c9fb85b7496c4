#include "optimization/InputBounds.h"
#include "utils/Errors.h"

#include <algorithm>
#include <cmath>

namespace helio {
namespace optimization {

InputBounds::InputBounds(std::size_t n, double low, double high) {
    add_bounds(n, low, high);
}

Bound InputBounds::checked(double low, double high) {
    if (!std::isfinite(low) || !std::isfinite(high) || low > high) {
        throw PreconditionError("Invalid bound [" + std::to_string(low) + ", " +
                                std::to_string(high) + "]");
    }
    Bound b;
    b.low = low;
    b.high = high;
    return b;
}

void InputBounds::add_bounds(std::size_t n, double low, double high) {
    Bound b = checked(low, high);
    bounds_.insert(bounds_.end(), n, b);
}

void InputBounds::add_bound(double low, double high) {
    bounds_.push_back(checked(low, high));
}

void InputBounds::remove_bound(std::size_t index) {
    if (index >= bounds_.size()) {
        throw PreconditionError("Bound index " + std::to_string(index) + " out of range");
    }
    bounds_.erase(bounds_.begin() + static_cast<std::ptrdiff_t>(index));
}

const Bound& InputBounds::bound(std::size_t index) const {
    if (index >= bounds_.size()) {
        throw PreconditionError("Bound index " + std::to_string(index) + " out of range");
    }
    return bounds_[index];
}

std::map<std::string, Bound> InputBounds::get_bound_dict() const {
    std::map<std::string, Bound> dict;
    for (std::size_t i = 0; i < bounds_.size(); ++i) {
        dict["x" + std::to_string(i)] = bounds_[i];
    }
    return dict;
}

double InputBounds::clamp(std::size_t index, double value) const {
    const Bound& b = bound(index);
    return std::clamp(value, b.low, b.high);
}

void InputBounds::clamp(std::vector<double>& genes) const {
    if (genes.size() != bounds_.size()) {
        throw PreconditionError("Expected " + std::to_string(bounds_.size()) +
                                " genes, got " + std::to_string(genes.size()));
    }
    for (std::size_t i = 0; i < genes.size(); ++i) {
        genes[i] = std::clamp(genes[i], bounds_[i].low, bounds_[i].high);
    }
}

bool InputBounds::contains(const std::vector<double>& genes) const {
    if (genes.size() != bounds_.size()) {
        return false;
    }
    for (std::size_t i = 0; i < genes.size(); ++i) {
        if (!bounds_[i].contains(genes[i])) {
            return false;
        }
    }
    return true;
}

} // namespace optimization
} // namespace helio
