#ifndef HELIOSTRATEGY_ERRORS_H
#define HELIOSTRATEGY_ERRORS_H

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace helio {

/**
 * @brief Raised when an input violates a documented precondition
 * (speed vector length, granularity, race type, vehicle parameters).
 */
class PreconditionError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Raised when route or weather data does not cover the requested horizon.
 */
class DataCoverageError : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

/**
 * @brief Raised when results are requested before anything has been computed.
 */
class PrematureDataRecoveryError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * @brief Aggregates every fitness evaluation failure of one generation.
 */
class EvaluationError : public std::runtime_error {
public:
    explicit EvaluationError(std::vector<std::string> failures)
        : std::runtime_error(summarize(failures))
        , failures_(std::move(failures)) {}

    const std::vector<std::string>& failures() const { return failures_; }

private:
    static std::string summarize(const std::vector<std::string>& failures) {
        std::string msg = std::to_string(failures.size()) + " fitness evaluation(s) failed";
        if (!failures.empty()) {
            msg += ": " + failures.front();
        }
        return msg;
    }

    std::vector<std::string> failures_;
};

} // namespace helio

#endif // HELIOSTRATEGY_ERRORS_H
