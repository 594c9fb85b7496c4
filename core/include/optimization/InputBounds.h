#ifndef HELIOSTRATEGY_INPUT_BOUNDS_H
#define HELIOSTRATEGY_INPUT_BOUNDS_H

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace helio {
namespace optimization {

/**
 * @brief Inclusive [low, high] range of one gene.
 */
struct Bound {
    double low = 0.0;
    double high = 0.0;

    double span() const { return high - low; }
    bool contains(double value) const { return value >= low && value <= high; }
};

/**
 * @brief Per-gene search ranges handed to the optimizer.
 *
 * Bounds are stored in gene order; gene i of every individual is kept
 * inside bound(i).
 */
class InputBounds {
public:
    InputBounds() = default;

    /**
     * @brief n genes sharing the same range.
     * @throws PreconditionError if low > high or either is not finite.
     */
    InputBounds(std::size_t n, double low, double high);

    /**
     * @brief Append n genes sharing the same range.
     * @throws PreconditionError if low > high or either is not finite.
     */
    void add_bounds(std::size_t n, double low, double high);

    /**
     * @brief Append one gene.
     */
    void add_bound(double low, double high);

    /**
     * @brief Remove the bound at index; later genes shift down.
     * @throws PreconditionError if index is out of range.
     */
    void remove_bound(std::size_t index);

    std::size_t size() const { return bounds_.size(); }
    bool empty() const { return bounds_.empty(); }

    /**
     * @throws PreconditionError if index is out of range.
     */
    const Bound& bound(std::size_t index) const;

    const std::vector<Bound>& get_bounds() const { return bounds_; }

    /**
     * @brief Bounds keyed "x0", "x1", ...
     */
    std::map<std::string, Bound> get_bound_dict() const;

    double clamp(std::size_t index, double value) const;

    /**
     * @brief Clamp every gene of a vector in place.
     * @throws PreconditionError if the vector length differs from size().
     */
    void clamp(std::vector<double>& genes) const;

    /**
     * @brief True when the vector has size() genes, each within its bound.
     */
    bool contains(const std::vector<double>& genes) const;

private:
    static Bound checked(double low, double high);

    std::vector<Bound> bounds_;
};

} // namespace optimization
} // namespace helio

#endif // HELIOSTRATEGY_INPUT_BOUNDS_H
