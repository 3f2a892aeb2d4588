/**
 * Merkle Forest Probability and Cost Model
 *
 * A forest is an ordered sequence of Merkle trees used one after the other.
 * Every failed signing attempt consumes a leaf, so under a failure rate f the
 * leaf index a signature lands on is geometrically distributed. The model
 * turns that distribution into expected signature sizes and signing times.
 */

#ifndef HBSCOST_FOREST_HPP
#define HBSCOST_FOREST_HPP

#include "params.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace hbscost {

using Forest = std::vector<int>;

/**
 * Forest metrics under one failure rate.
 * Sizes are in bytes, the signing time in one-time signature operations.
 */
struct ForestCostMetrics {
    uint64_t signatures;
    double min_size;
    double avg_size;
    double max_size;
    double avg_sign_time;
    std::vector<double> probabilities;   // Landing probability per tree
};

/**
 * Authentication cost of the tree at a 0-based position: its path plus the
 * chain signatures certifying every tree up to and including it
 */
[[nodiscard]] constexpr int tree_cost(int height, size_t position) noexcept {
    return height + static_cast<int>(position) + 1;
}

/**
 * Total number of leaves of the forest
 *
 * @throws std::invalid_argument on an empty forest or an invalid height
 */
[[nodiscard]] uint64_t forest_capacity(std::span<const int> forest);

/**
 * Probability that a signature lands in each tree.
 *
 * Tree i covers the leaf indices [start_i, start_i + 2^h_i) and receives
 * sum (1 - f) f^e over that range. The tail beyond the last leaf is
 * credited to the last tree, so the probabilities always sum to 1.
 */
[[nodiscard]] std::vector<double> landing_probabilities(
    std::span<const int> forest, double failure_rate);

/**
 * Evaluate a forest under a failure rate.
 *
 * @throws std::invalid_argument if the forest is empty, contains an invalid
 *         height or the failure rate lies outside [0, 1]
 */
[[nodiscard]] ForestCostMetrics evaluate_forest(
    const ForestModel& model, std::span<const int> forest, double failure_rate);

/**
 * Shallow-deep split tree under a failure rate.
 *
 * The shallow tree's leaves are published one public key at a time; the deep
 * tree is only reached once every shallow leaf failed.
 */
struct ShallowDeepMetrics {
    uint64_t signatures;
    double deep_chance;        // Probability of falling through to the deep tree
    double shallow_pubs;       // Expected number of shallow public keys sent
    double auth_path;          // Expected deep authentication path length
    double min_size;
    double avg_size;
    double max_size;
    double avg_sign_time;
};

/**
 * @param cached_layers Deep tree layers cached by the authenticator
 * @throws std::invalid_argument on invalid heights, a cached layer count
 *         above the deep height or a failure rate outside [0, 1]
 */
[[nodiscard]] ShallowDeepMetrics evaluate_shallow_deep(
    const ForestModel& model, int shallow, int deep, double failure_rate,
    int cached_layers = 0);

struct SweepPoint {
    double failure_rate;
    double avg_sign_time;
    double avg_size;
};

/**
 * Evaluate the shallow-deep model at failure rates i / steps, i in [0, steps)
 */
[[nodiscard]] std::vector<SweepPoint> sweep_shallow_deep(
    const ForestModel& model, int shallow, int deep, int cached_layers,
    size_t steps);

/**
 * Expected signature size without any tree: one-time signature on success,
 * the fallback asymmetric signature on failure
 */
[[nodiscard]] double hybrid_fallback_size(const ForestModel& model, double failure_rate);

/**
 * Dash separated heights, e.g. "0-1-2-3-7"
 */
[[nodiscard]] std::string forest_name(std::span<const int> forest);

/**
 * Parse a dash separated forest name
 *
 * @throws std::invalid_argument on malformed input
 */
[[nodiscard]] Forest parse_forest(const std::string& name);

/**
 * Forests tabulated in the forest comparison
 */
[[nodiscard]] std::vector<Forest> reference_forests();

} // namespace hbscost

#endif // HBSCOST_FOREST_HPP
