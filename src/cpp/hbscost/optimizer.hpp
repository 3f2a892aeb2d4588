/**
 * Merkle Forest Cost Function and Exhaustive Optimizer
 *
 * The cost of a forest is its average signature size averaged over a set of
 * failure-rate scenarios. Forests with fewer signatures than the feasibility
 * floor cost +infinity. The optimizer enumerates every multiset of tree
 * heights within the configured bounds and keeps the cheapest forest.
 */

#ifndef HBSCOST_OPTIMIZER_HPP
#define HBSCOST_OPTIMIZER_HPP

#include "params.hpp"
#include "forest.hpp"
#include <cstdint>
#include <cstddef>
#include <functional>
#include <limits>
#include <span>
#include <vector>

namespace hbscost {

inline constexpr double INFEASIBLE_COST = std::numeric_limits<double>::infinity();

/**
 * Bounds of the exhaustive search and the scenarios it is scored against
 */
struct OptimizerConfig {
    std::vector<int> height_alphabet;   // Candidate tree heights, in enumeration order
    size_t min_trees;                   // Smallest multiset size
    size_t max_trees;                   // Largest multiset size
    std::vector<double> scenarios;      // Failure rates, weighted equally
    uint64_t min_signatures;            // Feasibility floor
};

/**
 * Best-case through pessimistic adversarial conditions
 */
inline const std::vector<double> DEFAULT_SCENARIOS = {0.001, 0.01, 0.1, 0.2, 0.5};

inline const OptimizerConfig DEFAULT_OPTIMIZER = {
    .height_alphabet = {0, 1, 2, 3, 4, 5, 6, 7},
    .min_trees = 1,
    .max_trees = 5,
    .scenarios = DEFAULT_SCENARIOS,
    .min_signatures = 128
};

struct OptimizationResult {
    Forest forest;
    double cost;
    size_t candidates_evaluated;
    size_t feasible_candidates;
};

/**
 * Reject configurations the search cannot run with
 */
void validate_config(const OptimizerConfig& config);

/**
 * Average signature size over the scenarios, or INFEASIBLE_COST if the
 * forest holds fewer than min_signatures signatures
 */
[[nodiscard]] double forest_cost(const ForestModel& model,
                                 std::span<const int> forest,
                                 std::span<const double> scenarios,
                                 uint64_t min_signatures);

/**
 * Number of multisets the search visits: sum over r of C(n + r - 1, r)
 */
[[nodiscard]] size_t search_space_size(const OptimizerConfig& config);

/**
 * Visit every multiset of the alphabet with min_trees..max_trees elements.
 * Multisets are produced by size, then lexicographically by alphabet
 * position, each as a non-decreasing (by position) sequence.
 */
void for_each_candidate(const OptimizerConfig& config,
                        const std::function<void(std::span<const int>)>& visit);

/**
 * Exhaustive search for the cheapest forest. The first candidate wins ties.
 *
 * @throws std::invalid_argument on an invalid configuration
 * @throws std::runtime_error if no candidate reaches the feasibility floor
 */
[[nodiscard]] OptimizationResult optimize_forest(const ForestModel& model,
                                                 const OptimizerConfig& config);

} // namespace hbscost

#endif // HBSCOST_OPTIMIZER_HPP
