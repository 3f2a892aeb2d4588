/**
 * Merkle Forest Optimizer Implementation
 */

#include "optimizer.hpp"
#include "utils.hpp"
#include <stdexcept>
#include <string>

namespace hbscost {

void validate_config(const OptimizerConfig& config) {
    if (config.height_alphabet.empty()) {
        throw std::invalid_argument("Height alphabet must not be empty");
    }
    for (int height : config.height_alphabet) {
        (void)pow2(height, "Tree height");
    }
    if (config.min_trees == 0) {
        throw std::invalid_argument("Forests must contain at least one tree");
    }
    if (config.min_trees > config.max_trees) {
        throw std::invalid_argument("Minimum tree count exceeds the maximum");
    }
    if (config.scenarios.empty()) {
        throw std::invalid_argument("At least one failure-rate scenario is required");
    }
    for (double f : config.scenarios) {
        if (!(f >= 0.0 && f <= 1.0)) {
            throw std::invalid_argument("Failure rate must lie in [0, 1]");
        }
    }
}

double forest_cost(const ForestModel& model, std::span<const int> forest,
                   std::span<const double> scenarios, uint64_t min_signatures) {
    if (scenarios.empty()) {
        throw std::invalid_argument("At least one failure-rate scenario is required");
    }
    if (forest_capacity(forest) < min_signatures) {
        return INFEASIBLE_COST;
    }
    double total = 0.0;
    for (double f : scenarios) {
        total += evaluate_forest(model, forest, f).avg_size;
    }
    return total / static_cast<double>(scenarios.size());
}

size_t search_space_size(const OptimizerConfig& config) {
    const size_t n = config.height_alphabet.size();
    size_t total = 0;
    for (size_t r = config.min_trees; r <= config.max_trees; ++r) {
        // C(n + r - 1, r), built incrementally so every step divides exactly
        uint64_t count = 1;
        for (size_t k = 1; k <= r; ++k) {
            count = checked_mul(count, n + k - 1) / k;
        }
        total = checked_add(total, count);
    }
    return total;
}

void for_each_candidate(const OptimizerConfig& config,
                        const std::function<void(std::span<const int>)>& visit) {
    const size_t n = config.height_alphabet.size();
    for (size_t r = config.min_trees; r <= config.max_trees; ++r) {
        std::vector<size_t> indices(r, 0);
        std::vector<int> forest(r, config.height_alphabet[0]);
        while (true) {
            visit(forest);

            // Rightmost position that can still advance
            size_t pos = r;
            while (pos > 0 && indices[pos - 1] == n - 1) {
                --pos;
            }
            if (pos == 0) break;

            size_t next = indices[pos - 1] + 1;
            for (size_t i = pos - 1; i < r; ++i) {
                indices[i] = next;
                forest[i] = config.height_alphabet[next];
            }
        }
    }
}

OptimizationResult optimize_forest(const ForestModel& model,
                                   const OptimizerConfig& config) {
    validate_config(config);

    OptimizationResult result{{}, INFEASIBLE_COST, 0, 0};
    for_each_candidate(config, [&](std::span<const int> forest) {
        ++result.candidates_evaluated;
        double cost = forest_cost(model, forest, config.scenarios,
                                  config.min_signatures);
        if (cost == INFEASIBLE_COST) {
            return;
        }
        ++result.feasible_candidates;
        if (cost < result.cost) {
            result.cost = cost;
            result.forest.assign(forest.begin(), forest.end());
        }
    });

    if (result.feasible_candidates == 0) {
        throw std::runtime_error("No forest in the search space reaches " +
                                 std::to_string(config.min_signatures) +
                                 " signatures");
    }
    return result;
}

} // namespace hbscost
