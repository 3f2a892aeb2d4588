/**
 * Merkle Forest Probability and Cost Model Implementation
 */

#include "forest.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace hbscost {

namespace {

// The shallow tree's leaf sum is evaluated term by term
constexpr int MAX_SHALLOW_HEIGHT = 20;

void check_failure_rate(double failure_rate) {
    // Also rejects NaN
    if (!(failure_rate >= 0.0 && failure_rate <= 1.0)) {
        throw std::invalid_argument("Failure rate must lie in [0, 1]");
    }
}

} // anonymous namespace

uint64_t forest_capacity(std::span<const int> forest) {
    if (forest.empty()) {
        throw std::invalid_argument("Forest must contain at least one tree");
    }
    uint64_t capacity = 0;
    for (int height : forest) {
        capacity = checked_add(capacity, pow2(height, "Tree height"));
    }
    return capacity;
}

std::vector<double> landing_probabilities(std::span<const int> forest,
                                          double failure_rate) {
    check_failure_rate(failure_rate);
    (void)forest_capacity(forest);

    std::vector<double> probs(forest.size(), 0.0);
    uint64_t index = 0;
    for (size_t tree = 0; tree < forest.size(); ++tree) {
        uint64_t end = index + (uint64_t{1} << forest[tree]);
        // sum_{e=index}^{end-1} (1-f) f^e telescopes to f^index - f^end
        probs[tree] = std::pow(failure_rate, static_cast<double>(index)) -
                      std::pow(failure_rate, static_cast<double>(end));
        index = end;
    }
    // Every leaf failed: the last tree signs with its final leaf
    probs.back() += std::pow(failure_rate, static_cast<double>(index));
    return probs;
}

ForestCostMetrics evaluate_forest(const ForestModel& model,
                                  std::span<const int> forest,
                                  double failure_rate) {
    ForestCostMetrics metrics;
    metrics.signatures = forest_capacity(forest);
    metrics.probabilities = landing_probabilities(forest, failure_rate);

    int min_cost = tree_cost(forest[0], 0);
    int max_cost = min_cost;
    double avg_cost = 0.0;
    double avg_time = 0.0;
    for (size_t i = 0; i < forest.size(); ++i) {
        int cost = tree_cost(forest[i], i);
        min_cost = std::min(min_cost, cost);
        max_cost = std::max(max_cost, cost);
        avg_cost += cost * metrics.probabilities[i];
        avg_time += std::ldexp(metrics.probabilities[i], forest[i]);
    }

    metrics.min_size = model.ots_size + min_cost * model.hash_size;
    metrics.avg_size = model.ots_size + avg_cost * model.hash_size;
    metrics.max_size = model.ots_size + max_cost * model.hash_size;
    metrics.avg_sign_time = avg_time;
    return metrics;
}

ShallowDeepMetrics evaluate_shallow_deep(const ForestModel& model,
                                         int shallow, int deep,
                                         double failure_rate,
                                         int cached_layers) {
    check_failure_rate(failure_rate);
    if (shallow > MAX_SHALLOW_HEIGHT) {
        throw std::invalid_argument("Shallow tree height must not exceed " +
                                    std::to_string(MAX_SHALLOW_HEIGHT));
    }
    const uint64_t shallow_leaves = pow2(shallow, "Shallow tree height");
    const uint64_t deep_leaves = pow2(deep, "Deep tree height");
    if (cached_layers < 0 || cached_layers > deep) {
        throw std::invalid_argument("Cached layers must lie in [0, deep height]");
    }

    const double f = failure_rate;
    const double deep_chance = std::pow(f, static_cast<double>(shallow_leaves));

    double shallow_pubs = deep_chance * static_cast<double>(shallow_leaves);
    if (deep_chance < 1.0) {
        double f_e = 1.0;
        for (uint64_t e = 0; e < shallow_leaves && f_e > 0.0; ++e) {
            shallow_pubs += static_cast<double>(e) * (1.0 - f) * f_e / (1.0 - deep_chance);
            f_e *= f;
        }
    }
    const double auth_path = deep_chance * deep;

    ShallowDeepMetrics metrics;
    metrics.signatures = checked_add(shallow_leaves, deep_leaves);
    metrics.deep_chance = deep_chance;
    metrics.shallow_pubs = shallow_pubs;
    metrics.auth_path = auth_path;
    metrics.min_size = model.ots_size + 1 * model.hash_size;
    metrics.avg_size = model.ots_size + (1 + shallow_pubs + auth_path) * model.hash_size;
    metrics.max_size = model.ots_size +
        (1 + static_cast<double>(shallow_leaves) + deep) * model.hash_size;
    metrics.avg_sign_time = 1 + deep_chance * std::ldexp(1.0, deep - cached_layers);
    return metrics;
}

std::vector<SweepPoint> sweep_shallow_deep(const ForestModel& model,
                                           int shallow, int deep,
                                           int cached_layers, size_t steps) {
    if (steps == 0) {
        throw std::invalid_argument("Sweep needs at least one step");
    }
    std::vector<SweepPoint> points;
    points.reserve(steps);
    for (size_t i = 0; i < steps; ++i) {
        double f = static_cast<double>(i) / static_cast<double>(steps);
        auto m = evaluate_shallow_deep(model, shallow, deep, f, cached_layers);
        points.push_back({f, m.avg_sign_time, m.avg_size});
    }
    return points;
}

double hybrid_fallback_size(const ForestModel& model, double failure_rate) {
    check_failure_rate(failure_rate);
    return (1 - failure_rate) * model.ots_size + failure_rate * model.fallback_size;
}

std::string forest_name(std::span<const int> forest) {
    std::string name;
    for (size_t i = 0; i < forest.size(); ++i) {
        if (i > 0) name += "-";
        name += std::to_string(forest[i]);
    }
    return name;
}

Forest parse_forest(const std::string& name) {
    Forest forest;
    size_t start = 0;
    while (true) {
        size_t end = name.find('-', start);
        std::string part = name.substr(start, end == std::string::npos ? end : end - start);
        if (part.empty() || part.size() > 2 ||
            !std::all_of(part.begin(), part.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            throw std::invalid_argument("Malformed forest: '" + name + "'");
        }
        forest.push_back(std::stoi(part));
        if (end == std::string::npos) break;
        start = end + 1;
    }
    (void)forest_capacity(forest);
    return forest;
}

std::vector<Forest> reference_forests() {
    return {
        {0, 1, 2, 3, 7},
        {2, 7},
        {0, 0, 0, 0, 0, 0, 0, 0, 7},
        {0, 0, 0, 0, 7},
        {0, 0, 0, 7},
        {0, 0, 7},
        {0, 0, 0, 0, 5, 5, 5, 5},
        {0, 1, 2, 3, 4, 5, 6},
        {0, 1, 2, 7},
        {0, 1, 7},
        {0, 2, 7},
        {0, 3, 7},
        {1, 2, 7},
        {1, 3, 7},
        {2, 3, 7},
        {3, 3, 7},
        {0, 3, 3, 7},
        {0, 7},
        {1, 7},
        {2, 7},
        {3, 7},
    };
}

} // namespace hbscost
