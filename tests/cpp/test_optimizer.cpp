/**
 * Merkle Forest Optimizer Test Suite
 */

#include "hbscost/optimizer.hpp"
#include <iostream>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

using namespace hbscost;

// Simple test framework
static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) \
    std::cout << "Testing " << name << "... " << std::flush; \
    try

#define TEST_END \
    std::cout << "PASSED" << std::endl; \
    ++tests_passed; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << std::endl; \
        ++tests_failed; \
    } catch (...) { \
        std::cout << "FAILED: Unknown exception" << std::endl; \
        ++tests_failed; \
    }

#define ASSERT_TRUE(cond) \
    if (!(cond)) throw std::runtime_error("Assertion failed: " #cond)

#define ASSERT_EQ(a, b) \
    if ((a) != (b)) throw std::runtime_error("Assertion failed: " #a " == " #b)

#define ASSERT_NEAR(a, b, tol) \
    if (std::abs((a) - (b)) > (tol)) throw std::runtime_error("Assertion failed: " #a " ~= " #b)

#define ASSERT_THROWS(expr, type) \
    { \
        bool thrown = false; \
        try { (void)(expr); } catch (const type&) { thrown = true; } \
        if (!thrown) throw std::runtime_error("Expected " #type " from " #expr); \
    }

void test_cost_function() {
    const auto& model = FOREST_W64;

    TEST("cost averages the expected size over the scenarios") {
        double cost = forest_cost(model, Forest{0, 0, 0, 2, 7}, DEFAULT_SCENARIOS, 128);
        ASSERT_NEAR(cost, 425.9921804896002, 1e-6);
        ASSERT_NEAR(forest_cost(model, Forest{7}, DEFAULT_SCENARIOS, 128), 533.0, 1e-9);
    TEST_END

    TEST("single scenario reduces to the expected size") {
        std::vector<double> scenario = {0.5};
        double cost = forest_cost(model, Forest{0, 1, 2, 3, 7}, scenario, 128);
        ASSERT_NEAR(cost, 441.25244140625, 1e-9);
    TEST_END

    TEST("forests below the floor are infeasible") {
        ASSERT_EQ(forest_cost(model, Forest{0, 1, 2, 3, 4, 5, 6}, DEFAULT_SCENARIOS, 128),
                  INFEASIBLE_COST);
        ASSERT_TRUE(forest_cost(model, Forest{0, 1, 2, 3, 4, 5, 6}, DEFAULT_SCENARIOS, 127)
                    < INFEASIBLE_COST);
    TEST_END

    TEST("cost rejects empty scenarios") {
        std::vector<double> none;
        ASSERT_THROWS(forest_cost(model, Forest{7}, none, 128), std::invalid_argument);
    TEST_END
}

void test_enumeration() {
    TEST("search space counts multisets") {
        ASSERT_EQ(search_space_size(DEFAULT_OPTIMIZER), 1286u);
        OptimizerConfig config = DEFAULT_OPTIMIZER;
        config.height_alphabet = {0, 1, 2};
        config.min_trees = 2;
        config.max_trees = 2;
        ASSERT_EQ(search_space_size(config), 6u);
    TEST_END

    TEST("candidates are visited in non-decreasing lexicographic order") {
        OptimizerConfig config = DEFAULT_OPTIMIZER;
        config.height_alphabet = {0, 1, 2};
        config.min_trees = 1;
        config.max_trees = 2;

        std::vector<Forest> seen;
        for_each_candidate(config, [&](std::span<const int> forest) {
            seen.emplace_back(forest.begin(), forest.end());
        });

        std::vector<Forest> expected = {
            {0}, {1}, {2},
            {0, 0}, {0, 1}, {0, 2}, {1, 1}, {1, 2}, {2, 2}
        };
        ASSERT_TRUE(seen == expected);
    TEST_END

    TEST("enumeration visits exactly the search space") {
        size_t visited = 0;
        for_each_candidate(DEFAULT_OPTIMIZER, [&](std::span<const int>) { ++visited; });
        ASSERT_EQ(visited, search_space_size(DEFAULT_OPTIMIZER));
    TEST_END
}

void test_optimize() {
    const auto& model = FOREST_W64;

    TEST("default search finds 0-0-0-2-7") {
        auto result = optimize_forest(model, DEFAULT_OPTIMIZER);
        ASSERT_TRUE(result.forest == (Forest{0, 0, 0, 2, 7}));
        ASSERT_NEAR(result.cost, 425.9921804896002, 1e-6);
        ASSERT_EQ(result.candidates_evaluated, 1286u);
        ASSERT_EQ(result.feasible_candidates, 659u);
    TEST_END

    TEST("optimum is no worse than the reference forests") {
        auto result = optimize_forest(model, DEFAULT_OPTIMIZER);
        for (const auto& forest : reference_forests()) {
            if (forest.size() > DEFAULT_OPTIMIZER.max_trees) continue;
            double cost = forest_cost(model, forest, DEFAULT_SCENARIOS, 128);
            ASSERT_TRUE(result.cost <= cost + 1e-9);
        }
    TEST_END

    TEST("search is deterministic") {
        auto a = optimize_forest(model, DEFAULT_OPTIMIZER);
        auto b = optimize_forest(model, DEFAULT_OPTIMIZER);
        ASSERT_TRUE(a.forest == b.forest);
        ASSERT_EQ(a.cost, b.cost);
    TEST_END

    TEST("smaller floors and bounds") {
        OptimizerConfig config = DEFAULT_OPTIMIZER;
        config.max_trees = 3;
        config.min_signatures = 64;
        auto small = optimize_forest(model, config);
        ASSERT_TRUE(small.forest == (Forest{0, 1, 6}));
        ASSERT_NEAR(small.cost, 428.7632192192, 1e-6);
        ASSERT_EQ(small.candidates_evaluated, 164u);
        ASSERT_EQ(small.feasible_candidates, 89u);

        config = DEFAULT_OPTIMIZER;
        config.height_alphabet = {0, 1, 2, 3, 4, 5, 6, 7, 8};
        config.max_trees = 4;
        config.min_signatures = 256;
        auto large = optimize_forest(model, config);
        ASSERT_TRUE(large.forest == (Forest{0, 0, 2, 8}));
        ASSERT_NEAR(large.cost, 426.8276256000224, 1e-6);
        ASSERT_EQ(large.candidates_evaluated, 714u);
    TEST_END

    TEST("ties keep the first candidate") {
        // At f = 0 every forest starting with a single leaf costs the same
        OptimizerConfig config = DEFAULT_OPTIMIZER;
        config.height_alphabet = {0, 7};
        config.min_trees = 2;
        config.max_trees = 3;
        config.scenarios = {0.0};
        auto result = optimize_forest(model, config);
        ASSERT_TRUE(result.forest == (Forest{0, 7}));
        ASSERT_NEAR(result.cost, 421.0, 1e-9);
    TEST_END

    TEST("unreachable floor fails the search") {
        OptimizerConfig config = DEFAULT_OPTIMIZER;
        config.min_signatures = 1000;
        ASSERT_THROWS(optimize_forest(model, config), std::runtime_error);
    TEST_END

    TEST("invalid configurations are rejected") {
        OptimizerConfig config = DEFAULT_OPTIMIZER;
        config.height_alphabet.clear();
        ASSERT_THROWS(optimize_forest(model, config), std::invalid_argument);

        config = DEFAULT_OPTIMIZER;
        config.min_trees = 0;
        ASSERT_THROWS(optimize_forest(model, config), std::invalid_argument);

        config = DEFAULT_OPTIMIZER;
        config.min_trees = 6;
        ASSERT_THROWS(optimize_forest(model, config), std::invalid_argument);

        config = DEFAULT_OPTIMIZER;
        config.scenarios = {0.1, 1.5};
        ASSERT_THROWS(optimize_forest(model, config), std::invalid_argument);

        config = DEFAULT_OPTIMIZER;
        config.height_alphabet = {0, 70};
        ASSERT_THROWS(optimize_forest(model, config), std::invalid_argument);
    TEST_END
}

int main() {
    std::cout << "=== Merkle Forest Optimizer Test Suite ===" << std::endl << std::endl;

    test_cost_function();
    test_enumeration();
    test_optimize();

    std::cout << std::endl << "=== Test Results ===" << std::endl;
    std::cout << "Passed: " << tests_passed << std::endl;
    std::cout << "Failed: " << tests_failed << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
