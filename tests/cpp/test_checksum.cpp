/**
 * Checksum Collision Estimator Test Suite
 */

#include "csumsim/estimator.hpp"
#include "csumsim/utils.hpp"
#include <iostream>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

using namespace csumsim;

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

#define ASSERT_FALSE(cond) \
    if (cond) throw std::runtime_error("Assertion failed: NOT " #cond)

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

// Largest relative deviation of any residue from the uniform probability
double max_deviation(const ChecksumCollisionEstimate& est) {
    double worst = 0.0;
    for (double p : est.probabilities) {
        worst = std::max(worst, std::abs(p - est.expected_probability) / est.expected_probability);
    }
    return worst;
}

void test_utils() {
    TEST("decimal digit sum") {
        ASSERT_EQ(decimal_digit_sum(0), 0u);
        ASSERT_EQ(decimal_digit_sum(7), 7u);
        ASSERT_EQ(decimal_digit_sum(128), 11u);
        ASSERT_EQ(decimal_digit_sum(99), 18u);
    TEST_END

    TEST("median of odd and even sequences") {
        std::vector<double> odd = {3.0, 1.0, 2.0};
        std::vector<double> even = {4.0, 1.0, 3.0, 2.0};
        ASSERT_EQ(median(odd), 2.0);
        ASSERT_EQ(median(even), 2.5);
        std::vector<double> empty;
        ASSERT_THROWS(median(empty), std::invalid_argument);
    TEST_END

    TEST("random bytes and seeds") {
        ASSERT_EQ(random_bytes(32).size(), 32u);
        ASSERT_TRUE(random_bytes(0).empty());
        std::vector<uint64_t> seeds;
        for (int i = 0; i < 4; ++i) {
            seeds.push_back(random_seed());
        }
        std::sort(seeds.begin(), seeds.end());
        ASSERT_TRUE(std::adjacent_find(seeds.begin(), seeds.end()) == seeds.end());
    TEST_END
}

void test_variants() {
    TEST("preset geometry") {
        for (const auto* v : ALL_VARIANTS) {
            ASSERT_EQ(v->buckets(), 16u);
            ASSERT_EQ(v->draws(), 128u);
        }
        ASSERT_EQ(RAW_VALUE_MOD256.modulus, 256u);
        ASSERT_NEAR(RAW_VALUE_MOD128.expected_probability(), 1.0 / 128, 1e-15);
    TEST_END

    TEST("invalid variants are rejected") {
        auto v = RAW_VALUE_MOD128;
        v.modulus = 0;
        ASSERT_THROWS(ChecksumSimulator(v, 1), std::invalid_argument);

        v = RAW_VALUE_MOD128;
        v.digit_bits = 0;
        ASSERT_THROWS(ChecksumSimulator(v, 1), std::invalid_argument);

        v = RAW_VALUE_MOD128;
        v.digit_bits = 17;
        ASSERT_THROWS(ChecksumSimulator(v, 1), std::invalid_argument);

        v = RAW_VALUE_MOD128;
        v.message_bits = 2;
        ASSERT_THROWS(ChecksumSimulator(v, 1), std::invalid_argument);

        ASSERT_THROWS(estimate_checksum_collision(RAW_VALUE_MOD128, 0, 1), std::invalid_argument);
    TEST_END
}

void test_simulator() {
    TEST("estimate before any trial is an error") {
        ChecksumSimulator sim(RAW_VALUE_MOD128, 42);
        ASSERT_THROWS(sim.estimate(), std::logic_error);
    TEST_END

    TEST("same seed reproduces the histogram") {
        ChecksumSimulator a(DIGIT_SUM_MOD128, 2024);
        ChecksumSimulator b(DIGIT_SUM_MOD128, 2024);
        a.run(1000);
        b.run(1000);
        ASSERT_TRUE(a.histogram() == b.histogram());

        ChecksumSimulator c(DIGIT_SUM_MOD128, 2025);
        c.run(1000);
        ASSERT_TRUE(a.histogram() != c.histogram());
    TEST_END

    TEST("runs accumulate") {
        ChecksumSimulator once(RAW_VALUE_MOD256, 7);
        ChecksumSimulator twice(RAW_VALUE_MOD256, 7);
        once.run(1000);
        twice.run(400);
        twice.run(600);
        ASSERT_EQ(twice.trials(), 1000u);
        ASSERT_TRUE(once.histogram() == twice.histogram());
    TEST_END

    TEST("every bucket lands on one residue per trial") {
        ChecksumSimulator sim(RAW_VALUE_MOD128, 99);
        sim.run(500);
        uint64_t total = 0;
        for (uint64_t count : sim.histogram()) {
            total += count;
        }
        ASSERT_EQ(total, 500u * 16u);

        auto est = sim.estimate();
        ASSERT_EQ(est.probabilities.size(), 128u);
        ASSERT_NEAR(est.total_mass, 1.0, MASS_TOLERANCE);
        ASSERT_TRUE(est.reliable);
        ASSERT_EQ(est.trials, 500u);
        ASSERT_EQ(est.seed, 99u);
    TEST_END

    TEST("too few observations are unreliable") {
        auto est = estimate_checksum_collision(RAW_VALUE_MOD256, 1, 5);
        ASSERT_NEAR(est.total_mass, 1.0, MASS_TOLERANCE);
        ASSERT_FALSE(est.reliable);
    TEST_END

    TEST("single residue checksum always collides") {
        auto v = RAW_VALUE_MOD128;
        v.modulus = 1;
        auto est = estimate_checksum_collision(v, 10, 3);
        ASSERT_EQ(est.max_probability, 1.0);
        ASSERT_EQ(est.max_position, 0u);
        ASSERT_EQ(est.wc_security_level, 0.0);
        ASSERT_EQ(est.max_security_level, 0.0);
    TEST_END
}

void test_distribution() {
    TEST("raw values mod 256 converge to uniform") {
        auto est = estimate_checksum_collision(RAW_VALUE_MOD256, 1'000'000, 11);
        ASSERT_TRUE(est.reliable);
        ASSERT_TRUE(max_deviation(est) < 0.05);
        ASSERT_NEAR(est.max_security_level, 128.0, 1e-9);
        ASSERT_TRUE(est.wc_security_level < est.max_security_level);
        ASSERT_TRUE(est.wc_security_level > 127.0);
    TEST_END

    TEST("raw values mod 128 stay close to uniform") {
        auto est = estimate_checksum_collision(RAW_VALUE_MOD128, 1'000'000, 12);
        ASSERT_TRUE(max_deviation(est) < 0.05);
        ASSERT_NEAR(est.median_probability, 1.0 / 128, 0.05 / 128);
        // Empty buckets keep residue 0
        ASSERT_EQ(est.max_position, 0u);
    TEST_END

    TEST("more trials shrink the deviation") {
        auto coarse = estimate_checksum_collision(RAW_VALUE_MOD256, 10'000, 21);
        auto fine = estimate_checksum_collision(RAW_VALUE_MOD256, 1'000'000, 21);
        ASSERT_TRUE(max_deviation(fine) < max_deviation(coarse));
    TEST_END

    TEST("digit sums are far from uniform") {
        auto est = estimate_checksum_collision(DIGIT_SUM_MOD128, 100'000, 31);
        ASSERT_TRUE(est.max_probability > 1.5 / 128);
        ASSERT_NEAR(est.max_security_level, 112.0, 1e-9);
        ASSERT_TRUE(est.wc_security_level < 100.0);
    TEST_END
}

int main() {
    std::cout << "=== Checksum Collision Estimator Test Suite ===" << std::endl << std::endl;

    test_utils();
    test_variants();
    test_simulator();
    test_distribution();

    std::cout << std::endl << "=== Test Results ===" << std::endl;
    std::cout << "Passed: " << tests_passed << std::endl;
    std::cout << "Failed: " << tests_failed << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
