/**
 * Monte-Carlo Checksum Collision Estimator
 *
 * Estimates the residue distribution of a bucketed checksum construction by
 * simulation and derives the worst-case security level it leaves, assuming
 * the buckets are independent.
 */

#ifndef CSUMSIM_ESTIMATOR_HPP
#define CSUMSIM_ESTIMATOR_HPP

#include "params.hpp"
#include <cstdint>
#include <cstddef>
#include <optional>
#include <random>
#include <string_view>
#include <vector>

namespace csumsim {

/**
 * Largest deviation of the total probability mass from 1 a reliable run
 * may show
 */
inline constexpr double MASS_TOLERANCE = 1e-9;

struct ChecksumCollisionEstimate {
    std::string_view variant;
    uint64_t trials;
    uint64_t seed;
    std::vector<double> probabilities;   // Indexed by residue
    double expected_probability;         // Uniform: 1 / modulus
    double max_probability;
    size_t max_position;                 // First residue with max_probability
    double median_probability;
    double total_mass;
    double wc_security_level;            // -log2(max_probability^buckets)
    double max_security_level;           // log2(modulus^buckets)
    bool reliable;
};

/**
 * Accumulates trials of one checksum variant.
 *
 * The generator is seeded explicitly; two simulators with the same variant
 * and seed produce identical histograms.
 */
class ChecksumSimulator {
public:
    /**
     * @throws std::invalid_argument if the variant cannot be simulated
     */
    ChecksumSimulator(const ChecksumVariant& variant, uint64_t seed);

    /**
     * Simulate more trials
     */
    void run(uint64_t trials);

    [[nodiscard]] const ChecksumVariant& variant() const noexcept { return variant_; }
    [[nodiscard]] uint64_t seed() const noexcept { return seed_; }
    [[nodiscard]] uint64_t trials() const noexcept { return trials_; }

    /**
     * Bucket observations per residue
     */
    [[nodiscard]] const std::vector<uint64_t>& histogram() const noexcept {
        return histogram_;
    }

    /**
     * @throws std::logic_error if no trial has been run
     */
    [[nodiscard]] ChecksumCollisionEstimate estimate() const;

private:
    void run_trial();
    uint32_t next_bucket();

    ChecksumVariant variant_;
    uint64_t seed_;
    uint64_t trials_ = 0;
    std::mt19937_64 rng_;
    std::uniform_int_distribution<uint32_t> residue_dist_;
    std::vector<uint32_t> contributions_;   // Per digit position, reduced
    std::vector<uint32_t> sums_;
    std::vector<uint32_t> counts_;
    std::vector<uint64_t> histogram_;
    uint64_t word_ = 0;
    size_t word_bits_ = 0;
};

/**
 * Run one simulation of a fixed trial count.
 *
 * @param seed Seed of the generator; drawn from the system entropy source
 *             when absent
 * @throws std::invalid_argument on an invalid variant or zero trials
 */
[[nodiscard]] ChecksumCollisionEstimate estimate_checksum_collision(
    const ChecksumVariant& variant, uint64_t trials,
    std::optional<uint64_t> seed = std::nullopt);

} // namespace csumsim

#endif // CSUMSIM_ESTIMATOR_HPP
