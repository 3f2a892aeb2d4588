/**
 * Monte-Carlo Checksum Collision Estimator Implementation
 */

#include "estimator.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>
#include <stdexcept>

namespace csumsim {

namespace {

void validate_variant(const ChecksumVariant& variant) {
    if (variant.modulus == 0 || variant.modulus > (1u << 20)) {
        throw std::invalid_argument("Checksum modulus must lie in [1, 2^20]");
    }
    if (variant.digit_bits == 0 || variant.digit_bits > 16) {
        throw std::invalid_argument("Digit width must lie in [1, 16] bits");
    }
    if (variant.draws() == 0) {
        throw std::invalid_argument("Message must hold at least one digit");
    }
}

} // anonymous namespace

ChecksumSimulator::ChecksumSimulator(const ChecksumVariant& variant, uint64_t seed)
    : variant_(variant), seed_(seed), rng_(seed) {

    validate_variant(variant_);
    residue_dist_ = std::uniform_int_distribution<uint32_t>(0, variant_.modulus - 1);

    contributions_.resize(variant_.draws());
    for (size_t i = 0; i < contributions_.size(); ++i) {
        uint64_t value = variant_.contribution == Contribution::DigitSum
            ? decimal_digit_sum(i + 1)
            : i;
        contributions_[i] = static_cast<uint32_t>(value % variant_.modulus);
    }

    sums_.resize(variant_.buckets());
    counts_.resize(variant_.buckets());
    histogram_.assign(variant_.modulus, 0);
}

uint32_t ChecksumSimulator::next_bucket() {
    // Digits are taken from the low end of 64-bit generator words
    if (word_bits_ < variant_.digit_bits) {
        word_ = rng_();
        word_bits_ = 64;
    }
    uint32_t bucket = static_cast<uint32_t>(word_ & (variant_.buckets() - 1));
    word_ >>= variant_.digit_bits;
    word_bits_ -= variant_.digit_bits;
    return bucket;
}

void ChecksumSimulator::run_trial() {
    std::fill(sums_.begin(), sums_.end(), 0);
    std::fill(counts_.begin(), counts_.end(), 0);

    const uint32_t modulus = variant_.modulus;
    for (uint32_t contribution : contributions_) {
        uint32_t bucket = next_bucket();
        sums_[bucket] = static_cast<uint32_t>(
            (static_cast<uint64_t>(sums_[bucket]) + contribution) % modulus);
        ++counts_[bucket];
    }

    for (size_t bucket = 0; bucket < sums_.size(); ++bucket) {
        if (variant_.randomize_empty_buckets && counts_[bucket] == 0) {
            sums_[bucket] = residue_dist_(rng_);
        }
        ++histogram_[sums_[bucket]];
    }
}

void ChecksumSimulator::run(uint64_t trials) {
    for (uint64_t t = 0; t < trials; ++t) {
        run_trial();
    }
    trials_ += trials;
}

ChecksumCollisionEstimate ChecksumSimulator::estimate() const {
    if (trials_ == 0) {
        throw std::logic_error("No trials have been simulated");
    }

    const size_t buckets = variant_.buckets();
    const double observations = static_cast<double>(trials_) * static_cast<double>(buckets);

    ChecksumCollisionEstimate est;
    est.variant = variant_.name;
    est.trials = trials_;
    est.seed = seed_;
    est.probabilities.resize(histogram_.size());
    for (size_t r = 0; r < histogram_.size(); ++r) {
        est.probabilities[r] = static_cast<double>(histogram_[r]) / observations;
    }

    auto max_it = std::max_element(est.probabilities.begin(), est.probabilities.end());
    est.expected_probability = variant_.expected_probability();
    est.max_probability = *max_it;
    est.max_position = static_cast<size_t>(std::distance(est.probabilities.begin(), max_it));
    est.median_probability = median(est.probabilities);
    est.total_mass = std::accumulate(est.probabilities.begin(), est.probabilities.end(), 0.0);

    est.wc_security_level = -static_cast<double>(buckets) * std::log2(est.max_probability);
    est.max_security_level = static_cast<double>(buckets) *
                             std::log2(static_cast<double>(variant_.modulus));

    // Fewer observations than residues cannot resolve the distribution
    est.reliable = std::abs(est.total_mass - 1.0) <= MASS_TOLERANCE &&
                   observations >= static_cast<double>(variant_.modulus);
    return est;
}

ChecksumCollisionEstimate estimate_checksum_collision(
    const ChecksumVariant& variant, uint64_t trials, std::optional<uint64_t> seed) {

    if (trials == 0) {
        throw std::invalid_argument("At least one trial is required");
    }
    ChecksumSimulator simulator(variant, seed.has_value() ? *seed : random_seed());
    simulator.run(trials);
    return simulator.estimate();
}

} // namespace csumsim
