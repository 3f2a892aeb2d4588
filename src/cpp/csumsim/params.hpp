/**
 * Checksum Constructions
 *
 * A message digest is split into digits. Digit i (0-based) picks one of
 * 2^digit_bits buckets at random, and the bucket accumulates a contribution
 * derived from i, reduced modulo the checksum space after every step.
 */

#ifndef CSUMSIM_PARAMS_HPP
#define CSUMSIM_PARAMS_HPP

#include <cstdint>
#include <cstddef>
#include <string_view>
#include <array>

namespace csumsim {

/**
 * What a digit contributes to its bucket
 */
enum class Contribution {
    DigitSum,   // Sum of the decimal digits of i + 1
    RawValue    // i itself
};

/**
 * Checksum variant
 */
struct ChecksumVariant {
    std::string_view name;
    Contribution contribution;
    uint32_t modulus;             // Size of the checksum space
    size_t message_bits;          // Digest length in bits
    size_t digit_bits;            // Bits per digit, log2 of the bucket count
    bool randomize_empty_buckets; // A bucket without draws gets a random residue

    [[nodiscard]] constexpr size_t buckets() const noexcept {
        return size_t{1} << digit_bits;
    }

    [[nodiscard]] constexpr size_t draws() const noexcept {
        return message_bits / digit_bits;
    }

    [[nodiscard]] constexpr double expected_probability() const noexcept {
        return 1.0 / static_cast<double>(modulus);
    }
};

inline constexpr ChecksumVariant DIGIT_SUM_MOD128 = {
    .name = "Sum digits",
    .contribution = Contribution::DigitSum, .modulus = 128,
    .message_bits = 512, .digit_bits = 4,
    .randomize_empty_buckets = false
};

inline constexpr ChecksumVariant RAW_VALUE_MOD128 = {
    .name = "Sum numbers (m=512, mod 128)",
    .contribution = Contribution::RawValue, .modulus = 128,
    .message_bits = 512, .digit_bits = 4,
    .randomize_empty_buckets = false
};

// Empty buckets would otherwise inflate the probability of residue 0
inline constexpr ChecksumVariant RAW_VALUE_MOD256 = {
    .name = "Sum numbers (m=512, mod 256)",
    .contribution = Contribution::RawValue, .modulus = 256,
    .message_bits = 512, .digit_bits = 4,
    .randomize_empty_buckets = true
};

inline constexpr std::array<const ChecksumVariant*, 3> ALL_VARIANTS = {
    &DIGIT_SUM_MOD128, &RAW_VALUE_MOD128, &RAW_VALUE_MOD256
};

} // namespace csumsim

#endif // CSUMSIM_PARAMS_HPP
