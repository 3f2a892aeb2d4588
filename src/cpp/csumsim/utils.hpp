/**
 * Utility functions for the checksum simulation
 */

#ifndef CSUMSIM_UTILS_HPP
#define CSUMSIM_UTILS_HPP

#include <cstdint>
#include <cstddef>
#include <vector>
#include <span>

namespace csumsim {

/**
 * Sum of the decimal digits of x
 */
[[nodiscard]] constexpr uint32_t decimal_digit_sum(uint64_t x) noexcept {
    uint32_t sum = 0;
    while (x > 0) {
        sum += static_cast<uint32_t>(x % 10);
        x /= 10;
    }
    return sum;
}

/**
 * Median of a sequence (mean of the two middle values for even sizes)
 */
[[nodiscard]] double median(std::span<const double> values);

/**
 * Generate cryptographically secure random bytes
 * (Implementation in utils.cpp)
 */
[[nodiscard]] std::vector<uint8_t> random_bytes(size_t n);

/**
 * Fresh 64-bit seed for runs that are not reproduced
 */
[[nodiscard]] uint64_t random_seed();

} // namespace csumsim

#endif // CSUMSIM_UTILS_HPP
