/**
 * Integer helpers for the cost formulas
 *
 * All operation counts are 64-bit. The helpers below reject inputs whose
 * result would not fit instead of wrapping around.
 */

#ifndef HBSCOST_UTILS_HPP
#define HBSCOST_UTILS_HPP

#include <cstdint>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>

namespace hbscost {

/**
 * Largest tree height whose leaf count (and sums of a few such trees)
 * still fits into 64 bits
 */
inline constexpr int MAX_TREE_HEIGHT = 62;

/**
 * 2^height, rejecting negative or oversized heights
 */
[[nodiscard]] inline uint64_t pow2(int height, const char* what) {
    if (height < 0) {
        throw std::invalid_argument(std::string(what) + " must be non-negative");
    }
    if (height > MAX_TREE_HEIGHT) {
        throw std::invalid_argument(std::string(what) + " must not exceed " +
                                    std::to_string(MAX_TREE_HEIGHT));
    }
    return uint64_t{1} << height;
}

/**
 * a * b, rejecting results that overflow
 */
[[nodiscard]] inline uint64_t checked_mul(uint64_t a, uint64_t b) {
    if (a != 0 && b > std::numeric_limits<uint64_t>::max() / a) {
        throw std::invalid_argument("Operation count overflows 64 bits");
    }
    return a * b;
}

/**
 * a + b, rejecting results that overflow
 */
[[nodiscard]] inline uint64_t checked_add(uint64_t a, uint64_t b) {
    if (b > std::numeric_limits<uint64_t>::max() - a) {
        throw std::invalid_argument("Operation count overflows 64 bits");
    }
    return a + b;
}

/**
 * ceil(log2(x)) for x >= 1
 */
[[nodiscard]] constexpr uint64_t ceil_log2(uint64_t x) noexcept {
    uint64_t bits = 0;
    while (bits < 64 && (uint64_t{1} << bits) < x) {
        ++bits;
    }
    return bits;
}

} // namespace hbscost

#endif // HBSCOST_UTILS_HPP
