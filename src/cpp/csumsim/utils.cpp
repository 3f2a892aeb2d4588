/**
 * Checksum simulation utility functions implementation
 * Uses OpenSSL as the entropy source
 */

#include "utils.hpp"
#include <openssl/rand.h>
#include <algorithm>
#include <stdexcept>

namespace csumsim {

double median(std::span<const double> values) {
    if (values.empty()) {
        throw std::invalid_argument("Median of an empty sequence");
    }
    std::vector<double> sorted(values.begin(), values.end());
    std::sort(sorted.begin(), sorted.end());
    size_t mid = sorted.size() / 2;
    if (sorted.size() % 2 == 1) {
        return sorted[mid];
    }
    return (sorted[mid - 1] + sorted[mid]) / 2.0;
}

std::vector<uint8_t> random_bytes(size_t n) {
    std::vector<uint8_t> buffer(n);
    if (RAND_bytes(buffer.data(), static_cast<int>(n)) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }
    return buffer;
}

uint64_t random_seed() {
    auto bytes = random_bytes(8);
    uint64_t seed = 0;
    for (auto b : bytes) {
        seed = (seed << 8) | b;
    }
    return seed;
}

} // namespace csumsim
