/**
 * Scheme Constants and Model Presets
 *
 * Defines the global constants shared by every cost calculator and the
 * forest model, together with the named configurations used in the
 * analysis.
 */

#ifndef HBSCOST_PARAMS_HPP
#define HBSCOST_PARAMS_HPP

#include <cstdint>
#include <cstddef>
#include <string_view>
#include <array>

namespace hbscost {

/**
 * Hash rates (SHA-256 calls per second) of the modelled devices
 */
inline constexpr double HASHRATE_NRF52840_SOFTWARE = 7407.0;
inline constexpr double HASHRATE_NRF52840_CRYPTOCELL = 7407.0 * 46;
inline constexpr double HASHRATE_LAPTOP = 10'989'000.0;

/**
 * Global constants of the hash-chain schemes
 */
struct SchemeConstants {
    std::string_view name;
    uint64_t n;              // Hash output size in bytes
    uint64_t w;              // Chain width (Winternitz parameter)
    uint64_t m;              // Message digest size in bytes
    uint64_t l1;             // Chains covering the message digest
    uint64_t l2;             // Checksum chains
    double hash_rate;        // Hash calls per second
    uint64_t external_pk_size;   // Public key of the certified asymmetric scheme
    uint64_t external_sig_size;  // Signature of the certified asymmetric scheme

    [[nodiscard]] constexpr uint64_t l() const noexcept {
        return l1 + l2;
    }

    [[nodiscard]] constexpr double seconds(uint64_t hash_calls) const noexcept {
        return static_cast<double>(hash_calls) / hash_rate;
    }
};

/**
 * 128-bit hashes, w = 16: two chains per digest byte plus three checksum
 * chains (L = 35), timed on the hardware-accelerated microcontroller.
 */
inline constexpr SchemeConstants WOTS_N16_W16 = {
    .name = "WOTS-N16-W16",
    .n = 16, .w = 16, .m = 16, .l1 = 32, .l2 = 3,
    .hash_rate = HASHRATE_NRF52840_CRYPTOCELL,
    .external_pk_size = 897, .external_sig_size = 690
};

[[nodiscard]] constexpr SchemeConstants with_hash_rate(
    SchemeConstants constants, double hash_rate) noexcept {
    constants.hash_rate = hash_rate;
    return constants;
}

/**
 * Signature size model of a Merkle forest
 */
struct ForestModel {
    std::string_view name;
    double ots_size;        // Base one-time signature size in bytes
    double hash_size;       // Size of one authentication node in bytes
    double fallback_size;   // Asymmetric signature used without any tree
};

inline constexpr ForestModel FOREST_W16 = {
    .name = "w=16", .ots_size = 592, .hash_size = 16, .fallback_size = 512
};

inline constexpr ForestModel FOREST_W64 = {
    .name = "w=64", .ots_size = 405, .hash_size = 16, .fallback_size = 512
};

inline constexpr ForestModel FOREST_W256 = {
    .name = "w=256", .ots_size = 320, .hash_size = 16, .fallback_size = 512
};

inline constexpr std::array<const ForestModel*, 3> ALL_FOREST_MODELS = {
    &FOREST_W16, &FOREST_W64, &FOREST_W256
};

} // namespace hbscost

#endif // HBSCOST_PARAMS_HPP
