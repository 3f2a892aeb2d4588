/**
 * Scheme Cost Calculators Implementation
 */

#include "schemes.hpp"
#include "utils.hpp"
#include <cmath>
#include <stdexcept>

namespace hbscost {

namespace {

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

OperationCost operation(const SchemeConstants& constants, uint64_t hash_calls) {
    return {hash_calls, constants.seconds(hash_calls)};
}

void check_cached_layer(int cached_layer, int height) {
    if (cached_layer < 0) {
        throw std::invalid_argument("Cached layer must be non-negative");
    }
    if (cached_layer > height) {
        throw std::invalid_argument("Cached layer must not exceed the tree height");
    }
}

void check_positive(int value, const char* what) {
    if (value <= 0) {
        throw std::invalid_argument(std::string(what) + " must be positive");
    }
}

} // anonymous namespace

std::string_view to_string(SchemeKind kind) noexcept {
    switch (kind) {
        case SchemeKind::SingleTree: return "XMSS";
        case SchemeKind::Hybrid: return "Hybrid-WOTS-Falcon";
        case SchemeKind::ShallowDeep: return "Shallow-Deep";
        case SchemeKind::ChecksumChain: return "CTSS";
        case SchemeKind::ChecksumTree: return "XCMSS";
        case SchemeKind::Minimal: return "NOTS";
    }
    return "unknown";
}

SchemeKind kind_of(const SchemeParameters& params) noexcept {
    return std::visit(overloaded{
        [](const SingleTreeParams&) { return SchemeKind::SingleTree; },
        [](const HybridParams&) { return SchemeKind::Hybrid; },
        [](const ShallowDeepParams&) { return SchemeKind::ShallowDeep; },
        [](const ChecksumChainParams&) { return SchemeKind::ChecksumChain; },
        [](const ChecksumTreeParams&) { return SchemeKind::ChecksumTree; },
        [](const MinimalParams&) { return SchemeKind::Minimal; },
    }, params);
}

std::string SignatureCount::to_string() const {
    if (unbounded) {
        return std::to_string(count) + "/∞";
    }
    return std::to_string(count);
}

std::string SignatureSize::to_string() const {
    std::string result = std::to_string(min);
    if (variable()) {
        result += "/" + std::to_string(max);
    }
    if (external != 0) {
        result += "/" + std::to_string(external);
    }
    return result + " B";
}

void validate_constants(const SchemeConstants& constants) {
    if (constants.n == 0) {
        throw std::invalid_argument("Hash size must be positive");
    }
    if (constants.w < 2) {
        throw std::invalid_argument("Chain width must be at least 2");
    }
    if (constants.m == 0) {
        throw std::invalid_argument("Message digest size must be positive");
    }
    if (constants.l1 == 0) {
        throw std::invalid_argument("Message chain count must be positive");
    }
    if (!(constants.hash_rate > 0)) {
        throw std::invalid_argument("Hash rate must be positive");
    }
}

uint64_t chain_position_bits(const SchemeConstants& constants, int chain_length) {
    check_positive(chain_length, "Chain length");
    uint64_t positions = checked_mul(constants.w, static_cast<uint64_t>(chain_length));
    return checked_mul(constants.l(), ceil_log2(positions));
}

/**
 * XMSS with WOTS leaves.
 *
 * The signature carries L chain values, the public key, the bitmask seed and
 * the authentication path. Signing regenerates the subtree below the cached
 * layer.
 */
CostMetrics single_tree_cost(const SchemeConstants& constants,
                             const SingleTreeParams& params) {
    validate_constants(constants);
    uint64_t leaves = pow2(params.height, "Tree height");
    check_cached_layer(params.cached_layer, params.height);

    const uint64_t n = constants.n;
    const uint64_t lw = checked_mul(constants.l(), constants.w);
    const uint64_t sig_size = checked_mul(constants.l() + 2 + params.height, n);

    CostMetrics metrics;
    metrics.label = "XMSS (h=" + std::to_string(params.height) +
                    ", c=" + std::to_string(params.cached_layer) + ")";
    metrics.kind = SchemeKind::SingleTree;
    metrics.signatures = {leaves, false};
    metrics.sig_size = {sig_size, sig_size, 0};
    metrics.keygen = operation(constants, checked_mul(lw, leaves));
    metrics.sign = operation(constants,
        checked_mul(lw, uint64_t{1} << (params.height - params.cached_layer)));
    metrics.client_state = checked_add(
        checked_mul(uint64_t{1} << params.cached_layer, n), n);
    metrics.server_state = n;
    return metrics;
}

/**
 * One WOTS signature certifying a key of an external asymmetric scheme,
 * which then signs without limit.
 */
CostMetrics hybrid_cost(const SchemeConstants& constants, const HybridParams&) {
    validate_constants(constants);

    const uint64_t n = constants.n;
    const uint64_t lw = checked_mul(constants.l(), constants.w);
    const uint64_t sig_size = checked_mul(constants.l() + 2, n);

    CostMetrics metrics;
    metrics.label = std::string(to_string(SchemeKind::Hybrid));
    metrics.kind = SchemeKind::Hybrid;
    metrics.signatures = {1, true};
    metrics.sig_size = {sig_size, sig_size, constants.external_sig_size};
    metrics.keygen = operation(constants, lw);
    // Half of each chain is walked on average
    metrics.sign = operation(constants, lw / 2);
    metrics.client_state = 2 * n;
    metrics.server_state = checked_add(n, constants.external_pk_size);
    return metrics;
}

CostMetrics shallow_deep_cost(const SchemeConstants& constants,
                              const ShallowDeepParams& params) {
    validate_constants(constants);
    uint64_t shallow_leaves = pow2(params.shallow, "Shallow tree height");
    uint64_t deep_leaves = pow2(params.deep, "Deep tree height");

    const uint64_t n = constants.n;
    const uint64_t lw = checked_mul(constants.l(), constants.w);
    const uint64_t leaves = checked_add(shallow_leaves, deep_leaves);

    CostMetrics metrics;
    metrics.label = "Shallow-Deep (s=" + std::to_string(params.shallow) +
                    ", d=" + std::to_string(params.deep) + ")";
    metrics.kind = SchemeKind::ShallowDeep;
    metrics.signatures = {leaves, false};
    // Shallow signatures carry a fresh sub public key instead of a path
    metrics.sig_size = {
        checked_mul(constants.l() + 3, n),
        checked_mul(constants.l() + 2 + params.deep, n),
        0
    };
    metrics.keygen = operation(constants, checked_mul(lw, leaves));
    // The verifier caches the whole shallow subtree
    metrics.sign = operation(constants, lw / 2);
    metrics.client_state = 2 * n;
    metrics.server_state = checked_add(n, checked_mul(n, shallow_leaves));
    return metrics;
}

/**
 * CTSS: chained WOTS instances, usable in both the signing and the
 * unsigning direction.
 *
 * Signing gets cheaper and verification more expensive over the lifetime of
 * a key.
 */
CostMetrics checksum_chain_cost(const SchemeConstants& constants,
                                const ChecksumChainParams& params) {
    validate_constants(constants);
    check_positive(params.chain_length, "Chain length");
    check_positive(params.multiplier, "Chain multiplier");

    const uint64_t n = constants.n;
    const uint64_t l = constants.l();
    const uint64_t chain_length = static_cast<uint64_t>(params.chain_length);
    const uint64_t multiplier = static_cast<uint64_t>(params.multiplier);
    const uint64_t lw = checked_mul(l, constants.w);

    uint64_t sig_size = checked_mul(l + 1, n);
    if (multiplier > 1) {
        // Full extra chain-state vector
        sig_size = checked_add(sig_size, checked_mul(l, n));
    }
    const uint64_t position_bits = chain_position_bits(constants, params.chain_length);

    CostMetrics metrics;
    metrics.label = "CTSS (l=" + std::to_string(params.chain_length) +
                    ", m=" + std::to_string(params.multiplier) + ")";
    metrics.kind = SchemeKind::ChecksumChain;
    metrics.signatures = {checked_mul(checked_mul(chain_length, multiplier), 2), false};
    metrics.sig_size = {sig_size, sig_size, 0};
    metrics.keygen = operation(constants,
        checked_mul(checked_mul(lw, chain_length), multiplier));
    metrics.sign = operation(constants, checked_mul(lw, chain_length) / 2);
    metrics.client_state = position_bits;
    metrics.server_state = checked_add(position_bits, n);
    return metrics;
}

/**
 * XCMSS: CTSS chains as the leaves of a Merkle tree.
 */
CostMetrics checksum_tree_cost(const SchemeConstants& constants,
                               const ChecksumTreeParams& params) {
    validate_constants(constants);
    check_positive(params.chain_length, "Chain length");
    uint64_t leaves = pow2(params.height, "Tree height");
    check_cached_layer(params.cached_layer, params.height);

    const uint64_t n = constants.n;
    const uint64_t chain_length = static_cast<uint64_t>(params.chain_length);
    const uint64_t lw = checked_mul(constants.l(), constants.w);
    const uint64_t sig_size = checked_mul(constants.l() + 1 + params.height, n);
    const uint64_t position_bits = chain_position_bits(constants, params.chain_length);
    const uint64_t cache = checked_mul(uint64_t{1} << params.cached_layer, n);

    CostMetrics metrics;
    metrics.label = "XCMSS (l=" + std::to_string(params.chain_length) +
                    ", h=" + std::to_string(params.height) +
                    ", c=" + std::to_string(params.cached_layer) + ")";
    metrics.kind = SchemeKind::ChecksumTree;
    metrics.signatures = {checked_mul(2 * chain_length - 1, leaves), false};
    metrics.sig_size = {sig_size, sig_size, 0};
    metrics.keygen = operation(constants,
        checked_mul(checked_mul(lw, chain_length), leaves));
    metrics.sign = operation(constants,
        checked_mul(checked_mul(lw, chain_length),
                    uint64_t{1} << (params.height - params.cached_layer)) / 2);
    metrics.client_state = checked_add(checked_add(position_bits, cache), n);
    metrics.server_state = checked_add(position_bits, n);
    return metrics;
}

/**
 * NOTS: a single-use scheme encoding the digest as base-w digits.
 * Key generation walks both the public and the private chain halves.
 */
CostMetrics minimal_cost(const SchemeConstants& constants, const MinimalParams&) {
    validate_constants(constants);

    const uint64_t n = constants.n;
    const double w = static_cast<double>(constants.w);
    const double symbols = 2.0 * static_cast<double>(constants.m) * 8.0 / std::log2(w) + 1.0;

    CostMetrics metrics;
    metrics.label = std::string(to_string(SchemeKind::Minimal));
    metrics.kind = SchemeKind::Minimal;
    metrics.signatures = {1, false};
    const uint64_t sig_size = checked_mul(2 * constants.w, n);
    metrics.sig_size = {sig_size, sig_size, 0};
    metrics.keygen = operation(constants, static_cast<uint64_t>(2.0 * symbols * w));
    metrics.sign = operation(constants, static_cast<uint64_t>(symbols * w));
    metrics.client_state = n;
    metrics.server_state = n;
    return metrics;
}

CostMetrics compute_scheme(const SchemeConstants& constants,
                           const SchemeParameters& params) {
    return std::visit(overloaded{
        [&](const SingleTreeParams& p) { return single_tree_cost(constants, p); },
        [&](const HybridParams& p) { return hybrid_cost(constants, p); },
        [&](const ShallowDeepParams& p) { return shallow_deep_cost(constants, p); },
        [&](const ChecksumChainParams& p) { return checksum_chain_cost(constants, p); },
        [&](const ChecksumTreeParams& p) { return checksum_tree_cost(constants, p); },
        [&](const MinimalParams& p) { return minimal_cost(constants, p); },
    }, params);
}

std::vector<SchemeParameters> reference_schemes() {
    std::vector<SchemeParameters> schemes;

    const SingleTreeParams xmss[] = {
        {0, 0}, {7, 0}, {7, 2}, {7, 4}, {7, 6}, {7, 7}
    };
    for (const auto& p : xmss) {
        schemes.emplace_back(p);
    }

    schemes.emplace_back(HybridParams{});

    for (int s = 0; s <= 5; ++s) {
        schemes.emplace_back(ShallowDeepParams{s, 7});
    }

    const ChecksumChainParams ctss[] = {
        {128, 1}, {64, 2}, {32, 4}, {16, 8}, {8, 16}, {4, 32}, {2, 64}
    };
    for (const auto& p : ctss) {
        schemes.emplace_back(p);
    }

    const ChecksumTreeParams xcmss[] = {
        {64, 1, 1}, {33, 2, 2}, {17, 3, 3}, {9, 4, 4},
        {5, 5, 5}, {3, 6, 0}, {3, 6, 6}
    };
    for (const auto& p : xcmss) {
        schemes.emplace_back(p);
    }

    schemes.emplace_back(MinimalParams{});
    return schemes;
}

} // namespace hbscost
