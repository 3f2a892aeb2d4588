/**
 * Scheme Cost Calculators
 *
 * Closed-form cost metrics of the hash-chain signature families:
 * XMSS-style single trees, the WOTS/Falcon hybrid, shallow-deep split
 * trees, checksum-multiplicity chains (CTSS) with and without a tree on
 * top (XCMSS), and the minimal numeric baseline (NOTS).
 *
 * Each family is one parameter struct and one pure function; the only
 * thing the functions share is the SchemeConstants they are given.
 */

#ifndef HBSCOST_SCHEMES_HPP
#define HBSCOST_SCHEMES_HPP

#include "params.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hbscost {

/**
 * Scheme families
 */
enum class SchemeKind {
    SingleTree,     // XMSS, optionally layer-cached
    Hybrid,         // WOTS certifying an external asymmetric key
    ShallowDeep,    // Fully cached shallow tree plus deep reserve tree
    ChecksumChain,  // CTSS
    ChecksumTree,   // XCMSS
    Minimal         // NOTS
};

[[nodiscard]] std::string_view to_string(SchemeKind kind) noexcept;

struct SingleTreeParams {
    int height;
    int cached_layer;   // Tree layer cached by the authenticator
};

struct HybridParams {};

struct ShallowDeepParams {
    int shallow;
    int deep;
};

struct ChecksumChainParams {
    int chain_length;
    int multiplier;
};

struct ChecksumTreeParams {
    int chain_length;
    int height;
    int cached_layer;
};

struct MinimalParams {};

using SchemeParameters = std::variant<
    SingleTreeParams,
    HybridParams,
    ShallowDeepParams,
    ChecksumChainParams,
    ChecksumTreeParams,
    MinimalParams>;

[[nodiscard]] SchemeKind kind_of(const SchemeParameters& params) noexcept;

/**
 * Number of signatures a key can produce.
 * The hybrid scheme signs once with its chain, then without limit through
 * the certified external key.
 */
struct SignatureCount {
    uint64_t count;
    bool unbounded;

    [[nodiscard]] std::string to_string() const;
};

/**
 * Signature size in bytes.
 * min == max for fixed-size schemes. external is the size of an additional
 * external signature reported alongside (hybrid only, 0 otherwise).
 */
struct SignatureSize {
    uint64_t min;
    uint64_t max;
    uint64_t external;

    [[nodiscard]] constexpr bool variable() const noexcept {
        return min != max;
    }

    [[nodiscard]] std::string to_string() const;
};

/**
 * Hash call count and the time estimate derived from the hash rate
 */
struct OperationCost {
    uint64_t hash_calls;
    double seconds;
};

struct CostMetrics {
    std::string label;
    SchemeKind kind;
    SignatureCount signatures;
    SignatureSize sig_size;
    OperationCost keygen;
    OperationCost sign;
    uint64_t client_state;   // Authenticator state in bytes
    uint64_t server_state;   // Verifier state in bytes
};

/**
 * Reject constants the formulas cannot be evaluated with
 */
void validate_constants(const SchemeConstants& constants);

[[nodiscard]] CostMetrics single_tree_cost(
    const SchemeConstants& constants, const SingleTreeParams& params);

[[nodiscard]] CostMetrics hybrid_cost(
    const SchemeConstants& constants, const HybridParams& params = {});

[[nodiscard]] CostMetrics shallow_deep_cost(
    const SchemeConstants& constants, const ShallowDeepParams& params);

[[nodiscard]] CostMetrics checksum_chain_cost(
    const SchemeConstants& constants, const ChecksumChainParams& params);

[[nodiscard]] CostMetrics checksum_tree_cost(
    const SchemeConstants& constants, const ChecksumTreeParams& params);

[[nodiscard]] CostMetrics minimal_cost(
    const SchemeConstants& constants, const MinimalParams& params = {});

/**
 * Dispatch to the calculator of the scheme family held by params.
 *
 * @throws std::invalid_argument if a structural constraint is violated
 */
[[nodiscard]] CostMetrics compute_scheme(
    const SchemeConstants& constants, const SchemeParameters& params);

/**
 * Bits needed to store the chain positions of all L chains for
 * chain_length chained WOTS instances
 */
[[nodiscard]] uint64_t chain_position_bits(
    const SchemeConstants& constants, int chain_length);

/**
 * Parameter sets tabulated in the scheme comparison
 */
[[nodiscard]] std::vector<SchemeParameters> reference_schemes();

} // namespace hbscost

#endif // HBSCOST_SCHEMES_HPP
