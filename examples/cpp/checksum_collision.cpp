/**
 * Checksum Collision Estimator
 *
 * Estimates the worst-case residue probability of a bucketed checksum by
 * Monte-Carlo simulation.
 *
 * Usage:
 *   ./checksum_collision [--variant <name>] [--trials <n>] [--seed <s>]
 *
 * Variants:
 *   digit128   Sum of decimal digits, mod 128
 *   raw128     Sum of digit positions, mod 128
 *   raw256     Sum of digit positions, mod 256, random residue for empty buckets
 *   all        All of the above (default)
 */

#include <cstdint>
#include <iostream>
#include <iomanip>
#include <optional>
#include <string>
#include <vector>

#include "csumsim/estimator.hpp"

void print_usage() {
    std::cout << "Checksum Collision Estimator" << std::endl;
    std::cout << "\nUsage: checksum_collision [--variant <name>] [--trials <n>] [--seed <s>]" << std::endl;
    std::cout << "\nVariants:" << std::endl;
    std::cout << "  digit128   Sum of decimal digits, mod 128" << std::endl;
    std::cout << "  raw128     Sum of digit positions, mod 128" << std::endl;
    std::cout << "  raw256     Sum of digit positions, mod 256" << std::endl;
    std::cout << "  all        All of the above (default)" << std::endl;
    std::cout << "\nOptions:" << std::endl;
    std::cout << "  --trials <n>   Simulated messages (default: 10000000)" << std::endl;
    std::cout << "  --seed <s>     Generator seed (default: random)" << std::endl;
}

void report(const csumsim::ChecksumCollisionEstimate& est) {
    std::cout << "\n-- " << est.variant << " --" << std::endl;
    std::cout << "Trials: " << est.trials << " (seed " << est.seed << ")" << std::endl;
    std::cout << std::setprecision(10);
    std::cout << "Expected probability: " << est.expected_probability << std::endl;
    std::cout << "Max probability: [" << est.max_position << "] "
              << est.max_probability << std::endl;
    std::cout << "Median probability: " << est.median_probability << std::endl;
    std::cout << "Sum of probabilities: " << est.total_mass << std::endl;
    std::cout << "WC Security Level: " << est.wc_security_level << std::endl;
    std::cout << "Max theoretical SL: " << static_cast<int>(est.max_security_level) << std::endl;
    if (!est.reliable) {
        std::cout << "WARNING: estimate is unreliable, rerun with more trials" << std::endl;
    }
}

int main(int argc, char* argv[]) {
    std::string variant = "all";
    uint64_t trials = 10'000'000;
    std::optional<uint64_t> seed;

    try {
        int i = 1;
        while (i < argc) {
            std::string arg = argv[i];

            if (arg == "--variant" && i + 1 < argc) {
                variant = argv[++i];
            } else if (arg == "--trials" && i + 1 < argc) {
                trials = std::stoull(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = std::stoull(argv[++i]);
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                return 1;
            }
            ++i;
        }

        std::vector<const csumsim::ChecksumVariant*> variants;
        if (variant == "digit128") {
            variants.push_back(&csumsim::DIGIT_SUM_MOD128);
        } else if (variant == "raw128") {
            variants.push_back(&csumsim::RAW_VALUE_MOD128);
        } else if (variant == "raw256") {
            variants.push_back(&csumsim::RAW_VALUE_MOD256);
        } else if (variant == "all") {
            variants.assign(csumsim::ALL_VARIANTS.begin(), csumsim::ALL_VARIANTS.end());
        } else {
            std::cerr << "Error: Unknown variant '" << variant << "'" << std::endl;
            std::cerr << "\nRun with --help to see available variants." << std::endl;
            return 1;
        }

        for (const auto* v : variants) {
            report(csumsim::estimate_checksum_collision(*v, trials, seed));
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
