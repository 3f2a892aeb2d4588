/**
 * Hash-Based Signature Cost Report
 * Compares the scheme families, searches the cheapest Merkle forest and
 * tabulates forests and shallow-deep trees under a failure rate
 */

#include "hbscost/schemes.hpp"
#include "hbscost/forest.hpp"
#include "hbscost/optimizer.hpp"
#include <cstdint>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <string>

namespace {

constexpr double FAILURE_RATE = 0.5;

// Number of deep tree layers cached on the authenticator in the sweep
constexpr int CLIENT_SIDE_CACHING = 2;

std::string operation_cell(const hbscost::OperationCost& op) {
    std::ostringstream ss;
    ss << op.hash_calls << " (~" << std::fixed << std::setprecision(2)
       << op.seconds << " s)";
    return ss.str();
}

void print_scheme_table(const hbscost::SchemeConstants& constants) {
    std::cout << "\nScheme comparison (" << constants.name << ", "
              << std::fixed << std::setprecision(0) << constants.hash_rate
              << " hashes/s)" << std::endl;
    std::cout << std::string(132, '-') << std::endl;
    std::cout << std::left << std::setw(28) << "Scheme" << std::right
              << std::setw(10) << "#Sigs"
              << std::setw(18) << "Sig. size"
              << std::setw(24) << "Keygen time"
              << std::setw(24) << "Avg. Sign time"
              << std::setw(14) << "State (C)"
              << std::setw(14) << "State (S)" << std::endl;
    std::cout << std::string(132, '-') << std::endl;

    auto previous = hbscost::SchemeKind::SingleTree;
    for (const auto& params : hbscost::reference_schemes()) {
        auto metrics = hbscost::compute_scheme(constants, params);
        if (metrics.kind != previous) {
            std::cout << std::string(132, '-') << std::endl;
            previous = metrics.kind;
        }
        std::cout << std::left << std::setw(28) << metrics.label << std::right
                  << std::setw(10) << metrics.signatures.to_string()
                  << std::setw(18) << metrics.sig_size.to_string()
                  << std::setw(24) << operation_cell(metrics.keygen)
                  << std::setw(24) << operation_cell(metrics.sign)
                  << std::setw(12) << metrics.client_state << " B"
                  << std::setw(12) << metrics.server_state << " B" << std::endl;
    }
}

void print_optimum(const hbscost::ForestModel& model) {
    auto result = hbscost::optimize_forest(model, hbscost::DEFAULT_OPTIMIZER);
    std::cout << "\n" << hbscost::forest_name(result.forest)
              << " was the best Merkle forest found, with a cost of: "
              << std::fixed << std::setprecision(4) << result.cost << std::endl;
    std::cout << "  (" << result.candidates_evaluated << " candidates, "
              << result.feasible_candidates << " feasible)" << std::endl;
}

void print_row(const std::string& name, uint64_t sigs, double min_size,
               double avg_size, double max_size, double sign_time) {
    std::cout << std::left << std::setw(20) << name << std::right
              << std::setw(10) << sigs
              << std::fixed << std::setprecision(1)
              << std::setw(14) << min_size << " B"
              << std::setw(14) << avg_size << " B"
              << std::setw(14) << max_size << " B"
              << std::setprecision(2)
              << std::setw(12) << sign_time << " OTS" << std::endl;
}

void print_forest_table(const hbscost::ForestModel& model) {
    std::cout << "\nForests at failure rate " << FAILURE_RATE
              << " (OTS " << model.ots_size << " B, hash " << model.hash_size
              << " B)" << std::endl;
    std::cout << std::string(104, '-') << std::endl;
    std::cout << std::left << std::setw(20) << "Parameters" << std::right
              << std::setw(10) << "Num sigs"
              << std::setw(16) << "Sig size (Min)"
              << std::setw(16) << "Sig size (Avg)"
              << std::setw(16) << "Sig size (Max)"
              << std::setw(16) << "Avg. sig time" << std::endl;
    std::cout << std::string(104, '-') << std::endl;

    for (int s = 0; s < 5; ++s) {
        for (int d = 7; d < 9; ++d) {
            auto m = hbscost::evaluate_shallow_deep(model, s, d, FAILURE_RATE);
            print_row("s=" + std::to_string(s) + ", d=" + std::to_string(d),
                      m.signatures, m.min_size, m.avg_size, m.max_size,
                      m.avg_sign_time);
        }
    }
    std::cout << std::string(104, '-') << std::endl;

    for (const auto& forest : hbscost::reference_forests()) {
        auto m = hbscost::evaluate_forest(model, forest, FAILURE_RATE);
        print_row(hbscost::forest_name(forest), m.signatures, m.min_size,
                  m.avg_size, m.max_size, m.avg_sign_time);
    }
}

void print_sweep(const hbscost::ForestModel& model) {
    std::cout << "\nShallow-deep sweep (d=7, " << CLIENT_SIDE_CACHING
              << " cached layers)" << std::endl;
    std::cout << std::setw(6) << "s" << std::setw(10) << "fail"
              << std::setw(14) << "sig time" << std::setw(14) << "sig size" << std::endl;
    for (int s = 0; s < 5; ++s) {
        for (const auto& p : hbscost::sweep_shallow_deep(model, s, 7, CLIENT_SIDE_CACHING, 10)) {
            std::cout << std::setw(6) << s
                      << std::fixed << std::setprecision(2)
                      << std::setw(10) << p.failure_rate
                      << std::setw(14) << p.avg_sign_time
                      << std::setprecision(1)
                      << std::setw(14) << p.avg_size << std::endl;
        }
    }
}

} // anonymous namespace

int main() {
    std::cout << std::string(60, '=') << std::endl;
    std::cout << "  Hash-Based Signature Cost Report" << std::endl;
    std::cout << std::string(60, '=') << std::endl;

    try {
        const auto& model = hbscost::FOREST_W64;

        print_scheme_table(hbscost::WOTS_N16_W16);

        std::cout << "\nSig size w/o tree: " << std::fixed << std::setprecision(1)
                  << hbscost::hybrid_fallback_size(model, FAILURE_RATE) << " B" << std::endl;

        print_optimum(model);
        print_forest_table(model);
        print_sweep(model);

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}
