/**
 * Merkle Forest Explorer
 *
 * Searches the cheapest Merkle forest within configurable bounds, or
 * evaluates explicit forests.
 *
 * Usage:
 *   ./forest_explorer [options] [forest...]
 *
 * Options:
 *   --ots-size <bytes>   Base one-time signature size (default: 405)
 *   --hash-size <bytes>  Authentication node size (default: 16)
 *   --floor <n>          Minimum number of signatures (default: 128)
 *   --max-trees <k>      Largest forest searched (default: 5)
 *   --max-height <h>     Largest tree height searched (default: 7)
 *   --fail-rate <f>      Failure rate for explicit forests (default: 0.5)
 *
 * Examples:
 *   ./forest_explorer --floor 256 --max-height 8
 *   ./forest_explorer --fail-rate 0.1 0-1-2-3-7 0-0-0-2-7
 */

#include <cstdint>
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>

#include "hbscost/forest.hpp"
#include "hbscost/optimizer.hpp"

void print_usage() {
    std::cout << "Merkle Forest Explorer" << std::endl;
    std::cout << "\nUsage: forest_explorer [options] [forest...]" << std::endl;
    std::cout << "\nForests are dash separated tree heights, e.g. 0-1-2-3-7." << std::endl;
    std::cout << "Without forests, the cheapest forest is searched." << std::endl;
    std::cout << "\nOptions:" << std::endl;
    std::cout << "  --ots-size <bytes>   Base one-time signature size (default: 405)" << std::endl;
    std::cout << "  --hash-size <bytes>  Authentication node size (default: 16)" << std::endl;
    std::cout << "  --floor <n>          Minimum number of signatures (default: 128)" << std::endl;
    std::cout << "  --max-trees <k>      Largest forest searched (default: 5)" << std::endl;
    std::cout << "  --max-height <h>     Largest tree height searched (default: 7)" << std::endl;
    std::cout << "  --fail-rate <f>      Failure rate for explicit forests (default: 0.5)" << std::endl;
}

void print_forest(const hbscost::ForestModel& model, const hbscost::Forest& forest,
                  double failure_rate, const std::vector<double>& scenarios,
                  uint64_t floor) {
    auto m = hbscost::evaluate_forest(model, forest, failure_rate);
    std::cout << "\nForest " << hbscost::forest_name(forest) << std::endl;
    std::cout << "  Signatures:      " << m.signatures << std::endl;
    std::cout << std::fixed << std::setprecision(1);
    std::cout << "  Sig size (min):  " << m.min_size << " B" << std::endl;
    std::cout << "  Sig size (avg):  " << m.avg_size << " B" << std::endl;
    std::cout << "  Sig size (max):  " << m.max_size << " B" << std::endl;
    std::cout << std::setprecision(2);
    std::cout << "  Avg. sig time:   " << m.avg_sign_time << " OTS" << std::endl;
    std::cout << "  Landing probabilities:";
    std::cout << std::setprecision(4);
    for (double p : m.probabilities) {
        std::cout << " " << p;
    }
    std::cout << std::endl;

    double cost = hbscost::forest_cost(model, forest, scenarios, floor);
    if (cost == hbscost::INFEASIBLE_COST) {
        std::cout << "  Cost:            infeasible (< " << floor << " signatures)" << std::endl;
    } else {
        std::cout << "  Cost:            " << cost << std::endl;
    }
}

int main(int argc, char* argv[]) {
    hbscost::ForestModel model = hbscost::FOREST_W64;
    hbscost::OptimizerConfig config = hbscost::DEFAULT_OPTIMIZER;
    int max_height = 7;
    double failure_rate = 0.5;
    std::vector<std::string> forests;

    try {
        int i = 1;
        while (i < argc) {
            std::string arg = argv[i];

            if (arg == "--ots-size" && i + 1 < argc) {
                model.ots_size = std::stod(argv[++i]);
            } else if (arg == "--hash-size" && i + 1 < argc) {
                model.hash_size = std::stod(argv[++i]);
            } else if (arg == "--floor" && i + 1 < argc) {
                config.min_signatures = std::stoull(argv[++i]);
            } else if (arg == "--max-trees" && i + 1 < argc) {
                config.max_trees = std::stoul(argv[++i]);
            } else if (arg == "--max-height" && i + 1 < argc) {
                max_height = std::stoi(argv[++i]);
            } else if (arg == "--fail-rate" && i + 1 < argc) {
                failure_rate = std::stod(argv[++i]);
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            } else if (arg[0] == '-') {
                std::cerr << "Unknown option: " << arg << std::endl;
                return 1;
            } else {
                forests.push_back(arg);
            }
            ++i;
        }

        if (!forests.empty()) {
            for (const auto& name : forests) {
                print_forest(model, hbscost::parse_forest(name), failure_rate,
                             config.scenarios, config.min_signatures);
            }
            return 0;
        }

        config.height_alphabet.clear();
        for (int h = 0; h <= max_height; ++h) {
            config.height_alphabet.push_back(h);
        }

        std::cout << "Searching " << hbscost::search_space_size(config)
                  << " forests of 1-" << config.max_trees << " trees, heights 0-"
                  << max_height << ", at least " << config.min_signatures
                  << " signatures" << std::endl;

        auto result = hbscost::optimize_forest(model, config);
        std::cout << hbscost::forest_name(result.forest)
                  << " was the best Merkle forest found, with a cost of: "
                  << std::fixed << std::setprecision(4) << result.cost << std::endl;

        print_forest(model, result.forest, failure_rate, config.scenarios,
                     config.min_signatures);
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
