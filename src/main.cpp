#include "Simulation.hpp"
#include <iostream>
#include <stdexcept>

void printUsage(const char* progName) {
    std::cout << "Usage: " << progName << " [options]\n"
              << "\nOptions:\n"
              << "  -l, --layout <codes>  Lot layout, levels split by ';'\n"
              << "                        C = car, M = motorcycle, T = truck (default: CMCT)\n"
              << "  -g, --gates <n>       Number of gates (1-8, default: 2)\n"
              << "  -n, --naive           Use the racy check-then-park claim (demo only)\n"
              << "  -q, --quiet           Disable event logging\n"
              << "  -h, --help            Show this help\n"
              << "\nExample:\n"
              << "  " << progName << " -l \"CCMT;CCCM\" -g 4\n";
}

bool parseArgs(int argc, char* argv[], Config& config) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return false;
        }
        else if ((arg == "-l" || arg == "--layout") && i + 1 < argc) {
            config.layout = parseLayout(argv[++i]);
        }
        else if ((arg == "-g" || arg == "--gates") && i + 1 < argc) {
            config.numGates = std::stoi(argv[++i]);
            if (config.numGates < 1 || config.numGates > 8) {
                std::cerr << "Error: gates must be 1-8\n";
                return false;
            }
        }
        else if (arg == "-n" || arg == "--naive") {
            config.claimPolicy = ClaimPolicy::CheckThenPark;
        }
        else if (arg == "-q" || arg == "--quiet") {
            config.logEnabled = false;
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return false;
        }
    }
    return true;
}

int main(int argc, char* argv[]) {
    Config config;

    try {
        if (!parseArgs(argc, argv, config)) {
            return 1;
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::out_of_range& e) {
        std::cerr << "Error: value out of range: " << e.what() << "\n";
        return 1;
    }

    int totalSpots = 0;
    for (const auto& level : config.layout.levels) {
        totalSpots += static_cast<int>(level.spots.size());
    }

    std::cout << "========================================\n"
              << "         Parking Lot Gate System        \n"
              << "========================================\n"
              << "Configuration:\n"
              << "  Levels:     " << config.layout.levels.size() << "\n"
              << "  Spots:      " << totalSpots << "\n"
              << "  Gates:      " << config.numGates << "\n"
              << "  Claim:      " << claimPolicyToString(config.claimPolicy) << "\n"
              << "========================================\n";

    try {
        ParkingSimulation engine(config);
        CLI cli(engine);

        engine.start();
        cli.run();
        engine.stop();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Parking lot closed.\n";
    return 0;
}
