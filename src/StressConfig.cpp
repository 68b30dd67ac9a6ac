#include "StressConfig.hpp"
#include "Utilities.hpp"
#include <iostream>

namespace fc {

namespace {

// Negative values would wrap to huge counts; clamp them to 0 so validate() rejects them
uint32_t toCount(int value) {
    return value < 0 ? 0u : static_cast<uint32_t>(value);
}

} // namespace

bool StressConfig::parseArgs(int argc, char* argv[]) {
    ArgParser parser(argc, argv);

    // Parse all options
    threads = toCount(parser.getIntOption("--threads", static_cast<int>(threads)));
    rounds = toCount(parser.getIntOption("--rounds", static_cast<int>(rounds)));
    sites = toCount(parser.getIntOption("--sites", static_cast<int>(sites)));
    screens = toCount(parser.getIntOption("--screens", static_cast<int>(screens)));
    groups = toCount(parser.getIntOption("--groups", static_cast<int>(groups)));
    seed = parser.getUIntOption("--seed", seed);
    json = parser.hasFlag("--json");
    quiet = parser.hasFlag("--quiet");

    // Validate configuration
    if (!validate()) {
        return false;
    }

    return true;
}

void StressConfig::printUsage(const char* program_name) const {
    std::cout << "Usage: " << program_name << " [options]\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --threads <N>           Worker threads per scenario (default: " << threads << ")\n";
    std::cout << "  --rounds <R>            Race rounds / lifecycle cycles (default: " << rounds << ")\n";
    std::cout << "  --sites <S>             Distinct sites in the fan-out scenario (default: " << sites << ")\n";
    std::cout << "  --screens <K>           Simulated screens (default: " << screens << ")\n";
    std::cout << "  --groups <G>            Adversarial key groups (default: " << groups << ")\n";
    std::cout << "  --seed <UINT>           Random seed (default: " << seed << ")\n";
    std::cout << "  --json                  Print the summary as JSON\n";
    std::cout << "  --quiet                 Reduce log output\n";
    std::cout << "  --help                  Show this help message\n";
}

bool StressConfig::validate() const {
    if (threads == 0) {
        std::cerr << "Error: threads must be > 0\n";
        return false;
    }

    if (rounds == 0) {
        std::cerr << "Error: rounds must be > 0\n";
        return false;
    }

    if (sites == 0) {
        std::cerr << "Error: sites must be > 0\n";
        return false;
    }

    if (screens == 0) {
        std::cerr << "Error: screens must be > 0\n";
        return false;
    }

    if (groups == 0) {
        std::cerr << "Error: groups must be > 0\n";
        return false;
    }

    return true;
}

} // namespace fc
