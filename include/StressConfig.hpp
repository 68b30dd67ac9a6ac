#pragma once

#include <cstdint>
#include <string>

namespace fc {

/**
 * Configuration for the stress driver
 * Contains all CLI parameters and runtime settings
 */
struct StressConfig {
    // Threading
    uint32_t threads = 8;

    // Scenario sizes
    uint32_t rounds = 200;   // race rounds and lifecycle cycles
    uint32_t sites = 64;     // distinct sites visited by the fan-out scenario
    uint32_t screens = 16;   // simulated screens, one tracker each
    uint32_t groups = 32;    // adversarial key groups

    // Randomization
    uint32_t seed = 12345;

    // Output
    bool json = false;
    bool quiet = false;

    /**
     * Parse command line arguments and populate config
     * @param argc Argument count
     * @param argv Argument vector
     * @return true if parsing succeeded, false otherwise
     */
    bool parseArgs(int argc, char* argv[]);

    /**
     * Print usage information to stdout
     */
    void printUsage(const char* program_name) const;

    /**
     * Validate configuration parameters
     * @return true if valid, false otherwise
     */
    bool validate() const;
};

} // namespace fc
