#pragma once

#include <cstdint>
#include <functional>
#include <random>
#include <string>
#include <vector>

namespace fc {

/**
 * Deterministic random number generator for reproducible scenarios
 */
class RNG {
public:
    explicit RNG(uint32_t seed);

    /**
     * Generate random integer in range [min, max]
     */
    uint32_t randInt(uint32_t min, uint32_t max);

    /**
     * Shuffle the values in place (Fisher-Yates)
     */
    void shuffle(std::vector<uint32_t>& values);

private:
    std::mt19937 gen_;
};

/**
 * Simple timing utilities
 */
class Timer {
public:
    Timer();

    /**
     * Get elapsed time in milliseconds
     */
    uint64_t elapsedMillis() const;

private:
    uint64_t start_time_;
};

/**
 * Parse command line arguments into key-value pairs
 */
class ArgParser {
public:
    explicit ArgParser(int argc, char* argv[]);

    /**
     * Check if flag exists
     */
    bool hasFlag(const std::string& flag) const;

    /**
     * Get value for option, with default
     */
    std::string getOption(const std::string& option, const std::string& default_value = "") const;

    /**
     * Get integer value for option, with default
     */
    int getIntOption(const std::string& option, int default_value = 0) const;

    /**
     * Get unsigned 32-bit value for option, with default.
     * Negative or out-of-range values fall back to the default.
     */
    uint32_t getUIntOption(const std::string& option, uint32_t default_value = 0) const;

private:
    std::vector<std::string> args_;
};

/**
 * Run body(thread_index) on thread_count threads released at the same time.
 * Joins every thread before returning. The first exception thrown by a body
 * is rethrown to the caller.
 */
void runConcurrently(uint32_t thread_count, const std::function<void(uint32_t)>& body);

/**
 * Get current time in milliseconds (steady clock)
 */
uint64_t currentTimeMillis();

/**
 * Format a call count over a duration as "N calls/s"
 */
std::string formatRate(uint64_t calls, uint64_t duration_ms);

} // namespace fc
