#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "CallSite.hpp"

namespace fc {

/**
 * Counters collected by one scenario run
 */
struct ScenarioStats {
    uint64_t calls = 0;               // isFirstTime invocations
    uint64_t first_hits = 0;          // invocations that returned true
    uint64_t expected_first_hits = 0;
    uint64_t duration_ms = 0;

    /**
     * Merge stats from another instance
     */
    void merge(const ScenarioStats& other);
};

/**
 * Scenario execution result
 */
struct ScenarioResult {
    std::string scenario_name;
    ScenarioStats stats;
    bool success = true;
    std::string error_message;
    std::vector<CallSiteId> samples;  // identifiers worth showing in the report

    explicit ScenarioResult(const std::string& name) : scenario_name(name) {}

    /**
     * Mark the result failed unless first_hits matches the expectation
     */
    void settle();
};

} // namespace fc
