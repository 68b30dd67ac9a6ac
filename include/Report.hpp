#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "StressConfig.hpp"
#include "Types.hpp"

namespace fc {

/**
 * Print a human readable summary of all scenario results
 */
void printSummary(std::ostream& out, const StressConfig& config, const std::vector<ScenarioResult>& results);

/**
 * Build the summary as a single JSON message:
 * {"type":"STRESS_REPORT","payload":{"config":{...},"passed":bool,"scenarios":[...]}}
 */
std::string make_report_json(const StressConfig& config, const std::vector<ScenarioResult>& results);

/**
 * True when every scenario succeeded
 */
bool allPassed(const std::vector<ScenarioResult>& results);

} // namespace fc
