#include "Report.hpp"
#include "Utilities.hpp"
#include "Serializer.hpp"
#include <algorithm>

namespace fc {

bool allPassed(const std::vector<ScenarioResult>& results) {
    return std::all_of(results.begin(), results.end(),
                       [](const ScenarioResult& r) { return r.success; });
}

void printSummary(std::ostream& out, const StressConfig& config, const std::vector<ScenarioResult>& results) {
    ScenarioStats total_stats;
    for (const auto& result : results) {
        total_stats.merge(result.stats);
    }

    out << "\n=== FIRSTCALL STRESS SUMMARY ===\n";
    out << "Configuration:\n";
    out << "  Threads: " << config.threads << "\n";
    out << "  Rounds: " << config.rounds << "\n";
    out << "  Sites: " << config.sites << "\n";
    out << "  Screens: " << config.screens << "\n";
    out << "  Collision groups: " << config.groups << "\n";
    out << "  Seed: " << config.seed << "\n";

    out << "\nScenario Breakdown:\n";
    for (const auto& result : results) {
        out << "  " << result.scenario_name << ": "
            << (result.success ? "PASS" : "FAIL") << ", "
            << result.stats.calls << " calls, "
            << result.stats.first_hits << "/" << result.stats.expected_first_hits << " first-time hits, "
            << result.stats.duration_ms << "ms ("
            << formatRate(result.stats.calls, result.stats.duration_ms) << ")\n";
        if (!result.error_message.empty()) {
            out << "    error: " << result.error_message << "\n";
        }
        for (const auto& id : result.samples) {
            out << "    site: " << describe(id) << "\n";
        }
    }

    out << "\nTotals:\n";
    out << "  Calls: " << total_stats.calls << "\n";
    out << "  First-time hits: " << total_stats.first_hits << " (expected " << total_stats.expected_first_hits << ")\n";
    out << "  Result: " << (allPassed(results) ? "PASS" : "FAIL") << "\n";
    out << "================================\n";
}

std::string make_report_json(const StressConfig& config, const std::vector<ScenarioResult>& results) {
    std::string j = "{\"config\":{";
    j += "\"threads\":" + std::to_string(config.threads) + ",";
    j += "\"rounds\":" + std::to_string(config.rounds) + ",";
    j += "\"sites\":" + std::to_string(config.sites) + ",";
    j += "\"screens\":" + std::to_string(config.screens) + ",";
    j += "\"groups\":" + std::to_string(config.groups) + ",";
    j += "\"seed\":" + std::to_string(config.seed) + "},";
    j += "\"passed\":";
    j += allPassed(results) ? "true" : "false";
    j += ",\"scenarios\":[";

    bool first = true;
    for (const auto& r : results) {
        if (!first) j += ",";
        first = false;
        j += "{\"name\":\"" + json_escape(r.scenario_name) + "\",";
        j += "\"success\":";
        j += r.success ? "true" : "false";
        j += ",\"calls\":" + std::to_string(r.stats.calls) + ",";
        j += "\"first_hits\":" + std::to_string(r.stats.first_hits) + ",";
        j += "\"expected_first_hits\":" + std::to_string(r.stats.expected_first_hits) + ",";
        j += "\"duration_ms\":" + std::to_string(r.stats.duration_ms) + ",";
        j += "\"error\":\"" + json_escape(r.error_message) + "\",";
        j += "\"samples\":[";
        for (size_t i = 0; i < r.samples.size(); ++i) {
            if (i) j += ",";
            j += make_callsite_json(r.samples[i]);
        }
        j += "]}";
    }
    j += "]}";

    return make_message_json("STRESS_REPORT", j);
}

} // namespace fc
