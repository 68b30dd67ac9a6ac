#include "StressConfig.hpp"
#include "Utilities.hpp"
#include "Types.hpp"
#include "Scenarios.hpp"
#include "Report.hpp"
#include <iostream>
#include <vector>
#include <functional>
#include <utility>
#include <exception>

namespace fc {

/**
 * Run one scenario, turning an exception into a failed result
 */
ScenarioResult runGuarded(const std::string& name,
                          const std::function<ScenarioResult()>& scenario,
                          const StressConfig& config) {
    if (!config.quiet) {
        std::cout << "Running " << name << "...\n";
    }

    try {
        ScenarioResult result = scenario();
        if (!config.quiet) {
            std::cout << "  " << name << " " << (result.success ? "passed" : "FAILED")
                      << " in " << result.stats.duration_ms << "ms\n";
        }
        return result;
    } catch (const std::exception& e) {
        std::cerr << "Error: scenario " << name << " threw: " << e.what() << std::endl;
        ScenarioResult failed(name);
        failed.success = false;
        failed.error_message = e.what();
        return failed;
    }
}

} // namespace fc

int main(int argc, char* argv[]) {
    fc::StressConfig config;

    // Check for help flag
    fc::ArgParser parser(argc, argv);
    if (parser.hasFlag("--help")) {
        config.printUsage(argv[0]);
        return 0;
    }

    // Parse command line arguments
    if (!config.parseArgs(argc, argv)) {
        config.printUsage(argv[0]);
        return 1;
    }

    if (!config.quiet) {
        std::cout << "Starting firstcall stress run with " << config.threads
                  << " threads, seed " << config.seed << "\n" << std::endl;
    }

    fc::Timer total_timer;

    const std::vector<std::pair<std::string, std::function<fc::ScenarioResult()>>> scenarios = {
        {"SiteRace",        [&]() { return fc::runSiteRace(config); }},
        {"SiteFanout",      [&]() { return fc::runSiteFanout(config); }},
        {"KeyCollision",    [&]() { return fc::runKeyCollision(config); }},
        {"LifecycleReplay", [&]() { return fc::runLifecycleReplay(config); }}
    };

    std::vector<fc::ScenarioResult> results;
    results.reserve(scenarios.size());
    for (const auto& [name, scenario] : scenarios) {
        results.push_back(fc::runGuarded(name, scenario, config));
    }

    // Print summary
    if (config.json) {
        std::cout << fc::make_report_json(config, results) << std::endl;
    } else {
        fc::printSummary(std::cout, config, results);
    }

    if (!config.quiet) {
        std::cout << "Stress run completed in " << total_timer.elapsedMillis() << "ms\n";
    }

    return fc::allPassed(results) ? 0 : 2;
}
