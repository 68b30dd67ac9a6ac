#include "Scenarios.hpp"
#include "Utilities.hpp"
#include "CallSiteTracker.hpp"
#include <atomic>

namespace fc {

/**
 * SiteRace scenario - Many threads hit one call site at the same instant
 *
 * Every round constructs a fresh tracker, releases all workers together
 * and lets each ask about the same identifier once. Exactly one worker
 * per round may see "first time".
 */
class SiteRace {
public:
    explicit SiteRace(const StressConfig& config) : config_(config) {}

    ScenarioResult execute() {
        ScenarioResult result("SiteRace");
        Timer timer;

        const CallSiteId site = CallSiteId::fromToken("race:shared-site");

        for (uint32_t round = 0; round < config_.rounds; ++round) {
            CallSiteTracker tracker;
            std::atomic<uint64_t> firsts{0};

            runConcurrently(config_.threads, [&](uint32_t) {
                if (tracker.isFirstTime(site)) {
                    firsts.fetch_add(1, std::memory_order_relaxed);
                }
            });

            // Late caller after the race: must be a repeat
            if (tracker.isFirstTime(site)) {
                firsts.fetch_add(1, std::memory_order_relaxed);
            }

            result.stats.calls += config_.threads + 1;
            result.stats.first_hits += firsts.load();
            result.stats.expected_first_hits += 1;
        }

        result.stats.duration_ms = timer.elapsedMillis();
        result.settle();
        return result;
    }

private:
    const StressConfig& config_;
};

ScenarioResult runSiteRace(const StressConfig& config) {
    SiteRace scenario(config);
    return scenario.execute();
}

} // namespace fc
