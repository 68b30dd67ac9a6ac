#include "Scenarios.hpp"
#include "Utilities.hpp"
#include "CallSiteTracker.hpp"
#include <atomic>
#include <numeric>
#include <string>
#include <vector>

namespace fc {

/**
 * SiteFanout scenario - Many sites, many threads, random visiting order
 *
 * Sites alternate between manual tokens and source locations. Each worker
 * walks every site in its own shuffled order, then walks them again in
 * reverse. A site's first answer must not depend on which worker or order
 * reached it, and no site may influence another.
 */
class SiteFanout {
public:
    explicit SiteFanout(const StressConfig& config) : config_(config) {}

    ScenarioResult execute() {
        ScenarioResult result("SiteFanout");
        Timer timer;

        std::vector<CallSiteId> sites = buildSites();
        CallSiteTracker tracker;
        std::atomic<uint64_t> calls{0};
        std::atomic<uint64_t> firsts{0};

        runConcurrently(config_.threads, [&](uint32_t thread_id) {
            RNG rng(config_.seed + thread_id);
            std::vector<uint32_t> order(sites.size());
            std::iota(order.begin(), order.end(), 0u);
            rng.shuffle(order);

            uint64_t local_calls = 0;
            uint64_t local_firsts = 0;

            for (uint32_t index : order) {
                ++local_calls;
                if (tracker.isFirstTime(sites[index])) ++local_firsts;
            }
            for (auto it = order.rbegin(); it != order.rend(); ++it) {
                ++local_calls;
                if (tracker.isFirstTime(sites[*it])) ++local_firsts;
            }

            calls.fetch_add(local_calls, std::memory_order_relaxed);
            firsts.fetch_add(local_firsts, std::memory_order_relaxed);
        });

        result.stats.calls = calls.load();
        result.stats.first_hits = firsts.load();
        result.stats.expected_first_hits = sites.size();
        result.stats.duration_ms = timer.elapsedMillis();
        result.settle();
        return result;
    }

private:
    std::vector<CallSiteId> buildSites() const {
        std::vector<CallSiteId> sites;
        sites.reserve(config_.sites);
        for (uint32_t i = 0; i < config_.sites; ++i) {
            if (i % 2 == 0) {
                sites.push_back(CallSiteId::fromToken("fanout:site-" + std::to_string(i)));
            } else {
                sites.push_back(CallSiteId::fromLocation("src/fanout/Screen.cpp", i, 1 + i % 80));
            }
        }
        return sites;
    }

    const StressConfig& config_;
};

ScenarioResult runSiteFanout(const StressConfig& config) {
    SiteFanout scenario(config);
    return scenario.execute();
}

} // namespace fc
