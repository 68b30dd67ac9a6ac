#include "Scenarios.hpp"
#include "Utilities.hpp"
#include "CallSiteTracker.hpp"
#include <algorithm>
#include <atomic>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fc {

namespace {

// What a file+line+column key would look like without separators
std::string naiveKey(const CallSiteId& id) {
    return id.name() + std::to_string(id.line()) + std::to_string(id.column());
}

} // namespace

/**
 * KeyCollision scenario - Call sites whose parts run together
 *
 * Each group holds three distinct (file, line, column) triples that
 * flatten to the same string, e.g. ("u/", 12, 3), ("u/1", 2, 3) and
 * ("u/", 1, 23). All of them must be reported as separate first calls.
 */
class KeyCollision {
public:
    explicit KeyCollision(const StressConfig& config) : config_(config) {}

    ScenarioResult execute() {
        ScenarioResult result("KeyCollision");
        Timer timer;

        std::vector<CallSiteId> sites = buildGroups();
        result.samples.assign(sites.begin(), sites.begin() + std::min<size_t>(3, sites.size()));

        CallSiteTracker tracker;
        std::atomic<uint64_t> calls{0};
        std::atomic<uint64_t> firsts{0};

        runConcurrently(config_.threads, [&](uint32_t thread_id) {
            RNG rng(config_.seed ^ (0x9e37u * (thread_id + 1)));
            std::vector<uint32_t> order(sites.size());
            std::iota(order.begin(), order.end(), 0u);
            rng.shuffle(order);

            uint64_t local_firsts = 0;
            for (uint32_t index : order) {
                if (tracker.isFirstTime(sites[index])) ++local_firsts;
            }

            calls.fetch_add(order.size(), std::memory_order_relaxed);
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
    std::vector<CallSiteId> buildGroups() const {
        RNG rng(config_.seed);
        std::vector<CallSiteId> sites;
        sites.reserve(config_.groups * 3);

        for (uint32_t g = 0; g < config_.groups; ++g) {
            const std::string file = "unit" + std::to_string(g) + "/";
            const uint32_t d1 = rng.randInt(1, 9);
            const uint32_t d2 = rng.randInt(1, 9);
            const uint32_t col = rng.randInt(1, 9);

            CallSiteId a = CallSiteId::fromLocation(file, d1 * 10 + d2, col);
            CallSiteId b = CallSiteId::fromLocation(file + std::to_string(d1), d2, col);
            CallSiteId c = CallSiteId::fromLocation(file, d1, d2 * 10 + col);

            if (naiveKey(a) != naiveKey(b) || naiveKey(a) != naiveKey(c)) {
                throw std::logic_error("collision group " + std::to_string(g) + " does not collide");
            }

            sites.push_back(std::move(a));
            sites.push_back(std::move(b));
            sites.push_back(std::move(c));
        }
        return sites;
    }

    const StressConfig& config_;
};

ScenarioResult runKeyCollision(const StressConfig& config) {
    KeyCollision scenario(config);
    return scenario.execute();
}

} // namespace fc
