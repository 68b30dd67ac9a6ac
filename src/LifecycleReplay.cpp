#include "Scenarios.hpp"
#include "Utilities.hpp"
#include "CallSiteTracker.hpp"
#include "FirstTime.hpp"
#include <atomic>
#include <memory>
#include <vector>

namespace fc {

namespace {

/**
 * Lifecycle hooks a UI framework would call, possibly from different
 * scheduling contexts and any number of times.
 */
class Screen {
public:
    virtual ~Screen() = default;
    virtual void willAppear() = 0;
    virtual void didAppear() = 0;
};

/**
 * Owns its tracker as a plain member; nothing is inherited for it.
 */
class ListScreen : public Screen {
public:
    void willAppear() override {
        FC_IF_FIRST_TIME(tracker_) {
            setups_.fetch_add(1, std::memory_order_relaxed);
        }
        checks_.fetch_add(1, std::memory_order_relaxed);
    }

    void didAppear() override {}

    uint64_t setups() const { return setups_.load(); }
    uint64_t checks() const { return checks_.load(); }

protected:
    CallSiteTracker tracker_;
    std::atomic<uint64_t> setups_{0};
    std::atomic<uint64_t> checks_{0};
};

/**
 * Overrides with first-time blocks placed before and after the
 * delegating call, which must not change how often each block runs.
 */
class DetailScreen : public ListScreen {
public:
    static constexpr uint64_t kFirstTimeBlocks = 4;

    void willAppear() override {
        FC_IF_FIRST_TIME(tracker_) {
            setups_.fetch_add(1, std::memory_order_relaxed);
        }
        checks_.fetch_add(1, std::memory_order_relaxed);

        ListScreen::willAppear();
    }

    void didAppear() override {
        ListScreen::didAppear();

        FC_IF_FIRST_TIME(tracker_) {
            setups_.fetch_add(1, std::memory_order_relaxed);
        }
        if (tracker_.isFirstTime("detail:didAppear:analytics")) {
            setups_.fetch_add(1, std::memory_order_relaxed);
        }
        checks_.fetch_add(2, std::memory_order_relaxed);
    }
};

} // namespace

/**
 * LifecycleReplay scenario - Repeated appear cycles on many screens
 *
 * Every screen owns an isolated tracker. Workers replay appear cycles
 * over all screens concurrently; each first-time block must run exactly
 * once per screen.
 */
class LifecycleReplay {
public:
    explicit LifecycleReplay(const StressConfig& config) : config_(config) {}

    ScenarioResult execute() {
        ScenarioResult result("LifecycleReplay");
        Timer timer;

        std::vector<std::unique_ptr<DetailScreen>> screens;
        screens.reserve(config_.screens);
        for (uint32_t i = 0; i < config_.screens; ++i) {
            screens.push_back(std::make_unique<DetailScreen>());
        }

        runConcurrently(config_.threads, [&](uint32_t thread_id) {
            for (uint32_t cycle = 0; cycle < config_.rounds; ++cycle) {
                // Stagger the starting screen so workers collide on different ones
                for (uint32_t k = 0; k < config_.screens; ++k) {
                    Screen& screen = *screens[(thread_id + cycle + k) % config_.screens];
                    screen.willAppear();
                    screen.didAppear();
                }
            }
        });

        for (const auto& screen : screens) {
            result.stats.calls += screen->checks();
            result.stats.first_hits += screen->setups();
        }
        result.stats.expected_first_hits = screens.size() * DetailScreen::kFirstTimeBlocks;
        result.stats.duration_ms = timer.elapsedMillis();
        result.settle();
        return result;
    }

private:
    const StressConfig& config_;
};

ScenarioResult runLifecycleReplay(const StressConfig& config) {
    LifecycleReplay scenario(config);
    return scenario.execute();
}

} // namespace fc
