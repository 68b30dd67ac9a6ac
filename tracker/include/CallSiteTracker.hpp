#pragma once

#include <cstdint>
#include <mutex>
#include <source_location>
#include <string_view>
#include <unordered_set>

#include "CallSite.hpp"

namespace fc {

/**
 * Remembers which call sites have already been reached.
 *
 * Each instance owns its own seen-set; two trackers never share state.
 * Hold one as a member of whatever object needs "first time only"
 * behaviour and let it die with that object. There is no global tracker.
 *
 * All overloads are safe to call concurrently on the same instance.
 */
class CallSiteTracker {
public:
    CallSiteTracker() = default;
    ~CallSiteTracker() = default;

    /**
     * Atomic test-and-set on the seen-set.
     * @return true exactly once per identifier for this instance
     */
    bool isFirstTime(const CallSiteId& id);

    /**
     * Keyed on the caller's own file/line/column.
     * Usage: if (tracker_.isFirstTime()) { ... }
     */
    bool isFirstTime(const std::source_location& loc = std::source_location::current());

    bool isFirstTime(std::string_view file, std::uint32_t line, std::uint32_t column);

    // nullptr file is treated as ""
    bool isFirstTime(const char* file, std::uint32_t line, std::uint32_t column);

    /**
     * Keyed on a manually chosen token. The caller must keep tokens
     * unique per logical site; two sites sharing a token share one answer.
     */
    bool isFirstTime(std::string_view token);

    // nullptr token is treated as ""
    bool isFirstTime(const char* token);

    // Non-copyable, non-movable
    CallSiteTracker(const CallSiteTracker&) = delete;
    CallSiteTracker& operator=(const CallSiteTracker&) = delete;
    CallSiteTracker(CallSiteTracker&&) = delete;
    CallSiteTracker& operator=(CallSiteTracker&&) = delete;

private:
    std::mutex mu_;
    std::unordered_set<CallSiteId, CallSiteIdHash> seen_;
};

} // namespace fc
