#include "CallSiteTracker.hpp"

namespace fc {

// === Test-and-set ===

// Inserts under the lock; the insert result is the answer
bool CallSiteTracker::isFirstTime(const CallSiteId& id) {
    std::lock_guard<std::mutex> lock(mu_);
    return seen_.insert(id).second;
}

// === Convenience overloads ===

bool CallSiteTracker::isFirstTime(const std::source_location& loc) {
    return isFirstTime(CallSiteId::current(loc));
}

bool CallSiteTracker::isFirstTime(std::string_view file, std::uint32_t line, std::uint32_t column) {
    return isFirstTime(CallSiteId::fromLocation(file, line, column));
}

bool CallSiteTracker::isFirstTime(const char* file, std::uint32_t line, std::uint32_t column) {
    return isFirstTime(CallSiteId::fromLocation(file, line, column));
}

bool CallSiteTracker::isFirstTime(std::string_view token) {
    return isFirstTime(CallSiteId::fromToken(token));
}

bool CallSiteTracker::isFirstTime(const char* token) {
    return isFirstTime(CallSiteId::fromToken(token));
}

} // namespace fc
