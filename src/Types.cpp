#include "Types.hpp"
#include <algorithm>

namespace fc {

// ScenarioStats Implementation
void ScenarioStats::merge(const ScenarioStats& other) {
    calls += other.calls;
    first_hits += other.first_hits;
    expected_first_hits += other.expected_first_hits;
    duration_ms = std::max(duration_ms, other.duration_ms);
}

// ScenarioResult Implementation
void ScenarioResult::settle() {
    if (stats.first_hits != stats.expected_first_hits) {
        success = false;
        if (error_message.empty()) {
            error_message = "expected " + std::to_string(stats.expected_first_hits) +
                            " first-time hits, saw " + std::to_string(stats.first_hits);
        }
    }
}

} // namespace fc
