#pragma once

#include "StressConfig.hpp"
#include "Types.hpp"

namespace fc {

// Each scenario builds its own trackers, runs config.threads workers against
// them and reports how many first-time answers it saw versus expected.

ScenarioResult runSiteRace(const StressConfig& config);
ScenarioResult runSiteFanout(const StressConfig& config);
ScenarioResult runKeyCollision(const StressConfig& config);
ScenarioResult runLifecycleReplay(const StressConfig& config);

} // namespace fc
