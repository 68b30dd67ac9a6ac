// tracker/include/FirstTime.hpp
#pragma once
#include "CallSite.hpp"
#include "CallSiteTracker.hpp"
#include <source_location>

// Identifier for the place where the macro is written
// Usage: auto id = FC_CALLSITE();
#define FC_CALLSITE() ::fc::CallSiteId::current(std::source_location::current())

// Runs the following statement only the first time this line is reached
// for the given tracker instance.
// Usage: FC_IF_FIRST_TIME(tracker_) { loadAssets(); }
// Expands to a bare if: inside an unbraced outer if, a following else binds to this one.
#define FC_IF_FIRST_TIME(tracker) if ((tracker).isFirstTime(std::source_location::current()))
