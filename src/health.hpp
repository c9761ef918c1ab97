#pragma once
#include "range.hpp"

// Health is a Range with its own tag; reaching the minimum is death, reaching
// the maximum is a full heal.
struct HealthMarker {};

using Health        = Range<HealthMarker>;
using DeathEvent    = RangeMinReached<HealthMarker>;
using FullHealEvent = RangeMaxReached<HealthMarker>;
using HealthSystem  = RangeSystem<HealthMarker>;
