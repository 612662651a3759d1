//===----------------------------------------------------------------------===//
//                         chronorange
//
// chronorange/common/enums/time_unit.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "chronorange/common/constants.hpp"

namespace chronorange {

//! The granularity of the epoch integers of a temporal value
enum class TimeUnit : uint8_t { NANOSECONDS = 0, MICROSECONDS = 1, MILLISECONDS = 2 };

//! Short name of the unit ("ns", "us", "ms")
string TimeUnitToString(TimeUnit unit);
//! Parses "ns"/"us"/"ms" (or the long names), returns false if the name is not a time unit
bool TryGetTimeUnit(const string &name, TimeUnit &result);
TimeUnit TimeUnitFromString(const string &name);

//! Number of the given units in one second
int64_t TimeUnitsPerSecond(TimeUnit unit);
//! Number of nanoseconds in one of the given units
int64_t NanosPerTimeUnit(TimeUnit unit);

} // namespace chronorange
