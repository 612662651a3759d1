//===----------------------------------------------------------------------===//
//                         chronorange
//
// chronorange/calendar/offset_applier.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "chronorange/calendar/time_zone_resolver.hpp"
#include "chronorange/common/optional_ptr.hpp"
#include "chronorange/common/types/duration.hpp"
#include "chronorange/common/types/timestamp.hpp"

namespace chronorange {

//! Adds durations to epoch integers, resolving calendar components against the
//! wall clock of a time zone (or the naive calendar if no time zone is given)
struct OffsetApplier {
	//! Returns start + (interval * step)
	static int64_t Apply(int64_t start, const duration_t &interval, int64_t step, TimeUnit unit,
	                     optional_ptr<const RangeTimeZone> tz);

	//! Returns timestamp + duration
	static int64_t Add(int64_t timestamp, const duration_t &duration, TimeUnit unit,
	                   optional_ptr<const RangeTimeZone> tz);

	//! Adds a number of months to a naive datetime. The day of month is clamped to the length of the target month
	static datetime_t AddMonths(const datetime_t &datetime, int64_t months);
};

} // namespace chronorange
