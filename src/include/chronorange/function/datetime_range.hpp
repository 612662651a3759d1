//===----------------------------------------------------------------------===//
//                         chronorange
//
// chronorange/function/datetime_range.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "chronorange/calendar/time_zone_resolver.hpp"
#include "chronorange/common/enums/closed_window.hpp"
#include "chronorange/common/optional_ptr.hpp"
#include "chronorange/common/types/duration.hpp"

namespace chronorange {

class Logger;

//! Generates the ascending sequence of epoch integers from start to end spaced by an interval.
//! Fixed intervals are stepped arithmetically; intervals with calendar components are resolved
//! step by step through the OffsetApplier.
struct DatetimeRange {
	//! Returns the values of the range [start, end] (bounds included according to closed).
	//! Returns an empty vector if start > end; throws an InvalidInputException if the interval is not positive
	static vector<int64_t> Generate(int64_t start, int64_t end, const duration_t &interval, ClosedWindow closed,
	                                TimeUnit unit, optional_ptr<const RangeTimeZone> tz = nullptr,
	                                optional_ptr<Logger> logger = nullptr);

	//! Number of values the range is expected to hold, used to size the result.
	//! The estimate may be too high or too low for calendar intervals
	static idx_t EstimateSize(int64_t start, int64_t end, const duration_t &interval, TimeUnit unit);

private:
	static vector<int64_t> GenerateFixed(int64_t start, int64_t end, int64_t step, ClosedWindow closed);
	static vector<int64_t> GenerateCalendar(int64_t start, int64_t end, const duration_t &interval,
	                                        ClosedWindow closed, TimeUnit unit,
	                                        optional_ptr<const RangeTimeZone> tz);
};

} // namespace chronorange
