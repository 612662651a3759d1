//===----------------------------------------------------------------------===//
//                         chronorange
//
// chronorange/function/date_range.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "chronorange/common/types/temporal_column.hpp"
#include "chronorange/common/types/timestamp.hpp"
#include "chronorange/function/datetime_range.hpp"

namespace chronorange {

//! Builds DATETIME columns from a range of naive datetimes
struct DateRangeFun {
	//! Create a DATETIME column holding the datetimes from start to end spaced by interval
	static TemporalColumn DateRange(const string &name, const datetime_t &start, const datetime_t &end,
	                                const duration_t &interval, ClosedWindow closed, TimeUnit unit,
	                                optional_ptr<const RangeTimeZone> tz = nullptr,
	                                optional_ptr<Logger> logger = nullptr);
	//! Same as DateRange, for bounds that are already epoch integers in the given unit
	static TemporalColumn DatetimeRangeImpl(const string &name, int64_t start, int64_t end,
	                                        const duration_t &interval, ClosedWindow closed, TimeUnit unit,
	                                        optional_ptr<const RangeTimeZone> tz = nullptr,
	                                        optional_ptr<Logger> logger = nullptr);
};

//! Builds TIME columns (nanoseconds since midnight) from a range of times of day
struct TimeRangeFun {
	static TemporalColumn TimeRange(const string &name, dtime_t start, dtime_t end, const duration_t &interval,
	                                ClosedWindow closed, optional_ptr<Logger> logger = nullptr);
	static TemporalColumn TimeRangeImpl(const string &name, int64_t start, int64_t end, const duration_t &interval,
	                                    ClosedWindow closed, optional_ptr<Logger> logger = nullptr);
};

} // namespace chronorange
