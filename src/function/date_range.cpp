#include "chronorange/function/date_range.hpp"
#include "chronorange/common/exception.hpp"

namespace chronorange {

static void CheckNanosecondsWindow(const datetime_t &datetime) {
	if (!Timestamp::InNanosecondsWindow(datetime)) {
		throw OutOfRangeException("Datetime \"%s\" does not fit into a nanosecond timestamp, the supported range is "
		                          "1677-09-21 00:12:43.145224192 to 2262-04-11 23:47:16.854775807",
		                          Timestamp::ToString(datetime));
	}
}

TemporalColumn DateRangeFun::DateRange(const string &name, const datetime_t &start, const datetime_t &end,
                                       const duration_t &interval, ClosedWindow closed, TimeUnit unit,
                                       optional_ptr<const RangeTimeZone> tz, optional_ptr<Logger> logger) {
	if (unit == TimeUnit::NANOSECONDS) {
		CheckNanosecondsWindow(start);
		CheckNanosecondsWindow(end);
	}
	// naive bounds are read as UTC wall clock
	auto start_value = Timestamp::FromDatetime(start, unit);
	auto end_value = Timestamp::FromDatetime(end, unit);
	return DatetimeRangeImpl(name, start_value, end_value, interval, closed, unit, tz, logger);
}

TemporalColumn DateRangeFun::DatetimeRangeImpl(const string &name, int64_t start, int64_t end,
                                               const duration_t &interval, ClosedWindow closed, TimeUnit unit,
                                               optional_ptr<const RangeTimeZone> tz, optional_ptr<Logger> logger) {
	auto values = DatetimeRange::Generate(start, end, interval, closed, unit, tz, logger);
	TemporalColumn result(name, TemporalType::DATETIME, unit, tz ? tz->tz_id : string(), std::move(values));
	result.SetSortedFlag(SortedFlag::ASCENDING);
	return result;
}

TemporalColumn TimeRangeFun::TimeRange(const string &name, dtime_t start, dtime_t end, const duration_t &interval,
                                       ClosedWindow closed, optional_ptr<Logger> logger) {
	return TimeRangeImpl(name, start.nanos, end.nanos, interval, closed, logger);
}

TemporalColumn TimeRangeFun::TimeRangeImpl(const string &name, int64_t start, int64_t end,
                                           const duration_t &interval, ClosedWindow closed,
                                           optional_ptr<Logger> logger) {
	auto values = DatetimeRange::Generate(start, end, interval, closed, TimeUnit::NANOSECONDS, nullptr, logger);
	TemporalColumn result(name, TemporalType::TIME, TimeUnit::NANOSECONDS, string(), std::move(values));
	result.SetSortedFlag(SortedFlag::ASCENDING);
	return result;
}

} // namespace chronorange
