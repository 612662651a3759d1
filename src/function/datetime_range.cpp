#include "chronorange/function/datetime_range.hpp"
#include "chronorange/calendar/offset_applier.hpp"
#include "chronorange/common/assert.hpp"
#include "chronorange/common/exception.hpp"
#include "chronorange/logging/logger.hpp"

namespace chronorange {

idx_t DatetimeRange::EstimateSize(int64_t start, int64_t end, const duration_t &interval, TimeUnit unit) {
	if (start > end) {
		return 0;
	}
	int64_t estimate;
	if (!Duration::TryGetEstimate(interval, unit, estimate) || estimate <= 0) {
		return 0;
	}
	auto span = uint64_t(end) - uint64_t(start);
	return span / uint64_t(estimate) + 1;
}

vector<int64_t> DatetimeRange::GenerateFixed(int64_t start, int64_t end, int64_t step, ClosedWindow closed) {
	CR_ASSERT(start <= end && step > 0);
	// the difference of two int64 values always fits in a uint64
	auto span = uint64_t(end) - uint64_t(start);
	auto ustep = uint64_t(step);
	auto last_index = span / ustep;

	vector<int64_t> result;
	if (last_index >= result.max_size()) {
		throw OutOfRangeException("Range from %d to %d in steps of %d holds too many values", start, end, step);
	}
	uint64_t begin = ClosedWindowIncludesStart(closed) ? 0 : 1;
	uint64_t count = last_index + 1;
	if (!ClosedWindowIncludesEnd(closed) && span % ustep == 0) {
		// the last value of the progression is the end itself
		count--;
	}
	if (begin >= count) {
		return result;
	}
	result.reserve(count - begin);
	for (uint64_t k = begin; k < count; k++) {
		result.push_back(int64_t(uint64_t(start) + k * ustep));
	}
	return result;
}

vector<int64_t> DatetimeRange::GenerateCalendar(int64_t start, int64_t end, const duration_t &interval,
                                                ClosedWindow closed, TimeUnit unit,
                                                optional_ptr<const RangeTimeZone> tz) {
	vector<int64_t> result;
	auto size_hint = EstimateSize(start, end, interval, unit);
	if (size_hint > 0 && size_hint < result.max_size()) {
		result.reserve(size_hint);
	}

	auto include_end = ClosedWindowIncludesEnd(closed);
	int64_t i = ClosedWindowIncludesStart(closed) ? 0 : 1;
	while (true) {
		auto t = OffsetApplier::Apply(start, interval, i, unit, tz);
		if (include_end ? t > end : t >= end) {
			break;
		}
		CR_ASSERT(result.empty() || result.back() < t);
		result.push_back(t);
		i++;
	}
	return result;
}

vector<int64_t> DatetimeRange::Generate(int64_t start, int64_t end, const duration_t &interval, ClosedWindow closed,
                                        TimeUnit unit, optional_ptr<const RangeTimeZone> tz,
                                        optional_ptr<Logger> logger) {
	if (start > end) {
		return vector<int64_t>();
	}
	if (interval.negative || Duration::IsZero(interval)) {
		throw InvalidInputException("`interval` must be positive, got %s", Duration::ToString(interval));
	}

	if (interval.nanos % NanosPerTimeUnit(unit) != 0) {
		throw InvalidInputException("`interval` %s is not a whole number of %s", Duration::ToString(interval),
		                            TimeUnitToString(unit));
	}

	vector<int64_t> result;
	const char *path;
	if (Duration::IsFixed(interval)) {
		auto step = Duration::GetFixedInUnit(interval, unit);
		CR_ASSERT(step > 0);
		path = "fixed";
		result = GenerateFixed(start, end, step, closed);
	} else {
		path = "calendar";
		result = GenerateCalendar(start, end, interval, closed, unit, tz);
	}
	if (logger) {
		CHRONORANGE_LOG_DEBUG(*logger, "Generated %d values from %d to %d (%s) every %s, closed %s, %s path",
		                      result.size(), start, end, TimeUnitToString(unit), Duration::ToString(interval),
		                      ClosedWindowToString(closed), path);
	}
	return result;
}

} // namespace chronorange
