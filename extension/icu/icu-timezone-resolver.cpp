#include "include/icu-timezone-resolver.hpp"
#include "chronorange/common/exception.hpp"
#include "chronorange/common/operator/add.hpp"
#include "chronorange/common/operator/multiply.hpp"
#include "chronorange/common/operator/subtract.hpp"
#include "chronorange/common/types/duration.hpp"
#include "chronorange/common/types/timestamp.hpp"
#include "unicode/stringpiece.h"
#include "unicode/unistr.h"

namespace chronorange {

static constexpr const int64_t MILLIS_PER_DAY = Duration::NANOS_PER_DAY / Duration::NANOS_PER_MSEC;

static int64_t UnitsPerMilli(TimeUnit unit) {
	return Duration::NANOS_PER_MSEC / NanosPerTimeUnit(unit);
}

//! ICU works in milliseconds: split off the sub-millisecond part so it can be restored afterwards
static int64_t SplitMillis(int64_t value, TimeUnit unit, int64_t &remainder) {
	auto units_per_milli = UnitsPerMilli(unit);
	auto millis = value / units_per_milli;
	remainder = value % units_per_milli;
	if (remainder < 0) {
		--millis;
		remainder += units_per_milli;
	}
	return millis;
}

static int64_t CombineMillis(int64_t millis, int64_t remainder, TimeUnit unit) {
	auto result = MultiplyOperatorOverflowCheck::Operation<int64_t, int64_t, int64_t>(millis, UnitsPerMilli(unit));
	return AddOperatorOverflowCheck::Operation<int64_t, int64_t, int64_t>(result, remainder);
}

ICUTimeZoneResolver::ICUTimeZoneResolver(optional_ptr<Logger> logger_p) : logger(logger_p) {
}

ICUTimeZoneResolver::~ICUTimeZoneResolver() {
}

icu::TimeZone &ICUTimeZoneResolver::GetTimeZone(const string &tz_id) {
	auto entry = zones.find(tz_id);
	if (entry != zones.end()) {
		return *entry->second;
	}
	unique_ptr<icu::TimeZone> tz(icu::TimeZone::createTimeZone(icu::UnicodeString::fromUTF8(icu::StringPiece(tz_id))));
	if (!tz || *tz == icu::TimeZone::getUnknown()) {
		throw TimeZoneException("Unknown time zone '%s'", tz_id);
	}
	if (logger) {
		CHRONORANGE_LOG_DEBUG(*logger, "Loaded ICU time zone '%s'", tz_id);
	}
	auto &result = *tz;
	zones[tz_id] = std::move(tz);
	return result;
}

int32_t ICUTimeZoneResolver::GetOffset(const string &tz_id, int64_t millis) {
	lock_guard<mutex> guard(lock);
	auto &tz = GetTimeZone(tz_id);

	UErrorCode status = U_ZERO_ERROR;
	int32_t raw_offset_ms;
	int32_t dst_offset_ms;
	tz.getOffset(UDate(millis), false, raw_offset_ms, dst_offset_ms, status);
	if (U_FAILURE(status)) {
		throw TimeZoneException("Unable to get the offset of time zone '%s': %s", tz_id, u_errorName(status));
	}
	// the total offset is the raw offset plus the DST offset
	return raw_offset_ms + dst_offset_ms;
}

int64_t ICUTimeZoneResolver::ToLocal(int64_t instant, TimeUnit unit, const string &tz_id) {
	int64_t remainder;
	auto millis = SplitMillis(instant, unit, remainder);
	auto offset = GetOffset(tz_id, millis);
	auto local = AddOperatorOverflowCheck::Operation<int64_t, int64_t, int64_t>(millis, offset);
	return CombineMillis(local, remainder, unit);
}

int64_t ICUTimeZoneResolver::FromLocal(int64_t local, TimeUnit unit, const string &tz_id) {
	int64_t remainder;
	auto local_millis = SplitMillis(local, unit, remainder);

	// the offsets a day before and after bracket any single transition around the local time
	int32_t candidate_offsets[2];
	candidate_offsets[0] = GetOffset(tz_id, SubtractOperatorOverflowCheck::Operation<int64_t, int64_t, int64_t>(
	                                            local_millis, MILLIS_PER_DAY));
	candidate_offsets[1] = GetOffset(
	    tz_id, AddOperatorOverflowCheck::Operation<int64_t, int64_t, int64_t>(local_millis, MILLIS_PER_DAY));
	idx_t candidate_count = candidate_offsets[0] == candidate_offsets[1] ? 1 : 2;

	int64_t matches[2];
	idx_t match_count = 0;
	for (idx_t i = 0; i < candidate_count; i++) {
		auto instant = SubtractOperatorOverflowCheck::Operation<int64_t, int64_t, int64_t>(
		    local_millis, int64_t(candidate_offsets[i]));
		if (GetOffset(tz_id, instant) == candidate_offsets[i]) {
			matches[match_count++] = instant;
		}
	}
	if (match_count == 0) {
		throw TimeZoneException("datetime '%s' is non-existent in time zone '%s'", Timestamp::ToString(local, unit),
		                        tz_id);
	}
	if (match_count > 1) {
		throw TimeZoneException("datetime '%s' is ambiguous in time zone '%s'", Timestamp::ToString(local, unit),
		                        tz_id);
	}
	return CombineMillis(matches[0], remainder, unit);
}

} // namespace chronorange
