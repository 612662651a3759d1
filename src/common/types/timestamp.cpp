#include "chronorange/common/types/timestamp.hpp"
#include "chronorange/common/exception.hpp"
#include "chronorange/common/limits.hpp"
#include "chronorange/common/operator/add.hpp"
#include "chronorange/common/operator/multiply.hpp"
#include "chronorange/common/string_util.hpp"
#include "chronorange/common/types/duration.hpp"

namespace chronorange {

static int64_t UnitsPerDay(TimeUnit unit) {
	return Duration::NANOS_PER_DAY / NanosPerTimeUnit(unit);
}

bool Timestamp::TryFromDatetime(date_t date, dtime_t time, TimeUnit unit, int64_t &result) {
	int64_t day_part;
	int64_t days = date.days;
	// a time of day is never negative, so this truncation is a floor
	auto time_part = time.nanos / NanosPerTimeUnit(unit);
	if (days < 0 && time_part > 0) {
		// borrow a day so that the earliest representable instant does not overflow the day part
		days++;
		time_part -= UnitsPerDay(unit);
	}
	if (!TryMultiplyOperator::Operation<int64_t, int64_t, int64_t>(days, UnitsPerDay(unit), day_part)) {
		return false;
	}
	return TryAddOperator::Operation<int64_t, int64_t, int64_t>(day_part, time_part, result);
}

int64_t Timestamp::FromDatetime(date_t date, dtime_t time, TimeUnit unit) {
	int64_t result;
	if (!TryFromDatetime(date, time, unit, result)) {
		throw OutOfRangeException("Datetime \"%s %s\" is out of range for time unit %s", Date::ToString(date),
		                          Time::ToString(time), TimeUnitToString(unit));
	}
	return result;
}

int64_t Timestamp::FromDatetime(const datetime_t &datetime, TimeUnit unit) {
	return FromDatetime(datetime.date, datetime.time, unit);
}

void Timestamp::Convert(int64_t value, TimeUnit unit, date_t &out_date, dtime_t &out_time) {
	auto units_per_day = UnitsPerDay(unit);
	auto days = value / units_per_day;
	auto remainder = value % units_per_day;
	if (remainder < 0) {
		days--;
		remainder += units_per_day;
	}
	// the widest unit can hold more days than a date
	if (days < NumericLimits<int32_t>::Minimum() || days > NumericLimits<int32_t>::Maximum()) {
		throw OutOfRangeException("Timestamp %d (%s) is out of the supported date range", value,
		                          TimeUnitToString(unit));
	}
	out_date = date_t(int32_t(days));
	out_time = dtime_t(remainder * NanosPerTimeUnit(unit));
}

datetime_t Timestamp::ToDatetime(int64_t value, TimeUnit unit) {
	datetime_t result;
	Convert(value, unit, result.date, result.time);
	return result;
}

bool Timestamp::TryConvertDatetime(const char *str, idx_t len, datetime_t &result) {
	idx_t pos;
	if (!Date::TryConvertDate(str, len, pos, result.date)) {
		return false;
	}
	result.time = dtime_t(0);
	if (pos < len && (str[pos] == ' ' || str[pos] == 'T')) {
		pos++;
		idx_t time_pos;
		if (!Time::TryConvertTime(str + pos, len - pos, time_pos, result.time)) {
			// a date followed by trailing spaces only
			while (pos < len && StringUtil::CharacterIsSpace(str[pos])) {
				pos++;
			}
			return pos == len;
		}
		pos += time_pos;
	}
	// skip trailing spaces
	while (pos < len && StringUtil::CharacterIsSpace(str[pos])) {
		pos++;
	}
	return pos == len;
}

datetime_t Timestamp::FromString(const string &str) {
	datetime_t result;
	if (!TryConvertDatetime(str.c_str(), str.size(), result)) {
		throw ConversionException(
		    "datetime field value out of range: \"%s\", expected format is (YYYY-MM-DD hh:mm:ss[.fffffffff])", str);
	}
	return result;
}

string Timestamp::ToString(const datetime_t &datetime) {
	return Date::ToString(datetime.date) + " " + Time::ToString(datetime.time);
}

string Timestamp::ToString(int64_t value, TimeUnit unit) {
	return ToString(ToDatetime(value, unit));
}

bool Timestamp::TryConvertUnit(int64_t value, TimeUnit source, TimeUnit target, int64_t &result) {
	auto source_nanos = NanosPerTimeUnit(source);
	auto target_nanos = NanosPerTimeUnit(target);
	if (source_nanos == target_nanos) {
		result = value;
		return true;
	}
	if (source_nanos > target_nanos) {
		// finer target: scale up
		return TryMultiplyOperator::Operation<int64_t, int64_t, int64_t>(value, source_nanos / target_nanos, result);
	}
	// coarser target: floor
	auto factor = target_nanos / source_nanos;
	result = value / factor;
	if (value % factor < 0) {
		result--;
	}
	return true;
}

int64_t Timestamp::ConvertUnit(int64_t value, TimeUnit source, TimeUnit target) {
	int64_t result;
	if (!TryConvertUnit(value, source, target, result)) {
		throw OutOfRangeException("Timestamp %d cannot be converted from %s to %s", value, TimeUnitToString(source),
		                          TimeUnitToString(target));
	}
	return result;
}

bool Timestamp::InNanosecondsWindow(const datetime_t &datetime) {
	int64_t value;
	return TryFromDatetime(datetime.date, datetime.time, TimeUnit::NANOSECONDS, value);
}

} // namespace chronorange
