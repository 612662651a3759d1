#include "chronorange/common/types/time.hpp"
#include "chronorange/common/exception.hpp"
#include "chronorange/common/string_util.hpp"
#include "chronorange/common/types/duration.hpp"

namespace chronorange {

static_assert(sizeof(dtime_t) == sizeof(int64_t), "dtime_t was padded");

// string format is hh:mm[:ss[.fffffffff]]
// digits beyond nanosecond precision are truncated
static bool ParseTimeComponent(const char *buf, idx_t len, idx_t &pos, int32_t &result) {
	if (pos + 2 > len || !StringUtil::CharacterIsDigit(buf[pos]) || !StringUtil::CharacterIsDigit(buf[pos + 1])) {
		return false;
	}
	result = (buf[pos] - '0') * 10 + (buf[pos + 1] - '0');
	pos += 2;
	return true;
}

bool Time::TryConvertTime(const char *buf, idx_t len, idx_t &pos, dtime_t &result) {
	int32_t hour, min, sec = 0, nanos = 0;
	pos = 0;

	// skip leading spaces
	while (pos < len && StringUtil::CharacterIsSpace(buf[pos])) {
		pos++;
	}
	if (!ParseTimeComponent(buf, len, pos, hour)) {
		return false;
	}
	if (pos >= len || buf[pos] != ':') {
		return false;
	}
	pos++;
	if (!ParseTimeComponent(buf, len, pos, min)) {
		return false;
	}
	if (pos < len && buf[pos] == ':') {
		pos++;
		if (!ParseTimeComponent(buf, len, pos, sec)) {
			return false;
		}
		if (pos < len && buf[pos] == '.') {
			pos++;
			int32_t mult = 100000000;
			idx_t start = pos;
			for (; pos < len && StringUtil::CharacterIsDigit(buf[pos]); pos++) {
				nanos += (buf[pos] - '0') * mult;
				mult /= 10;
			}
			if (pos == start) {
				return false;
			}
		}
	}
	if (!IsValidTime(hour, min, sec, nanos)) {
		return false;
	}
	result = FromTime(hour, min, sec, nanos);
	return true;
}

dtime_t Time::FromString(const string &str) {
	dtime_t result;
	idx_t pos;
	if (!TryConvertTime(str.c_str(), str.size(), pos, result)) {
		throw ConversionException("time field value out of range: \"%s\", expected format is (hh:mm:ss[.fffffffff])",
		                          str);
	}
	// trailing spaces are fine, anything else is not
	while (pos < str.size() && StringUtil::CharacterIsSpace(str[pos])) {
		pos++;
	}
	if (pos < str.size()) {
		throw ConversionException("time field value out of range: \"%s\", expected format is (hh:mm:ss[.fffffffff])",
		                          str);
	}
	return result;
}

string Time::ToString(dtime_t time) {
	int32_t hour, min, sec, nanos;
	Convert(time, hour, min, sec, nanos);
	auto result = StringUtil::Format("%02d:%02d:%02d", hour, min, sec);
	if (nanos == 0) {
		return result;
	}
	// print milli, micro or nanosecond precision, whichever is the shortest exact one
	if (nanos % 1000000 == 0) {
		return result + StringUtil::Format(".%03d", nanos / 1000000);
	}
	if (nanos % 1000 == 0) {
		return result + StringUtil::Format(".%06d", nanos / 1000);
	}
	return result + StringUtil::Format(".%09d", nanos);
}

bool Time::IsValidTime(int32_t hour, int32_t minute, int32_t second, int32_t nanoseconds) {
	if (hour < 0 || hour >= 24) {
		return false;
	}
	if (minute < 0 || minute >= 60) {
		return false;
	}
	if (second < 0 || second >= 60) {
		return false;
	}
	if (nanoseconds < 0 || nanoseconds >= Duration::NANOS_PER_SEC) {
		return false;
	}
	return true;
}

dtime_t Time::FromTime(int32_t hour, int32_t minute, int32_t second, int32_t nanoseconds) {
	int64_t result;
	result = hour;                                          // hours
	result = result * 60 + minute;                          // hours -> minutes
	result = result * 60 + second;                          // minutes -> seconds
	result = result * Duration::NANOS_PER_SEC + nanoseconds; // seconds -> nanoseconds
	return dtime_t(result);
}

void Time::Convert(dtime_t dtime, int32_t &hour, int32_t &min, int32_t &sec, int32_t &nanos) {
	int64_t time = dtime.nanos;
	hour = int32_t(time / Duration::NANOS_PER_HOUR);
	time -= int64_t(hour) * Duration::NANOS_PER_HOUR;
	min = int32_t(time / Duration::NANOS_PER_MINUTE);
	time -= int64_t(min) * Duration::NANOS_PER_MINUTE;
	sec = int32_t(time / Duration::NANOS_PER_SEC);
	time -= int64_t(sec) * Duration::NANOS_PER_SEC;
	nanos = int32_t(time);
}

} // namespace chronorange
