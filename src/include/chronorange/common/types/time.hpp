//===----------------------------------------------------------------------===//
//                         chronorange
//
// chronorange/common/types/time.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "chronorange/common/constants.hpp"

namespace chronorange {

//! Type used to represent a time of day (nanoseconds since 00:00:00)
struct dtime_t { // NOLINT
	int64_t nanos;

	dtime_t() = default;
	explicit inline dtime_t(int64_t nanos_p) : nanos(nanos_p) {
	}

	inline bool operator==(const dtime_t &rhs) const {
		return nanos == rhs.nanos;
	};
	inline bool operator!=(const dtime_t &rhs) const {
		return nanos != rhs.nanos;
	};
	inline bool operator<=(const dtime_t &rhs) const {
		return nanos <= rhs.nanos;
	};
	inline bool operator<(const dtime_t &rhs) const {
		return nanos < rhs.nanos;
	};
	inline bool operator>(const dtime_t &rhs) const {
		return nanos > rhs.nanos;
	};
	inline bool operator>=(const dtime_t &rhs) const {
		return nanos >= rhs.nanos;
	};
};

//! The Time class is a static class that holds helper functions for the time-of-day type.
class Time {
public:
	//! Convert a string in the format "hh:mm:ss[.fffffffff]" to a time object
	static dtime_t FromString(const string &str);
	//! Try to convert a "hh:mm:ss[.fffffffff]" string; pos is set to the first unparsed character
	static bool TryConvertTime(const char *buf, idx_t len, idx_t &pos, dtime_t &result);

	//! Convert a time object to a string in the format "hh:mm:ss[.fffffffff]"
	static string ToString(dtime_t time);

	static dtime_t FromTime(int32_t hour, int32_t minute, int32_t second, int32_t nanoseconds = 0);
	//! Extract the time from a given time of day object
	static void Convert(dtime_t time, int32_t &out_hour, int32_t &out_min, int32_t &out_sec, int32_t &out_nanos);

	static bool IsValidTime(int32_t hour, int32_t minute, int32_t second, int32_t nanoseconds);
};

} // namespace chronorange
