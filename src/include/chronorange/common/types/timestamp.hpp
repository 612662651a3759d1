//===----------------------------------------------------------------------===//
//                         chronorange
//
// chronorange/common/types/timestamp.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "chronorange/common/constants.hpp"
#include "chronorange/common/enums/time_unit.hpp"
#include "chronorange/common/types/date.hpp"
#include "chronorange/common/types/time.hpp"

namespace chronorange {

//! A naive (time zone free) date and time of day
struct datetime_t { // NOLINT
	date_t date;
	dtime_t time;

	datetime_t() = default;
	inline datetime_t(date_t date_p, dtime_t time_p) : date(date_p), time(time_p) {
	}

	inline bool operator==(const datetime_t &rhs) const {
		return date == rhs.date && time == rhs.time;
	};
	inline bool operator!=(const datetime_t &rhs) const {
		return !(*this == rhs);
	};
	inline bool operator<(const datetime_t &rhs) const {
		return date < rhs.date || (date == rhs.date && time < rhs.time);
	};
};

//! The Timestamp class is a static class that holds helper functions for epoch integers.
//! A timestamp is a signed count of time units since 1970-01-01 00:00:00, the unit is passed along.
class Timestamp {
public:
	//! Convert a date and time of day into an epoch integer in the given unit. Throws on overflow
	static int64_t FromDatetime(date_t date, dtime_t time, TimeUnit unit);
	static int64_t FromDatetime(const datetime_t &datetime, TimeUnit unit);
	static bool TryFromDatetime(date_t date, dtime_t time, TimeUnit unit, int64_t &result);

	//! Split an epoch integer into its date and time of day
	static void Convert(int64_t value, TimeUnit unit, date_t &out_date, dtime_t &out_time);
	static datetime_t ToDatetime(int64_t value, TimeUnit unit);

	//! Parse "YYYY-MM-DD[( |T)hh:mm:ss[.fffffffff]]"
	static datetime_t FromString(const string &str);
	static bool TryConvertDatetime(const char *str, idx_t len, datetime_t &result);
	//! Render "YYYY-MM-DD hh:mm:ss[.fffffffff]"
	static string ToString(const datetime_t &datetime);
	static string ToString(int64_t value, TimeUnit unit);

	//! Convert an epoch integer between units, rounding towards negative infinity when the target is coarser
	static bool TryConvertUnit(int64_t value, TimeUnit source, TimeUnit target, int64_t &result);
	static int64_t ConvertUnit(int64_t value, TimeUnit source, TimeUnit target);

	//! Whether the datetime can be represented as an int64 count of nanoseconds (roughly 584 years around 1970)
	static bool InNanosecondsWindow(const datetime_t &datetime);
};

} // namespace chronorange
