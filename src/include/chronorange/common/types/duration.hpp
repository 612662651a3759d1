//===----------------------------------------------------------------------===//
//                         chronorange
//
// chronorange/common/types/duration.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "chronorange/common/constants.hpp"
#include "chronorange/common/enums/time_unit.hpp"

namespace chronorange {

//! A duration made of calendar components (months, weeks, days) and a fixed component (nanoseconds).
//! The components are magnitudes; the sign of the whole duration is kept in `negative`.
struct duration_t { // NOLINT
	int64_t months;
	int64_t weeks;
	int64_t days;
	int64_t nanos;
	bool negative;

	duration_t() : months(0), weeks(0), days(0), nanos(0), negative(false) {
	}
	duration_t(int64_t months_p, int64_t weeks_p, int64_t days_p, int64_t nanos_p, bool negative_p = false)
	    : months(months_p), weeks(weeks_p), days(days_p), nanos(nanos_p), negative(negative_p) {
	}

	inline bool operator==(const duration_t &rhs) const {
		return months == rhs.months && weeks == rhs.weeks && days == rhs.days && nanos == rhs.nanos &&
		       negative == rhs.negative;
	}
	inline bool operator!=(const duration_t &rhs) const {
		return !(*this == rhs);
	}
};

//! The Duration class is a static class that holds helper functions for the duration type.
class Duration {
public:
	static constexpr const int64_t MONTHS_PER_QUARTER = 3;
	static constexpr const int64_t MONTHS_PER_YEAR = 12;
	static constexpr const int64_t DAYS_PER_WEEK = 7;
	//! Shortest possible month, used to estimate how many steps fit into a range
	static constexpr const int64_t DAYS_PER_MONTH_ESTIMATE = 28;

	static constexpr const int64_t NANOS_PER_MICRO = 1000;
	static constexpr const int64_t NANOS_PER_MSEC = 1000 * NANOS_PER_MICRO;
	static constexpr const int64_t NANOS_PER_SEC = 1000 * NANOS_PER_MSEC;
	static constexpr const int64_t NANOS_PER_MINUTE = 60 * NANOS_PER_SEC;
	static constexpr const int64_t NANOS_PER_HOUR = 60 * NANOS_PER_MINUTE;
	static constexpr const int64_t NANOS_PER_DAY = 24 * NANOS_PER_HOUR;
	static constexpr const int64_t NANOS_PER_WEEK = DAYS_PER_WEEK * NANOS_PER_DAY;

public:
	static duration_t FromNanos(int64_t nanos);
	static duration_t FromDays(int64_t days);
	static duration_t FromWeeks(int64_t weeks);
	static duration_t FromMonths(int64_t months);

	//! Parse a duration such as "1d", "3mo", "1h30m" or "-2w". Throws a ConversionException on failure
	static duration_t FromString(const string &str);
	static bool TryFromString(const string &str, duration_t &result, string *error_message = nullptr);
	//! Render the duration in the same language FromString accepts
	static string ToString(const duration_t &duration);

	//! Whether every component is zero
	static bool IsZero(const duration_t &duration);
	//! Whether the duration has no calendar components, i.e. it has the same length wherever it is applied
	static bool IsFixed(const duration_t &duration);

	//! Scale every component of the duration. Throws an OutOfRangeException on overflow
	static duration_t Multiply(const duration_t &duration, int64_t factor);

	//! The fixed component expressed in the given unit, with the sign applied (truncated towards zero)
	static int64_t GetFixedInUnit(const duration_t &duration, TimeUnit unit);
	//! Approximate length of the duration in the given unit, counting a month as 28 days.
	//! Returns false if the estimate overflows
	static bool TryGetEstimate(const duration_t &duration, TimeUnit unit, int64_t &result);
};

} // namespace chronorange
