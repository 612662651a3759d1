#include "chronorange/common/types/duration.hpp"
#include "chronorange/common/exception.hpp"
#include "chronorange/common/operator/add.hpp"
#include "chronorange/common/operator/multiply.hpp"
#include "chronorange/common/string_util.hpp"

namespace chronorange {

constexpr const int64_t Duration::MONTHS_PER_QUARTER;
constexpr const int64_t Duration::MONTHS_PER_YEAR;
constexpr const int64_t Duration::DAYS_PER_WEEK;
constexpr const int64_t Duration::DAYS_PER_MONTH_ESTIMATE;
constexpr const int64_t Duration::NANOS_PER_MICRO;
constexpr const int64_t Duration::NANOS_PER_MSEC;
constexpr const int64_t Duration::NANOS_PER_SEC;
constexpr const int64_t Duration::NANOS_PER_MINUTE;
constexpr const int64_t Duration::NANOS_PER_HOUR;
constexpr const int64_t Duration::NANOS_PER_DAY;
constexpr const int64_t Duration::NANOS_PER_WEEK;

duration_t Duration::FromNanos(int64_t nanos) {
	return nanos < 0 ? duration_t(0, 0, 0, -nanos, true) : duration_t(0, 0, 0, nanos);
}

duration_t Duration::FromDays(int64_t days) {
	return days < 0 ? duration_t(0, 0, -days, 0, true) : duration_t(0, 0, days, 0);
}

duration_t Duration::FromWeeks(int64_t weeks) {
	return weeks < 0 ? duration_t(0, -weeks, 0, 0, true) : duration_t(0, weeks, 0, 0);
}

duration_t Duration::FromMonths(int64_t months) {
	return months < 0 ? duration_t(-months, 0, 0, 0, true) : duration_t(months, 0, 0, 0);
}

static bool DurationTryAddition(int64_t &target, int64_t number, int64_t multiplier) {
	int64_t addition;
	if (!TryMultiplyOperator::Operation<int64_t, int64_t, int64_t>(number, multiplier, addition)) {
		return false;
	}
	return TryAddOperator::Operation<int64_t, int64_t, int64_t>(target, addition, target);
}

static bool AssignError(const string &message, string *error_message) {
	if (error_message) {
		*error_message = message;
	}
	return false;
}

bool Duration::TryFromString(const string &input, duration_t &result, string *error_message) {
	const char *str = input.c_str();
	idx_t len = input.size();
	idx_t pos = 0;

	result = duration_t();
	if (len == 0) {
		return AssignError("expected a duration, got an empty string", error_message);
	}
	if (str[pos] == '-') {
		result.negative = true;
		pos++;
	}
	if (pos >= len) {
		return AssignError(StringUtil::Format("expected a number in duration \"%s\"", input), error_message);
	}
	while (pos < len) {
		// parse the number
		idx_t start_pos = pos;
		int64_t number = 0;
		for (; pos < len && StringUtil::CharacterIsDigit(str[pos]); pos++) {
			if (!TryMultiplyOperator::Operation<int64_t, int64_t, int64_t>(number, 10, number) ||
			    !DurationTryAddition(number, str[pos] - '0', 1)) {
				return AssignError(StringUtil::Format("number in duration \"%s\" is out of range", input),
				                   error_message);
			}
		}
		if (pos == start_pos) {
			return AssignError(StringUtil::Format("expected a number at position %d in duration \"%s\"", pos, input),
			                   error_message);
		}
		// parse the unit
		start_pos = pos;
		for (; pos < len && StringUtil::CharacterIsAlpha(str[pos]); pos++) {
		}
		string unit(str + start_pos, pos - start_pos);
		bool success;
		if (unit == "ns") {
			success = DurationTryAddition(result.nanos, number, 1);
		} else if (unit == "us") {
			success = DurationTryAddition(result.nanos, number, NANOS_PER_MICRO);
		} else if (unit == "ms") {
			success = DurationTryAddition(result.nanos, number, NANOS_PER_MSEC);
		} else if (unit == "s") {
			success = DurationTryAddition(result.nanos, number, NANOS_PER_SEC);
		} else if (unit == "m") {
			success = DurationTryAddition(result.nanos, number, NANOS_PER_MINUTE);
		} else if (unit == "h") {
			success = DurationTryAddition(result.nanos, number, NANOS_PER_HOUR);
		} else if (unit == "d") {
			success = DurationTryAddition(result.days, number, 1);
		} else if (unit == "w") {
			success = DurationTryAddition(result.weeks, number, 1);
		} else if (unit == "mo") {
			success = DurationTryAddition(result.months, number, 1);
		} else if (unit == "q") {
			success = DurationTryAddition(result.months, number, MONTHS_PER_QUARTER);
		} else if (unit == "y") {
			success = DurationTryAddition(result.months, number, MONTHS_PER_YEAR);
		} else if (unit.empty()) {
			return AssignError(StringUtil::Format("expected a unit after the number in duration \"%s\"", input),
			                   error_message);
		} else {
			return AssignError(
			    StringUtil::Format("unit \"%s\" not recognized in duration \"%s\", expected one of "
			                       "ns, us, ms, s, m, h, d, w, mo, q, y",
			                       unit, input),
			    error_message);
		}
		if (!success) {
			return AssignError(StringUtil::Format("duration \"%s\" is out of range", input), error_message);
		}
	}
	return true;
}

duration_t Duration::FromString(const string &str) {
	duration_t result;
	string error_message;
	if (!TryFromString(str, result, &error_message)) {
		throw ConversionException("Could not convert string \"%s\" to a duration: %s", str, error_message);
	}
	return result;
}

string Duration::ToString(const duration_t &duration) {
	if (IsZero(duration)) {
		return "0s";
	}
	string result = duration.negative ? "-" : "";
	auto append = [&](int64_t value, const char *unit) {
		if (value != 0) {
			result += std::to_string(value) + unit;
		}
	};
	append(duration.months / MONTHS_PER_YEAR, "y");
	append(duration.months % MONTHS_PER_YEAR, "mo");
	append(duration.weeks, "w");
	append(duration.days, "d");

	auto nanos = duration.nanos;
	append(nanos / NANOS_PER_HOUR, "h");
	nanos %= NANOS_PER_HOUR;
	append(nanos / NANOS_PER_MINUTE, "m");
	nanos %= NANOS_PER_MINUTE;
	append(nanos / NANOS_PER_SEC, "s");
	nanos %= NANOS_PER_SEC;
	append(nanos / NANOS_PER_MSEC, "ms");
	nanos %= NANOS_PER_MSEC;
	append(nanos / NANOS_PER_MICRO, "us");
	append(nanos % NANOS_PER_MICRO, "ns");
	return result;
}

bool Duration::IsZero(const duration_t &duration) {
	return duration.months == 0 && duration.weeks == 0 && duration.days == 0 && duration.nanos == 0;
}

bool Duration::IsFixed(const duration_t &duration) {
	return duration.months == 0 && duration.weeks == 0 && duration.days == 0;
}

duration_t Duration::Multiply(const duration_t &duration, int64_t factor) {
	duration_t result;
	result.negative = duration.negative;
	if (factor < 0) {
		factor = MultiplyOperatorOverflowCheck::Operation<int64_t, int64_t, int64_t>(factor, -1);
		result.negative = !result.negative;
	}
	result.months = MultiplyOperatorOverflowCheck::Operation<int64_t, int64_t, int64_t>(duration.months, factor);
	result.weeks = MultiplyOperatorOverflowCheck::Operation<int64_t, int64_t, int64_t>(duration.weeks, factor);
	result.days = MultiplyOperatorOverflowCheck::Operation<int64_t, int64_t, int64_t>(duration.days, factor);
	result.nanos = MultiplyOperatorOverflowCheck::Operation<int64_t, int64_t, int64_t>(duration.nanos, factor);
	return result;
}

int64_t Duration::GetFixedInUnit(const duration_t &duration, TimeUnit unit) {
	auto result = duration.nanos / NanosPerTimeUnit(unit);
	return duration.negative ? -result : result;
}

bool Duration::TryGetEstimate(const duration_t &duration, TimeUnit unit, int64_t &result) {
	int64_t nanos = duration.nanos;
	if (!DurationTryAddition(nanos, duration.days, NANOS_PER_DAY)) {
		return false;
	}
	if (!DurationTryAddition(nanos, duration.weeks, NANOS_PER_WEEK)) {
		return false;
	}
	int64_t month_days;
	if (!TryMultiplyOperator::Operation<int64_t, int64_t, int64_t>(duration.months, DAYS_PER_MONTH_ESTIMATE,
	                                                                month_days)) {
		return false;
	}
	if (!DurationTryAddition(nanos, month_days, NANOS_PER_DAY)) {
		return false;
	}
	result = nanos / NanosPerTimeUnit(unit);
	return true;
}

} // namespace chronorange
