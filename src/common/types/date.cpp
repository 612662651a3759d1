#include "chronorange/common/types/date.hpp"
#include "chronorange/common/assert.hpp"
#include "chronorange/common/exception.hpp"
#include "chronorange/common/limits.hpp"
#include "chronorange/common/string_util.hpp"

namespace chronorange {

static_assert(sizeof(date_t) == sizeof(int32_t), "date_t was padded");

const int32_t Date::NORMAL_DAYS[] = {0, 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
const int32_t Date::CUMULATIVE_DAYS[] = {0, 31, 59, 90, 120, 151, 181, 212, 243, 273, 304, 334, 365};
const int32_t Date::LEAP_DAYS[] = {0, 31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
const int32_t Date::CUMULATIVE_LEAP_DAYS[] = {0, 31, 60, 91, 121, 152, 182, 213, 244, 274, 305, 335, 366};

constexpr const int32_t Date::EPOCH_YEAR;
constexpr const int32_t Date::YEAR_INTERVAL;
constexpr const int32_t Date::DAYS_PER_YEAR_INTERVAL;
constexpr const int32_t Date::DATE_MIN_YEAR;
constexpr const int32_t Date::DATE_MIN_MONTH;
constexpr const int32_t Date::DATE_MIN_DAY;
constexpr const int32_t Date::DATE_MAX_YEAR;
constexpr const int32_t Date::DATE_MAX_MONTH;
constexpr const int32_t Date::DATE_MAX_DAY;

namespace {

//! Days from 1970-01-01 to January 1st of each year of one 400 year cycle
struct CumulativeYearDays {
	CumulativeYearDays() {
		days[0] = 0;
		for (int32_t i = 0; i < Date::YEAR_INTERVAL; i++) {
			days[i + 1] = days[i] + (Date::IsLeapYear(Date::EPOCH_YEAR + i) ? 366 : 365);
		}
	}

	int32_t days[Date::YEAR_INTERVAL + 1];
};

const CumulativeYearDays &GetCumulativeYearDays() {
	static const CumulativeYearDays cumulative_year_days;
	return cumulative_year_days;
}

bool ParseDigits(const char *buf, idx_t len, idx_t &pos, idx_t max_digits, int32_t &result) {
	idx_t start = pos;
	result = 0;
	while (pos < len && pos - start < max_digits && StringUtil::CharacterIsDigit(buf[pos])) {
		result = result * 10 + (buf[pos] - '0');
		pos++;
	}
	return pos > start;
}

} // namespace

bool Date::IsLeapYear(int32_t year) {
	return year % 4 == 0 && (year % 100 != 0 || year % 400 == 0);
}

bool Date::IsValid(int32_t year, int32_t month, int32_t day) {
	if (month < 1 || month > 12) {
		return false;
	}
	if (day < 1) {
		return false;
	}
	if (year <= DATE_MIN_YEAR) {
		if (year < DATE_MIN_YEAR) {
			return false;
		} else if (year == DATE_MIN_YEAR) {
			if (month < DATE_MIN_MONTH || (month == DATE_MIN_MONTH && day < DATE_MIN_DAY)) {
				return false;
			}
		}
	}
	if (year >= DATE_MAX_YEAR) {
		if (year > DATE_MAX_YEAR) {
			return false;
		} else if (year == DATE_MAX_YEAR) {
			if (month > DATE_MAX_MONTH || (month == DATE_MAX_MONTH && day > DATE_MAX_DAY)) {
				return false;
			}
		}
	}
	return day <= MonthDays(year, month);
}

int32_t Date::MonthDays(int32_t year, int32_t month) {
	CR_ASSERT(month >= 1 && month <= 12);
	return IsLeapYear(year) ? LEAP_DAYS[month] : NORMAL_DAYS[month];
}

void Date::ExtractYearOffset(int32_t &n, int32_t &year, int32_t &year_offset) {
	// leap years repeat every 400 years: normalize n into the cycle starting at 1970
	int32_t cycles = n / DAYS_PER_YEAR_INTERVAL;
	if (n % DAYS_PER_YEAR_INTERVAL < 0) {
		cycles--;
	}
	n -= cycles * DAYS_PER_YEAR_INTERVAL;
	year = EPOCH_YEAR + cycles * YEAR_INTERVAL;

	auto &cumulative = GetCumulativeYearDays().days;
	// upper bound assuming 365 day years, leap days push us back at most one year
	year_offset = n / 365;
	while (n < cumulative[year_offset]) {
		year_offset--;
		CR_ASSERT(year_offset >= 0);
	}
	year += year_offset;
	n -= cumulative[year_offset];
}

void Date::Convert(date_t date, int32_t &out_year, int32_t &out_month, int32_t &out_day) {
	auto n = date.days;
	int32_t year_offset;
	ExtractYearOffset(n, out_year, year_offset);

	auto cumulative = IsLeapYear(out_year) ? CUMULATIVE_LEAP_DAYS : CUMULATIVE_DAYS;
	out_month = 1;
	while (n >= cumulative[out_month]) {
		out_month++;
	}
	out_day = n - cumulative[out_month - 1] + 1;
	CR_ASSERT(out_month >= 1 && out_month <= 12);
	CR_ASSERT(out_day >= 1 && out_day <= MonthDays(out_year, out_month));
}

bool Date::TryFromDate(int32_t year, int32_t month, int32_t day, date_t &result) {
	if (!IsValid(year, month, day)) {
		return false;
	}
	int64_t year_offset = int64_t(year) - EPOCH_YEAR;
	int64_t cycles = year_offset / YEAR_INTERVAL;
	if (year_offset % YEAR_INTERVAL < 0) {
		cycles--;
	}
	year_offset -= cycles * YEAR_INTERVAL;

	int64_t n = cycles * DAYS_PER_YEAR_INTERVAL;
	n += GetCumulativeYearDays().days[year_offset];
	n += IsLeapYear(year) ? CUMULATIVE_LEAP_DAYS[month - 1] : CUMULATIVE_DAYS[month - 1];
	n += day - 1;
	if (n < NumericLimits<int32_t>::Minimum() || n > NumericLimits<int32_t>::Maximum()) {
		return false;
	}
	result = date_t(int32_t(n));
	return true;
}

date_t Date::FromDate(int32_t year, int32_t month, int32_t day) {
	date_t result;
	if (!TryFromDate(year, month, day, result)) {
		throw ConversionException("Date out of range: %d-%d-%d", year, month, day);
	}
	return result;
}

string Date::Format(int32_t year, int32_t month, int32_t day) {
	if (year < 0) {
		return StringUtil::Format("-%04d-%02d-%02d", -year, month, day);
	}
	return StringUtil::Format("%04d-%02d-%02d", year, month, day);
}

string Date::ToString(date_t date) {
	int32_t year, month, day;
	Convert(date, year, month, day);
	return Format(year, month, day);
}

bool Date::TryConvertDate(const char *buf, idx_t len, idx_t &pos, date_t &result) {
	pos = 0;
	while (pos < len && StringUtil::CharacterIsSpace(buf[pos])) {
		pos++;
	}
	bool negative = false;
	if (pos < len && buf[pos] == '-') {
		negative = true;
		pos++;
	}
	int32_t year, month, day;
	if (!ParseDigits(buf, len, pos, 7, year)) {
		return false;
	}
	if (pos >= len || buf[pos] != '-') {
		return false;
	}
	pos++;
	if (!ParseDigits(buf, len, pos, 2, month)) {
		return false;
	}
	if (pos >= len || buf[pos] != '-') {
		return false;
	}
	pos++;
	if (!ParseDigits(buf, len, pos, 2, day)) {
		return false;
	}
	if (negative) {
		year = -year;
	}
	return TryFromDate(year, month, day, result);
}

} // namespace chronorange
