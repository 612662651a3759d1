#include "chronorange/calendar/offset_applier.hpp"
#include "chronorange/common/exception.hpp"
#include "chronorange/common/helper.hpp"
#include "chronorange/common/limits.hpp"
#include "chronorange/common/operator/add.hpp"
#include "chronorange/common/operator/multiply.hpp"

namespace chronorange {

datetime_t OffsetApplier::AddMonths(const datetime_t &datetime, int64_t months) {
	int32_t year, month, day;
	Date::Convert(datetime.date, year, month, day);

	int64_t total_months;
	if (!TryAddOperator::Operation<int64_t, int64_t, int64_t>(int64_t(year) * Duration::MONTHS_PER_YEAR + month - 1,
	                                                           months, total_months)) {
		throw OutOfRangeException("Overflow adding %d months to %s", months, Timestamp::ToString(datetime));
	}
	auto new_year = total_months / Duration::MONTHS_PER_YEAR;
	auto new_month = total_months % Duration::MONTHS_PER_YEAR;
	if (new_month < 0) {
		new_year--;
		new_month += Duration::MONTHS_PER_YEAR;
	}
	new_month++;
	if (new_year < Date::DATE_MIN_YEAR || new_year > Date::DATE_MAX_YEAR) {
		throw OutOfRangeException("Adding %d months to %s is out of the supported date range", months,
		                          Timestamp::ToString(datetime));
	}
	// clamp the day to the end of the target month
	auto new_day = MinValue<int32_t>(day, Date::MonthDays(int32_t(new_year), int32_t(new_month)));

	date_t date;
	if (!Date::TryFromDate(int32_t(new_year), int32_t(new_month), new_day, date)) {
		throw OutOfRangeException("Adding %d months to %s is out of the supported date range", months,
		                          Timestamp::ToString(datetime));
	}
	return datetime_t(date, datetime.time);
}

//! Shift an instant by a calendar amount on the wall clock of the time zone
template <class OP>
static int64_t AddOnWallClock(int64_t timestamp, TimeUnit unit, optional_ptr<const RangeTimeZone> tz, OP &&op) {
	if (!tz) {
		return op(timestamp);
	}
	auto local = tz->resolver.ToLocal(timestamp, unit, tz->tz_id);
	return tz->resolver.FromLocal(op(local), unit, tz->tz_id);
}

static int64_t AddDays(int64_t timestamp, int64_t days, TimeUnit unit) {
	auto units_per_day = Duration::NANOS_PER_DAY / NanosPerTimeUnit(unit);
	auto shift = MultiplyOperatorOverflowCheck::Operation<int64_t, int64_t, int64_t>(days, units_per_day);
	return AddOperatorOverflowCheck::Operation<int64_t, int64_t, int64_t>(timestamp, shift);
}

int64_t OffsetApplier::Add(int64_t timestamp, const duration_t &duration, TimeUnit unit,
                           optional_ptr<const RangeTimeZone> tz) {
	int64_t sign = duration.negative ? -1 : 1;
	auto result = timestamp;
	if (duration.months != 0) {
		result = AddOnWallClock(result, unit, tz, [&](int64_t local) -> int64_t {
			auto datetime = AddMonths(Timestamp::ToDatetime(local, unit), sign * duration.months);
			return Timestamp::FromDatetime(datetime, unit);
		});
	}
	if (duration.weeks != 0) {
		auto days = MultiplyOperatorOverflowCheck::Operation<int64_t, int64_t, int64_t>(duration.weeks,
		                                                                                sign * Duration::DAYS_PER_WEEK);
		result = AddOnWallClock(result, unit, tz, [&](int64_t local) { return AddDays(local, days, unit); });
	}
	if (duration.days != 0) {
		result = AddOnWallClock(result, unit, tz,
		                        [&](int64_t local) { return AddDays(local, sign * duration.days, unit); });
	}
	if (duration.nanos != 0) {
		// the fixed component is applied to the absolute instant
		auto shift = sign * (duration.nanos / NanosPerTimeUnit(unit));
		result = AddOperatorOverflowCheck::Operation<int64_t, int64_t, int64_t>(result, shift);
	}
	return result;
}

int64_t OffsetApplier::Apply(int64_t start, const duration_t &interval, int64_t step, TimeUnit unit,
                             optional_ptr<const RangeTimeZone> tz) {
	return Add(start, Duration::Multiply(interval, step), unit, tz);
}

} // namespace chronorange
