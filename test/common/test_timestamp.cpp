#include "catch.hpp"
#include "chronorange/common/exception.hpp"
#include "chronorange/common/limits.hpp"
#include "chronorange/common/types/timestamp.hpp"

using namespace chronorange;
using namespace std;

static void VerifyTimestamp(date_t date, dtime_t time, int64_t epoch) {
	// create the datetime from the string
	auto datetime = Timestamp::FromString(Date::ToString(date) + " " + Time::ToString(time));
	REQUIRE(datetime.date == date);
	REQUIRE(datetime.time == time);

	// verify that the epoch is correct in every unit
	REQUIRE(Timestamp::FromDatetime(datetime, TimeUnit::MILLISECONDS) == epoch * 1000);
	REQUIRE(Timestamp::FromDatetime(datetime, TimeUnit::MICROSECONDS) == epoch * 1000000);
	REQUIRE(Timestamp::FromDatetime(datetime, TimeUnit::NANOSECONDS) == epoch * 1000000000);
	REQUIRE(Timestamp::ToDatetime(epoch * 1000000, TimeUnit::MICROSECONDS) == datetime);
}

TEST_CASE("Verify that timestamp functions work", "[timestamp]") {
	VerifyTimestamp(Date::FromDate(2019, 8, 26), Time::FromTime(8, 52, 6), 1566809526);
	VerifyTimestamp(Date::FromDate(1970, 1, 1), Time::FromTime(0, 0, 0), 0);
	VerifyTimestamp(Date::FromDate(2000, 10, 10), Time::FromTime(10, 10, 10), 971172610);
	VerifyTimestamp(Date::FromDate(1969, 12, 31), Time::FromTime(23, 0, 0), -3600);
}

TEST_CASE("Dates in the proleptic Gregorian calendar", "[date]") {
	REQUIRE(Date::FromDate(1970, 1, 1).days == 0);
	REQUIRE(Date::FromDate(2000, 1, 1).days == 10957);
	REQUIRE(Date::FromDate(2021, 1, 31).days == 18658);
	REQUIRE(Date::FromDate(1600, 3, 1).days == -135080);
	REQUIRE(Date::FromDate(1, 1, 1).days == -719162);

	REQUIRE(Date::IsLeapYear(2000));
	REQUIRE(Date::IsLeapYear(2024));
	REQUIRE(!Date::IsLeapYear(1900));
	REQUIRE(!Date::IsLeapYear(2023));
	REQUIRE(Date::MonthDays(2024, 2) == 29);
	REQUIRE(Date::MonthDays(2023, 2) == 28);
	REQUIRE(Date::MonthDays(2023, 4) == 30);

	REQUIRE(!Date::IsValid(2023, 2, 29));
	REQUIRE(!Date::IsValid(2023, 13, 1));
	REQUIRE(!Date::IsValid(2023, 1, 0));
	REQUIRE_THROWS_AS(Date::FromDate(2021, 2, 30), ConversionException);

	// converting back and forth is lossless, before and after the epoch
	for (int32_t days = -1000000; days <= 1000000; days += 997) {
		int32_t year, month, day;
		Date::Convert(date_t(days), year, month, day);
		REQUIRE(Date::IsValid(year, month, day));
		REQUIRE(Date::FromDate(year, month, day).days == days);
	}

	REQUIRE(Date::ToString(Date::FromDate(2021, 3, 4)) == "2021-03-04");
	REQUIRE(Date::ToString(Date::FromDate(-100, 1, 1)) == "-0100-01-01");
}

TEST_CASE("Times of day", "[time]") {
	REQUIRE(Time::ToString(Time::FromTime(1, 2, 3)) == "01:02:03");
	REQUIRE(Time::ToString(Time::FromTime(1, 2, 3, 500000000)) == "01:02:03.500");
	REQUIRE(Time::ToString(Time::FromTime(1, 2, 3, 123456000)) == "01:02:03.123456");
	REQUIRE(Time::ToString(Time::FromTime(1, 2, 3, 1)) == "01:02:03.000000001");

	REQUIRE(Time::FromString("12:30") == Time::FromTime(12, 30, 0));
	REQUIRE(Time::FromString("23:59:59.999999999") == Time::FromTime(23, 59, 59, 999999999));
	REQUIRE_THROWS_AS(Time::FromString("24:00:00"), ConversionException);
	REQUIRE_THROWS_AS(Time::FromString("12:60"), ConversionException);
	REQUIRE_THROWS_AS(Time::FromString("noon"), ConversionException);
}

TEST_CASE("Parse and render datetimes", "[timestamp]") {
	auto datetime = Timestamp::FromString("2021-03-14T02:30:00.25");
	REQUIRE(datetime.date == Date::FromDate(2021, 3, 14));
	REQUIRE(datetime.time == Time::FromTime(2, 30, 0, 250000000));
	REQUIRE(Timestamp::ToString(datetime) == "2021-03-14 02:30:00.250");

	REQUIRE(Timestamp::FromString("2021-01-01") == datetime_t(Date::FromDate(2021, 1, 1), dtime_t(0)));
	REQUIRE(Timestamp::FromString(" 2021-01-01 ") == datetime_t(Date::FromDate(2021, 1, 1), dtime_t(0)));
	REQUIRE_THROWS_AS(Timestamp::FromString("2021-02-30"), ConversionException);
	REQUIRE_THROWS_AS(Timestamp::FromString("2021-01-01 25:00:00"), ConversionException);
	REQUIRE_THROWS_AS(Timestamp::FromString("2021-01-01 12:00:00 UTC"), ConversionException);
	REQUIRE_THROWS_AS(Timestamp::FromString("garbage"), ConversionException);

	REQUIRE(Timestamp::ToString(-1, TimeUnit::MICROSECONDS) == "1969-12-31 23:59:59.999999");
	REQUIRE(Timestamp::ToString(1, TimeUnit::MILLISECONDS) == "1970-01-01 00:00:00.001");
}

TEST_CASE("Convert timestamps between units", "[timestamp]") {
	REQUIRE(Timestamp::ConvertUnit(5, TimeUnit::MILLISECONDS, TimeUnit::NANOSECONDS) == 5000000);
	REQUIRE(Timestamp::ConvertUnit(1999, TimeUnit::MICROSECONDS, TimeUnit::MILLISECONDS) == 1);
	// coarser units round towards negative infinity
	REQUIRE(Timestamp::ConvertUnit(-1, TimeUnit::MICROSECONDS, TimeUnit::MILLISECONDS) == -1);
	REQUIRE(Timestamp::ConvertUnit(-1000, TimeUnit::MICROSECONDS, TimeUnit::MILLISECONDS) == -1);
	REQUIRE(Timestamp::ConvertUnit(-1001, TimeUnit::MICROSECONDS, TimeUnit::MILLISECONDS) == -2);

	int64_t result;
	REQUIRE(!Timestamp::TryConvertUnit(NumericLimits<int64_t>::Maximum(), TimeUnit::MILLISECONDS,
	                                   TimeUnit::NANOSECONDS, result));
	REQUIRE_THROWS_AS(Timestamp::ConvertUnit(NumericLimits<int64_t>::Maximum(), TimeUnit::MILLISECONDS,
	                                         TimeUnit::NANOSECONDS),
	                  OutOfRangeException);
}

TEST_CASE("Nanosecond timestamps cover a limited window", "[timestamp]") {
	auto earliest = Timestamp::FromString("1677-09-21 00:12:43.145224192");
	auto latest = Timestamp::FromString("2262-04-11 23:47:16.854775807");
	REQUIRE(Timestamp::InNanosecondsWindow(earliest));
	REQUIRE(Timestamp::InNanosecondsWindow(latest));
	REQUIRE(Timestamp::FromDatetime(earliest, TimeUnit::NANOSECONDS) == NumericLimits<int64_t>::Minimum());
	REQUIRE(Timestamp::FromDatetime(latest, TimeUnit::NANOSECONDS) == NumericLimits<int64_t>::Maximum());
	REQUIRE(!Timestamp::InNanosecondsWindow(Timestamp::FromString("1677-09-21 00:12:43.145224191")));
	REQUIRE(!Timestamp::InNanosecondsWindow(Timestamp::FromString("2262-04-11 23:47:16.854775808")));
	REQUIRE(!Timestamp::InNanosecondsWindow(Timestamp::FromString("1500-01-01")));
	REQUIRE(!Timestamp::InNanosecondsWindow(Timestamp::FromString("2554-12-31")));
	// the window only applies to nanoseconds
	REQUIRE(Timestamp::FromDatetime(Timestamp::FromString("1677-09-20"), TimeUnit::MICROSECONDS) < 0);

	REQUIRE_THROWS_AS(Timestamp::FromDatetime(Timestamp::FromString("1600-01-01"), TimeUnit::NANOSECONDS),
	                  OutOfRangeException);
	REQUIRE(Timestamp::FromDatetime(Timestamp::FromString("1600-01-01"), TimeUnit::MICROSECONDS) < 0);
}
