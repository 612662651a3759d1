#include "catch.hpp"
#include "test_helpers.hpp"

using namespace chronorange;
using namespace std;

TEST_CASE("Date range columns", "[date_range]") {
	auto column = DateRangeFun::DateRange("dates", Timestamp::FromString("2021-01-31"),
	                                      Timestamp::FromString("2021-05-31"), Duration::FromString("1mo"),
	                                      ClosedWindow::BOTH, TimeUnit::MICROSECONDS);
	REQUIRE(column.GetName() == "dates");
	REQUIRE(column.GetType() == TemporalType::DATETIME);
	REQUIRE(column.GetTimeUnit() == TimeUnit::MICROSECONDS);
	REQUIRE(!column.HasTimeZone());
	REQUIRE(column.GetSortedFlag() == SortedFlag::ASCENDING);
	REQUIRE(column.size() == 5);
	REQUIRE(column.ToString(0) == "2021-01-31 00:00:00");
	REQUIRE(column.ToString(1) == "2021-02-28 00:00:00");
	REQUIRE(column.ToString(2) == "2021-03-31 00:00:00");
	REQUIRE(column.ToString(3) == "2021-04-30 00:00:00");
	REQUIRE(column.ToString(4) == "2021-05-31 00:00:00");
	REQUIRE(column.GetValue(1) == TestTimestamp("2021-02-28"));
	REQUIRE_THROWS_AS(column.GetValue(5), OutOfRangeException);
	REQUIRE_THROWS_AS(column.ToString(5), OutOfRangeException);

	auto small = DateRangeFun::DateRange("d", Timestamp::FromString("2021-01-01"), Timestamp::FromString("2021-01-02"),
	                                     Duration::FromString("12h"), ClosedWindow::LEFT, TimeUnit::MILLISECONDS);
	REQUIRE(small.GetTimeUnit() == TimeUnit::MILLISECONDS);
	REQUIRE(small.ToString() == "d (DATETIME[ms], ASCENDING)\n2021-01-01 00:00:00\n2021-01-01 12:00:00\n");
	REQUIRE(small.GetValue(1) == TestTimestamp("2021-01-01 12:00:00", TimeUnit::MILLISECONDS));

	// an empty range is still a typed, sorted column
	auto empty = DateRangeFun::DateRange("e", Timestamp::FromString("2021-01-02"), Timestamp::FromString("2021-01-01"),
	                                     Duration::FromString("1d"), ClosedWindow::BOTH, TimeUnit::MICROSECONDS);
	REQUIRE(empty.empty());
	REQUIRE(empty.GetType() == TemporalType::DATETIME);
	REQUIRE(empty.GetSortedFlag() == SortedFlag::ASCENDING);
}

TEST_CASE("Nanosecond date ranges are limited to the representable instants", "[date_range]") {
	auto interval = Duration::FromString("1d");
	auto column = DateRangeFun::DateRange("ns", Timestamp::FromString("2021-01-01"),
	                                      Timestamp::FromString("2021-01-03"), interval, ClosedWindow::BOTH,
	                                      TimeUnit::NANOSECONDS);
	REQUIRE(column.size() == 3);
	REQUIRE(column.GetValue(2) == TestTimestamp("2021-01-03", TimeUnit::NANOSECONDS));

	REQUIRE_THROWS_AS(DateRangeFun::DateRange("ns", Timestamp::FromString("1200-01-01"),
	                                          Timestamp::FromString("2021-01-01"), interval, ClosedWindow::BOTH,
	                                          TimeUnit::NANOSECONDS),
	                  OutOfRangeException);
	REQUIRE_THROWS_AS(DateRangeFun::DateRange("ns", Timestamp::FromString("1500-01-01"),
	                                          Timestamp::FromString("2021-01-01"), interval, ClosedWindow::BOTH,
	                                          TimeUnit::NANOSECONDS),
	                  OutOfRangeException);
	REQUIRE_THROWS_AS(DateRangeFun::DateRange("ns", Timestamp::FromString("2021-01-01"),
	                                          Timestamp::FromString("2600-01-01"), interval, ClosedWindow::BOTH,
	                                          TimeUnit::NANOSECONDS),
	                  OutOfRangeException);
	// the same bounds are fine in microseconds
	auto wide = DateRangeFun::DateRange("us", Timestamp::FromString("1200-01-01"), Timestamp::FromString("2600-01-01"),
	                                    Duration::FromString("100y"), ClosedWindow::BOTH, TimeUnit::MICROSECONDS);
	REQUIRE(wide.size() == 15);
	REQUIRE(wide.ToString(14) == "2600-01-01 00:00:00");
}

TEST_CASE("Time zone aware date ranges", "[date_range]") {
	TestTimeZoneResolver resolver;
	RangeTimeZone tz(resolver, "Test/DST");
	auto column = DateRangeFun::DateRange("tz", Timestamp::FromString("2021-03-27"),
	                                      Timestamp::FromString("2021-03-29"), Duration::FromString("1d"),
	                                      ClosedWindow::BOTH, TimeUnit::MICROSECONDS, &tz);
	REQUIRE(column.HasTimeZone());
	REQUIRE(column.GetTimeZone() == "Test/DST");
	// one local day is 23 hours long across the spring transition
	vector<int64_t> expected {TestTimestamp("2021-03-27 00:00:00"), TestTimestamp("2021-03-28 00:00:00"),
	                          TestTimestamp("2021-03-28 23:00:00")};
	REQUIRE(column.GetData() == expected);
	REQUIRE(column.ToString() == "tz (DATETIME[us, Test/DST], ASCENDING)\n2021-03-27 00:00:00\n2021-03-28 00:00:00\n"
	                             "2021-03-28 23:00:00\n");

	// fixed intervals do not depend on the zone
	auto fixed = DateRangeFun::DateRange("tz", Timestamp::FromString("2021-03-27"),
	                                     Timestamp::FromString("2021-03-29"), Duration::FromString("24h"),
	                                     ClosedWindow::BOTH, TimeUnit::MICROSECONDS, &tz);
	REQUIRE(fixed.size() == 3);
	REQUIRE(fixed.GetValue(2) == TestTimestamp("2021-03-29"));
	REQUIRE(fixed.GetTimeZone() == "Test/DST");
}

TEST_CASE("Date ranges over epoch integers", "[date_range]") {
	auto column = DateRangeFun::DatetimeRangeImpl("raw", 0, 10, Duration::FromString("3ms"), ClosedWindow::RIGHT,
	                                              TimeUnit::MILLISECONDS);
	vector<int64_t> expected {3, 6, 9};
	REQUIRE(column.GetData() == expected);
	REQUIRE(column.ToString(0) == "1970-01-01 00:00:00.003");

	auto negative = DateRangeFun::DatetimeRangeImpl("raw", -2000000, 0, Duration::FromString("1s"),
	                                                ClosedWindow::BOTH, TimeUnit::MICROSECONDS);
	REQUIRE(negative.size() == 3);
	REQUIRE(negative.ToString(0) == "1969-12-31 23:59:58");
}

TEST_CASE("Time ranges", "[date_range]") {
	auto start = Time::FromString("00:00");
	auto end = Time::FromString("01:00");
	auto interval = Duration::FromString("15m");

	auto column = TimeRangeFun::TimeRange("times", start, end, interval, ClosedWindow::BOTH);
	REQUIRE(column.GetType() == TemporalType::TIME);
	REQUIRE(column.GetTimeUnit() == TimeUnit::NANOSECONDS);
	REQUIRE(!column.HasTimeZone());
	REQUIRE(column.GetSortedFlag() == SortedFlag::ASCENDING);
	REQUIRE(column.size() == 5);
	REQUIRE(column.ToString(0) == "00:00:00");
	REQUIRE(column.ToString(1) == "00:15:00");
	REQUIRE(column.ToString(4) == "01:00:00");

	REQUIRE(TimeRangeFun::TimeRange("times", start, end, interval, ClosedWindow::NONE).size() == 3);
	REQUIRE(TimeRangeFun::TimeRange("times", start, end, interval, ClosedWindow::LEFT).size() == 4);
	REQUIRE(TimeRangeFun::TimeRange("times", end, start, interval, ClosedWindow::BOTH).empty());

	auto fine = TimeRangeFun::TimeRange("fine", Time::FromString("23:59:59.999999998"),
	                                    Time::FromString("23:59:59.999999999"), Duration::FromString("1ns"),
	                                    ClosedWindow::BOTH);
	REQUIRE(fine.size() == 2);
	REQUIRE(fine.ToString(1) == "23:59:59.999999999");

	// a calendar day never fits inside a single day
	REQUIRE(TimeRangeFun::TimeRange("times", start, end, Duration::FromString("1d"), ClosedWindow::BOTH).size() == 1);
	REQUIRE_THROWS_AS(TimeRangeFun::TimeRange("times", start, end, Duration::FromString("0s"), ClosedWindow::BOTH),
	                  InvalidInputException);

	auto raw = TimeRangeFun::TimeRangeImpl("raw", 0, 3000, Duration::FromString("1us"), ClosedWindow::BOTH);
	REQUIRE(raw.size() == 4);
	REQUIRE(raw.ToString(3) == "00:00:00.000003");
}
