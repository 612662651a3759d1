#include "catch.hpp"
#include "chronorange/common/exception.hpp"
#include "chronorange/common/limits.hpp"
#include "chronorange/common/types/duration.hpp"

using namespace chronorange;
using namespace std;

TEST_CASE("Parse durations", "[duration]") {
	REQUIRE(Duration::FromString("1d") == duration_t(0, 0, 1, 0));
	REQUIRE(Duration::FromString("3mo") == duration_t(3, 0, 0, 0));
	REQUIRE(Duration::FromString("2w") == duration_t(0, 2, 0, 0));
	REQUIRE(Duration::FromString("1q") == duration_t(3, 0, 0, 0));
	REQUIRE(Duration::FromString("2y") == duration_t(24, 0, 0, 0));
	REQUIRE(Duration::FromString("1h30m") == duration_t(0, 0, 0, 90 * Duration::NANOS_PER_MINUTE));
	REQUIRE(Duration::FromString("1s500ms") == duration_t(0, 0, 0, 1500 * Duration::NANOS_PER_MSEC));
	REQUIRE(Duration::FromString("10us5ns") == duration_t(0, 0, 0, 10005));
	REQUIRE(Duration::FromString("-2w") == duration_t(0, 2, 0, 0, true));
	// repeated units accumulate
	REQUIRE(Duration::FromString("1d1d") == duration_t(0, 0, 2, 0));
	REQUIRE(Duration::FromString("1y1mo1d") == duration_t(13, 0, 1, 0));
}

TEST_CASE("Reject malformed durations", "[duration]") {
	vector<string> invalid = {"", "-", "5", "d", "1x", "1.5h", "1d-2h", "1 d", "1D", "1mon", "+1d"};
	for (auto &str : invalid) {
		duration_t result;
		string error;
		REQUIRE(!Duration::TryFromString(str, result, &error));
		REQUIRE(!error.empty());
		REQUIRE_THROWS_AS(Duration::FromString(str), ConversionException);
	}
	// overflowing numbers or components
	REQUIRE_THROWS_AS(Duration::FromString("99999999999999999999ns"), ConversionException);
	REQUIRE_THROWS_AS(Duration::FromString("9999999999999h"), ConversionException);
}

TEST_CASE("Render durations", "[duration]") {
	REQUIRE(Duration::ToString(duration_t()) == "0s");
	REQUIRE(Duration::ToString(Duration::FromString("1d")) == "1d");
	REQUIRE(Duration::ToString(Duration::FromString("14mo")) == "1y2mo");
	REQUIRE(Duration::ToString(Duration::FromString("90m")) == "1h30m");
	REQUIRE(Duration::ToString(Duration::FromString("-2w")) == "-2w");
	REQUIRE(Duration::ToString(Duration::FromString("1y2mo3w4d5h6m7s8ms9us10ns")) == "1y2mo3w4d5h6m7s8ms9us10ns");
	// the canonical form parses back to the same duration
	auto duration = Duration::FromString("3q10d36h");
	REQUIRE(Duration::FromString(Duration::ToString(duration)) == duration);
}

TEST_CASE("Duration predicates and constructors", "[duration]") {
	REQUIRE(Duration::IsZero(duration_t()));
	REQUIRE(Duration::IsZero(Duration::FromString("0d")));
	REQUIRE(!Duration::IsZero(Duration::FromString("1ns")));

	REQUIRE(Duration::IsFixed(Duration::FromString("25h")));
	REQUIRE(!Duration::IsFixed(Duration::FromString("1d")));
	REQUIRE(!Duration::IsFixed(Duration::FromString("1w")));
	REQUIRE(!Duration::IsFixed(Duration::FromString("1mo1ns")));

	REQUIRE(Duration::FromNanos(-5) == duration_t(0, 0, 0, 5, true));
	REQUIRE(Duration::FromDays(3) == duration_t(0, 0, 3, 0));
	REQUIRE(Duration::FromWeeks(-1) == duration_t(0, 1, 0, 0, true));
	REQUIRE(Duration::FromMonths(12) == Duration::FromString("1y"));
}

TEST_CASE("Multiply durations", "[duration]") {
	auto duration = Duration::FromString("1mo1w1d1h");
	REQUIRE(Duration::Multiply(duration, 3) == duration_t(3, 3, 3, 3 * Duration::NANOS_PER_HOUR));
	REQUIRE(Duration::Multiply(duration, 0) == duration_t());
	REQUIRE(Duration::Multiply(duration, -2) == duration_t(2, 2, 2, 2 * Duration::NANOS_PER_HOUR, true));
	REQUIRE(Duration::Multiply(Duration::FromString("-1d"), -1) == Duration::FromString("1d"));

	REQUIRE_THROWS_AS(Duration::Multiply(Duration::FromString("1h"), NumericLimits<int64_t>::Maximum()),
	                  OutOfRangeException);
}

TEST_CASE("Fixed component and estimates", "[duration]") {
	auto duration = Duration::FromString("1h1500ns");
	REQUIRE(Duration::GetFixedInUnit(duration, TimeUnit::NANOSECONDS) == Duration::NANOS_PER_HOUR + 1500);
	REQUIRE(Duration::GetFixedInUnit(duration, TimeUnit::MICROSECONDS) == 3600000000LL + 1);
	REQUIRE(Duration::GetFixedInUnit(duration, TimeUnit::MILLISECONDS) == 3600000);
	REQUIRE(Duration::GetFixedInUnit(Duration::FromString("-1s"), TimeUnit::MILLISECONDS) == -1000);

	int64_t estimate;
	REQUIRE(Duration::TryGetEstimate(Duration::FromString("1mo"), TimeUnit::MILLISECONDS, estimate));
	REQUIRE(estimate == 28LL * 24 * 3600 * 1000);
	REQUIRE(Duration::TryGetEstimate(Duration::FromString("1w1d1h"), TimeUnit::MICROSECONDS, estimate));
	REQUIRE(estimate == (8LL * 24 + 1) * 3600 * 1000000);
	REQUIRE(!Duration::TryGetEstimate(Duration::FromString("1000y"), TimeUnit::NANOSECONDS, estimate));
}
