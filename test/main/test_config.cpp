#include "catch.hpp"
#include "test_helpers.hpp"

using namespace chronorange;
using namespace std;

TEST_CASE("Configuration defaults", "[config]") {
	RangeConfig config;
	REQUIRE(RangeConfig::GetOptionCount() == 6);
	REQUIRE(RangeConfig::GetOptionNames().size() == 6);
	REQUIRE(config.GetOptionValue("time_unit") == "us");
	REQUIRE(config.GetOptionValue("closed") == "both");
	REQUIRE(config.GetOptionValue("timezone") == "");
	REQUIRE(config.GetOptionValue("enable_logging") == "false");
	REQUIRE(config.GetOptionValue("logging_level") == "INFO");
	REQUIRE(config.GetOptionValue("logging_storage") == "memory");

	REQUIRE(RangeConfig::GetOptionByName("TIME_UNIT"));
	REQUIRE(!RangeConfig::GetOptionByName("threads"));
}

TEST_CASE("Set and reset options by name", "[config]") {
	RangeConfig config;
	config.SetOptionByName("Time_Unit", "milliseconds");
	REQUIRE(config.options.time_unit == TimeUnit::MILLISECONDS);
	REQUIRE(config.GetOptionValue("time_unit") == "ms");
	config.SetOptionByName("closed", " LEFT ");
	REQUIRE(config.options.closed == ClosedWindow::LEFT);
	config.SetOptionByName("timezone", "Europe/Amsterdam");
	REQUIRE(config.options.time_zone == "Europe/Amsterdam");
	// surrounding whitespace is trimmed, trailing UTF-8 bytes are kept
	config.SetOptionByName("timezone", " Test/Z\xC3\xBC\n");
	REQUIRE(config.options.time_zone == "Test/Z\xC3\xBC");
	config.SetOptionByName("timezone", "Europe/Amsterdam");
	config.SetOptionByName("enable_logging", "on");
	REQUIRE(config.options.log_config.enabled);
	config.SetOptionByName("logging_level", "trace");
	REQUIRE(config.options.log_config.level == LogLevel::LOG_TRACE);
	config.SetOptionByName("logging_storage", "STDOUT");
	REQUIRE(config.options.log_config.storage == "stdout");

	config.ResetOptionByName("time_unit");
	config.ResetOptionByName("CLOSED");
	config.ResetOptionByName("timezone");
	config.ResetOptionByName("enable_logging");
	REQUIRE(config.options.time_unit == TimeUnit::MICROSECONDS);
	REQUIRE(config.options.closed == ClosedWindow::BOTH);
	REQUIRE(config.options.time_zone.empty());
	REQUIRE(!config.options.log_config.enabled);

	unordered_map<string, string> values;
	values["time_unit"] = "ns";
	values["closed"] = "none";
	config.SetOptionsByName(values);
	REQUIRE(config.options.time_unit == TimeUnit::NANOSECONDS);
	REQUIRE(config.options.closed == ClosedWindow::NONE);
}

TEST_CASE("Invalid options are rejected", "[config]") {
	RangeConfig config;
	REQUIRE_THROWS_AS(config.SetOptionByName("threads", "4"), InvalidInputException);
	REQUIRE_THROWS_AS(config.ResetOptionByName("threads"), InvalidInputException);
	REQUIRE_THROWS_AS(config.GetOptionValue("threads"), InvalidInputException);
	REQUIRE_THROWS_AS(config.SetOptionByName("time_unit", "minutes"), InvalidInputException);
	REQUIRE_THROWS_AS(config.SetOptionByName("closed", "both_sides"), InvalidInputException);
	REQUIRE_THROWS_AS(config.SetOptionByName("enable_logging", "maybe"), InvalidInputException);
	REQUIRE_THROWS_AS(config.SetOptionByName("logging_level", "loud"), InvalidInputException);
	REQUIRE_THROWS_AS(config.SetOptionByName("logging_storage", "file"), InvalidInputException);
	// failed updates leave the option untouched
	REQUIRE(config.options.time_unit == TimeUnit::MICROSECONDS);
	REQUIRE(config.options.closed == ClosedWindow::BOTH);
}

TEST_CASE("Range contexts apply their configuration", "[config]") {
	RangeConfig config;
	config.SetOptionByName("closed", "left");
	config.SetOptionByName("time_unit", "ms");
	RangeContext context(config);
	REQUIRE(context.GetOption("closed") == "left");

	auto column = context.DateRange("d", Timestamp::FromString("2021-01-01"), Timestamp::FromString("2021-01-04"),
	                                Duration::FromString("1d"));
	REQUIRE(column.GetTimeUnit() == TimeUnit::MILLISECONDS);
	REQUIRE(column.size() == 3);
	REQUIRE(column.GetValue(2) == TestTimestamp("2021-01-03", TimeUnit::MILLISECONDS));

	context.SetOption("closed", "both");
	REQUIRE(context.GetOptions().closed == ClosedWindow::BOTH);
	REQUIRE(context.TimeRange("t", Time::FromString("00:00"), Time::FromString("00:02"), Duration::FromString("1m"))
	            .size() == 3);
	context.ResetOption("time_unit");
	REQUIRE(context.GetOption("time_unit") == "us");
	REQUIRE_THROWS_AS(context.SetOption("threads", "4"), InvalidInputException);

	// logging options are forwarded to the log manager
	context.SetOption("enable_logging", "true");
	context.SetOption("logging_level", "error");
	auto log_config = context.GetLogManager().GetConfig();
	REQUIRE(log_config.enabled);
	REQUIRE(log_config.level == LogLevel::LOG_ERROR);
	context.SetOption("logging_storage", "stdout");
	REQUIRE(context.GetLogManager().GetConfig().storage == "stdout");
	REQUIRE_THROWS_AS(context.SetOption("logging_storage", "file"), InvalidInputException);
	context.ResetOption("logging_storage");
	REQUIRE(context.GetLogManager().GetConfig().storage == "memory");
}

class TestExtension : public Extension {
public:
	void Load(RangeContext &context) override {
		context.RegisterTimeZoneResolver(make_uniq<TestTimeZoneResolver>());
	}
	string Name() override {
		return "test";
	}
};

TEST_CASE("Time zones need a registered resolver", "[config]") {
	RangeContext context;
	auto start = Timestamp::FromString("2021-03-27");
	auto end = Timestamp::FromString("2021-03-29");
	auto interval = Duration::FromString("1d");
	REQUIRE(!context.GetTimeZoneResolver());
	REQUIRE_THROWS_AS(context.DateRange("d", start, end, interval, ClosedWindow::BOTH, TimeUnit::MICROSECONDS,
	                                    "Test/DST"),
	                  InvalidInputException);
	REQUIRE_THROWS_AS(context.RegisterTimeZoneResolver(nullptr), InvalidInputException);

	REQUIRE(!context.IsExtensionLoaded("test"));
	context.LoadExtension<TestExtension>();
	REQUIRE(context.IsExtensionLoaded("test"));
	auto resolver = context.GetTimeZoneResolver();
	REQUIRE(resolver);
	REQUIRE(resolver->GetName() == "test");
	// loading twice keeps the registered resolver
	context.LoadExtension<TestExtension>();
	REQUIRE(context.GetTimeZoneResolver().get() == resolver.get());

	auto column = context.DateRange("d", start, end, interval, ClosedWindow::BOTH, TimeUnit::MICROSECONDS,
	                                "Test/DST");
	REQUIRE(column.GetTimeZone() == "Test/DST");
	REQUIRE(column.size() == 3);
	REQUIRE(column.GetValue(2) == TestTimestamp("2021-03-28 23:00:00"));

	// the configured time zone is used by default
	context.SetOption("timezone", "Test/Plus2");
	auto plus2 = context.DateRange("d", Timestamp::FromString("2021-01-31"), Timestamp::FromString("2021-03-31"),
	                               Duration::FromString("1mo"));
	REQUIRE(plus2.GetTimeZone() == "Test/Plus2");
	REQUIRE(plus2.size() == 3);
	REQUIRE(plus2.GetValue(1) == TestTimestamp("2021-02-28"));

	context.SetOption("timezone", "Test/Unknown");
	REQUIRE_THROWS_AS(context.DateRange("d", start, end, interval), TimeZoneException);
}
