//===----------------------------------------------------------------------===//
//                         chronorange
//
// chronorange/main/settings.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "chronorange/main/config.hpp"

namespace chronorange {

//===----------------------------------------------------------------------===//
// This file contains the settings that can be set by name on a RangeConfig
//===----------------------------------------------------------------------===//

struct ClosedSetting {
	static constexpr const char *Name = "closed";
	static constexpr const char *Description = "Which bounds of a range are included (both, left, right, none)";
	static constexpr const char *InputType = "VARCHAR";
	static void SetGlobal(optional_ptr<RangeContext> context, RangeConfig &config, const string &input);
	static void ResetGlobal(optional_ptr<RangeContext> context, RangeConfig &config);
	static string GetSetting(const RangeConfig &config);
};

struct EnableLoggingSetting {
	static constexpr const char *Name = "enable_logging";
	static constexpr const char *Description = "Enables the logger";
	static constexpr const char *InputType = "BOOLEAN";
	static void SetGlobal(optional_ptr<RangeContext> context, RangeConfig &config, const string &input);
	static void ResetGlobal(optional_ptr<RangeContext> context, RangeConfig &config);
	static string GetSetting(const RangeConfig &config);
};

struct LoggingLevelSetting {
	static constexpr const char *Name = "logging_level";
	static constexpr const char *Description = "The log level which will be recorded in the log";
	static constexpr const char *InputType = "VARCHAR";
	static void SetGlobal(optional_ptr<RangeContext> context, RangeConfig &config, const string &input);
	static void ResetGlobal(optional_ptr<RangeContext> context, RangeConfig &config);
	static string GetSetting(const RangeConfig &config);
};

struct LoggingStorageSetting {
	static constexpr const char *Name = "logging_storage";
	static constexpr const char *Description = "Set the logging storage (memory/stdout)";
	static constexpr const char *InputType = "VARCHAR";
	static void SetGlobal(optional_ptr<RangeContext> context, RangeConfig &config, const string &input);
	static void ResetGlobal(optional_ptr<RangeContext> context, RangeConfig &config);
	static string GetSetting(const RangeConfig &config);
};

struct TimeUnitSetting {
	static constexpr const char *Name = "time_unit";
	static constexpr const char *Description = "The unit of generated datetime values (ns, us, ms)";
	static constexpr const char *InputType = "VARCHAR";
	static void SetGlobal(optional_ptr<RangeContext> context, RangeConfig &config, const string &input);
	static void ResetGlobal(optional_ptr<RangeContext> context, RangeConfig &config);
	static string GetSetting(const RangeConfig &config);
};

struct TimeZoneSetting {
	static constexpr const char *Name = "timezone";
	static constexpr const char *Description = "The time zone calendar steps are resolved in";
	static constexpr const char *InputType = "VARCHAR";
	static void SetGlobal(optional_ptr<RangeContext> context, RangeConfig &config, const string &input);
	static void ResetGlobal(optional_ptr<RangeContext> context, RangeConfig &config);
	static string GetSetting(const RangeConfig &config);
};

} // namespace chronorange
