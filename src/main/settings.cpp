#include "chronorange/main/settings.hpp"
#include "chronorange/common/exception.hpp"
#include "chronorange/common/string_util.hpp"
#include "chronorange/main/range_context.hpp"

namespace chronorange {

static string TrimInput(string input) {
	StringUtil::Trim(input);
	return input;
}

static bool ParseBooleanSetting(const char *name, const string &input) {
	auto value = StringUtil::Lower(TrimInput(input));
	if (value == "true" || value == "1" || value == "on") {
		return true;
	}
	if (value == "false" || value == "0" || value == "off") {
		return false;
	}
	throw InvalidInputException("Invalid value \"%s\" for option \"%s\", expected a boolean", input, name);
}

//===----------------------------------------------------------------------===//
// Closed
//===----------------------------------------------------------------------===//
void ClosedSetting::SetGlobal(optional_ptr<RangeContext> context, RangeConfig &config, const string &input) {
	config.options.closed = ClosedWindowFromString(TrimInput(input));
}

void ClosedSetting::ResetGlobal(optional_ptr<RangeContext> context, RangeConfig &config) {
	config.options.closed = RangeConfigOptions().closed;
}

string ClosedSetting::GetSetting(const RangeConfig &config) {
	return ClosedWindowToString(config.options.closed);
}

//===----------------------------------------------------------------------===//
// Enable Logging
//===----------------------------------------------------------------------===//
void EnableLoggingSetting::SetGlobal(optional_ptr<RangeContext> context, RangeConfig &config, const string &input) {
	auto enabled = ParseBooleanSetting(Name, input);
	config.options.log_config.enabled = enabled;
	if (context) {
		context->GetLogManager().SetEnableLogging(enabled);
	}
}

void EnableLoggingSetting::ResetGlobal(optional_ptr<RangeContext> context, RangeConfig &config) {
	config.options.log_config.enabled = LogConfig().enabled;
	if (context) {
		context->GetLogManager().SetEnableLogging(config.options.log_config.enabled);
	}
}

string EnableLoggingSetting::GetSetting(const RangeConfig &config) {
	return config.options.log_config.enabled ? "true" : "false";
}

//===----------------------------------------------------------------------===//
// Logging Level
//===----------------------------------------------------------------------===//
void LoggingLevelSetting::SetGlobal(optional_ptr<RangeContext> context, RangeConfig &config, const string &input) {
	LogLevel level;
	if (!TryGetLogLevel(TrimInput(input), level)) {
		throw InvalidInputException("Invalid value \"%s\" for option \"%s\", expected one of TRACE, DEBUG, INFO, "
		                            "WARN, ERROR, FATAL",
		                            input, Name);
	}
	config.options.log_config.level = level;
	if (context) {
		context->GetLogManager().SetLogLevel(level);
	}
}

void LoggingLevelSetting::ResetGlobal(optional_ptr<RangeContext> context, RangeConfig &config) {
	config.options.log_config.level = LogConfig::DEFAULT_LOG_LEVEL;
	if (context) {
		context->GetLogManager().SetLogLevel(config.options.log_config.level);
	}
}

string LoggingLevelSetting::GetSetting(const RangeConfig &config) {
	return LogLevelToString(config.options.log_config.level);
}

//===----------------------------------------------------------------------===//
// Logging Storage
//===----------------------------------------------------------------------===//
void LoggingStorageSetting::SetGlobal(optional_ptr<RangeContext> context, RangeConfig &config, const string &input) {
	auto storage = StringUtil::Lower(TrimInput(input));
	if (context) {
		// the log manager also knows storages registered at runtime
		context->GetLogManager().SetLogStorage(storage);
	} else if (storage != LogConfig::IN_MEMORY_STORAGE_NAME && storage != LogConfig::STDOUT_STORAGE_NAME) {
		throw InvalidInputException("Invalid value \"%s\" for option \"%s\", expected one of memory, stdout", input,
		                            Name);
	}
	config.options.log_config.storage = storage;
}

void LoggingStorageSetting::ResetGlobal(optional_ptr<RangeContext> context, RangeConfig &config) {
	config.options.log_config.storage = LogConfig::DEFAULT_LOG_STORAGE;
	if (context) {
		context->GetLogManager().SetLogStorage(config.options.log_config.storage);
	}
}

string LoggingStorageSetting::GetSetting(const RangeConfig &config) {
	return config.options.log_config.storage;
}

//===----------------------------------------------------------------------===//
// Time Unit
//===----------------------------------------------------------------------===//
void TimeUnitSetting::SetGlobal(optional_ptr<RangeContext> context, RangeConfig &config, const string &input) {
	config.options.time_unit = TimeUnitFromString(TrimInput(input));
}

void TimeUnitSetting::ResetGlobal(optional_ptr<RangeContext> context, RangeConfig &config) {
	config.options.time_unit = RangeConfigOptions().time_unit;
}

string TimeUnitSetting::GetSetting(const RangeConfig &config) {
	return TimeUnitToString(config.options.time_unit);
}

//===----------------------------------------------------------------------===//
// Time Zone
//===----------------------------------------------------------------------===//
void TimeZoneSetting::SetGlobal(optional_ptr<RangeContext> context, RangeConfig &config, const string &input) {
	config.options.time_zone = TrimInput(input);
}

void TimeZoneSetting::ResetGlobal(optional_ptr<RangeContext> context, RangeConfig &config) {
	config.options.time_zone = string();
}

string TimeZoneSetting::GetSetting(const RangeConfig &config) {
	return config.options.time_zone;
}

} // namespace chronorange
