#include "chronorange/logging/logging.hpp"
#include "chronorange/common/exception.hpp"
#include "chronorange/common/string_util.hpp"

namespace chronorange {

constexpr LogLevel LogConfig::DEFAULT_LOG_LEVEL;
constexpr const char *LogConfig::IN_MEMORY_STORAGE_NAME;
constexpr const char *LogConfig::STDOUT_STORAGE_NAME;
constexpr const char *LogConfig::DEFAULT_LOG_STORAGE;

string LogLevelToString(LogLevel level) {
	switch (level) {
	case LogLevel::LOG_TRACE:
		return "TRACE";
	case LogLevel::LOG_DEBUG:
		return "DEBUG";
	case LogLevel::LOG_INFO:
		return "INFO";
	case LogLevel::LOG_WARN:
		return "WARN";
	case LogLevel::LOG_ERROR:
		return "ERROR";
	case LogLevel::LOG_FATAL:
		return "FATAL";
	default:
		throw InternalException("Unrecognized log level %d", int(level));
	}
}

bool TryGetLogLevel(const string &name_p, LogLevel &result) {
	auto name = StringUtil::Upper(name_p);
	if (name == "TRACE") {
		result = LogLevel::LOG_TRACE;
	} else if (name == "DEBUG") {
		result = LogLevel::LOG_DEBUG;
	} else if (name == "INFO") {
		result = LogLevel::LOG_INFO;
	} else if (name == "WARN" || name == "WARNING") {
		result = LogLevel::LOG_WARN;
	} else if (name == "ERROR") {
		result = LogLevel::LOG_ERROR;
	} else if (name == "FATAL") {
		result = LogLevel::LOG_FATAL;
	} else {
		return false;
	}
	return true;
}

LogConfig::LogConfig() : enabled(false), level(DEFAULT_LOG_LEVEL), storage(DEFAULT_LOG_STORAGE) {
}

LogConfig LogConfig::Create(bool enabled, LogLevel level) {
	return LogConfig(enabled, level, DEFAULT_LOG_STORAGE);
}

LogConfig::LogConfig(bool enabled_p, LogLevel level_p, const string &storage_p)
    : enabled(enabled_p), level(level_p), storage(storage_p) {
}

} // namespace chronorange
