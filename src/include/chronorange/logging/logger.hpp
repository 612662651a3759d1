//===----------------------------------------------------------------------===//
//                         chronorange
//
// chronorange/logging/logger.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "chronorange/common/string_util.hpp"
#include "chronorange/logging/logging.hpp"

#include <atomic>

namespace chronorange {

class LogManager;
class RangeContext;

//! Main logging interface
class Logger {
public:
	explicit Logger(LogManager &manager) : manager(manager) {
	}
	virtual ~Logger() = default;

	//! Main Logger API
	virtual bool ShouldLog(const char *log_type, LogLevel log_level) = 0;
	virtual void WriteLog(const char *log_type, LogLevel log_level, const char *message) = 0;
	void WriteLog(const char *log_type, LogLevel log_level, const string &message);

	//! Format and write a message
	template <typename... ARGS>
	void WriteLog(const char *log_type, LogLevel log_level, const char *format_string, ARGS... params) {
		auto formatted_string = StringUtil::Format(format_string, params...);
		WriteLog(log_type, log_level, formatted_string.c_str());
	}

	virtual void Flush() = 0;

	static Logger &Get(Logger &logger) {
		return logger;
	}
	static Logger &Get(RangeContext &context);

protected:
	LogManager &manager;
};

//! Logger whose config can change at runtime; enabled entries are written to the LogManager's storage
class MutableLogger : public Logger {
public:
	MutableLogger(const LogConfig &config, LogManager &manager);

	bool ShouldLog(const char *log_type, LogLevel log_level) override;
	void WriteLog(const char *log_type, LogLevel log_level, const char *message) override;
	void Flush() override;

	void UpdateConfig(const LogConfig &new_config);

private:
	mutex lock;
	LogConfig config;

	// Atomics for lock-free log setting checks
	std::atomic<bool> enabled;
	std::atomic<LogLevel> level;
};

} // namespace chronorange

#define CHRONORANGE_LOG_INTERNAL(SOURCE, TYPE, LEVEL, ...)                                                             \
	{                                                                                                                  \
		auto &logger_ref = chronorange::Logger::Get(SOURCE);                                                           \
		if (logger_ref.ShouldLog(TYPE, LEVEL)) {                                                                       \
			logger_ref.WriteLog(TYPE, LEVEL, __VA_ARGS__);                                                             \
		}                                                                                                              \
	}

#define CHRONORANGE_LOG_TRACE(SOURCE, ...)                                                                             \
	CHRONORANGE_LOG_INTERNAL(SOURCE, "chronorange", chronorange::LogLevel::LOG_TRACE, __VA_ARGS__)
#define CHRONORANGE_LOG_DEBUG(SOURCE, ...)                                                                             \
	CHRONORANGE_LOG_INTERNAL(SOURCE, "chronorange", chronorange::LogLevel::LOG_DEBUG, __VA_ARGS__)
#define CHRONORANGE_LOG_INFO(SOURCE, ...)                                                                              \
	CHRONORANGE_LOG_INTERNAL(SOURCE, "chronorange", chronorange::LogLevel::LOG_INFO, __VA_ARGS__)
#define CHRONORANGE_LOG_WARN(SOURCE, ...)                                                                              \
	CHRONORANGE_LOG_INTERNAL(SOURCE, "chronorange", chronorange::LogLevel::LOG_WARN, __VA_ARGS__)
#define CHRONORANGE_LOG_ERROR(SOURCE, ...)                                                                             \
	CHRONORANGE_LOG_INTERNAL(SOURCE, "chronorange", chronorange::LogLevel::LOG_ERROR, __VA_ARGS__)
