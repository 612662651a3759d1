#include "chronorange/logging/logger.hpp"
#include "chronorange/logging/log_manager.hpp"
#include "chronorange/main/range_context.hpp"

#include <chrono>

namespace chronorange {

static int64_t GetCurrentMicros() {
	auto now = std::chrono::system_clock::now();
	return std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
}

void Logger::WriteLog(const char *log_type, LogLevel log_level, const string &message) {
	WriteLog(log_type, log_level, message.c_str());
}

Logger &Logger::Get(RangeContext &context) {
	return context.GetLogger();
}

MutableLogger::MutableLogger(const LogConfig &config_p, LogManager &manager) : Logger(manager), config(config_p) {
	enabled = config.enabled;
	level = config.level;
}

void MutableLogger::UpdateConfig(const LogConfig &new_config) {
	unique_lock<mutex> lck(lock);
	config = new_config;

	// Update atomics for lock-free access
	enabled = config.enabled;
	level = config.level;
}

void MutableLogger::WriteLog(const char *log_type, LogLevel log_level, const char *log_message) {
	manager.WriteLogEntry(GetCurrentMicros(), log_type, log_level, log_message);
}

bool MutableLogger::ShouldLog(const char *log_type, LogLevel log_level) {
	if (!enabled) {
		return false;
	}
	return level <= log_level;
}

void MutableLogger::Flush() {
	manager.Flush();
}

} // namespace chronorange
