//===----------------------------------------------------------------------===//
//                         chronorange
//
// chronorange/logging/log_manager.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "chronorange/logging/logger.hpp"
#include "chronorange/logging/log_storage.hpp"

namespace chronorange {

//! The LogManager holds the log configuration and routes entries of its loggers to the active log storage
class LogManager {
	friend class MutableLogger;

public:
	explicit LogManager(LogConfig config = LogConfig());
	~LogManager();

	//! The logger shared by everything owned by the same context
	Logger &GlobalLogger();

	void Flush();
	shared_ptr<LogStorage> GetLogStorage();

	//! Make a storage selectable by name through SetLogStorage
	bool RegisterLogStorage(const string &name, shared_ptr<LogStorage> storage);

	void SetEnableLogging(bool enable);
	void SetLogLevel(LogLevel level);
	void SetLogStorage(const string &storage_name);

	LogConfig GetConfig();

protected:
	void WriteLogEntry(int64_t timestamp, const char *log_type, LogLevel log_level, const char *log_message);

private:
	mutex lock;
	LogConfig config;

	unique_ptr<MutableLogger> global_logger;
	shared_ptr<LogStorage> log_storage;
	unordered_map<string, shared_ptr<LogStorage>> registered_log_storages;
};

} // namespace chronorange
