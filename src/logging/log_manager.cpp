#include "chronorange/logging/log_manager.hpp"
#include "chronorange/common/exception.hpp"
#include "chronorange/common/helper.hpp"

namespace chronorange {

LogManager::LogManager(LogConfig config_p) : config(std::move(config_p)) {
	global_logger = make_uniq<MutableLogger>(config, *this);
	if (config.storage == LogConfig::STDOUT_STORAGE_NAME) {
		log_storage = make_shared_ptr<StdOutLogStorage>();
	} else {
		log_storage = make_shared_ptr<InMemoryLogStorage>();
		config.storage = LogConfig::IN_MEMORY_STORAGE_NAME;
	}
}

LogManager::~LogManager() {
}

bool LogManager::RegisterLogStorage(const string &name, shared_ptr<LogStorage> storage) {
	unique_lock<mutex> lck(lock);
	auto name_to_lower = StringUtil::Lower(name);
	if (registered_log_storages.find(name_to_lower) != registered_log_storages.end()) {
		return false;
	}
	registered_log_storages.insert(std::make_pair(name_to_lower, std::move(storage)));
	return true;
}

Logger &LogManager::GlobalLogger() {
	return *global_logger;
}

void LogManager::Flush() {
	unique_lock<mutex> lck(lock);
	log_storage->Flush();
}

shared_ptr<LogStorage> LogManager::GetLogStorage() {
	unique_lock<mutex> lck(lock);
	return log_storage;
}

void LogManager::WriteLogEntry(int64_t timestamp, const char *log_type, LogLevel log_level,
                               const char *log_message) {
	unique_lock<mutex> lck(lock);
	log_storage->WriteLogEntry(timestamp, log_level, log_type, log_message);
}

void LogManager::SetEnableLogging(bool enable) {
	unique_lock<mutex> lck(lock);
	config.enabled = enable;
	global_logger->UpdateConfig(config);
}

void LogManager::SetLogLevel(LogLevel level) {
	unique_lock<mutex> lck(lock);
	config.level = level;
	global_logger->UpdateConfig(config);
}

void LogManager::SetLogStorage(const string &storage_name) {
	unique_lock<mutex> lck(lock);
	auto storage_name_to_lower = StringUtil::Lower(storage_name);

	if (config.storage == storage_name_to_lower) {
		return;
	}

	// Flush the old storage, we are going to replace it.
	log_storage->Flush();

	if (storage_name_to_lower == LogConfig::IN_MEMORY_STORAGE_NAME) {
		log_storage = make_shared_ptr<InMemoryLogStorage>();
	} else if (storage_name_to_lower == LogConfig::STDOUT_STORAGE_NAME) {
		log_storage = make_shared_ptr<StdOutLogStorage>();
	} else if (registered_log_storages.find(storage_name_to_lower) != registered_log_storages.end()) {
		log_storage = registered_log_storages[storage_name_to_lower];
	} else {
		throw InvalidInputException("Log storage '%s' is not yet registered", storage_name);
	}
	config.storage = storage_name_to_lower;
}

LogConfig LogManager::GetConfig() {
	unique_lock<mutex> lck(lock);
	return config;
}

} // namespace chronorange
