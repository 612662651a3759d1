#include "chronorange/logging/log_storage.hpp"
#include "chronorange/common/types/timestamp.hpp"

#include <iostream>

namespace chronorange {

StdOutLogStorage::StdOutLogStorage() : StdOutLogStorage(std::cout) {
}

StdOutLogStorage::StdOutLogStorage(std::ostream &stream_p) : stream(stream_p) {
}

StdOutLogStorage::~StdOutLogStorage() {
}

void StdOutLogStorage::WriteLogEntry(int64_t timestamp, LogLevel level, const string &log_type,
                                     const string &message) {
	stream << Timestamp::ToString(timestamp, TimeUnit::MICROSECONDS) << "\t" << LogLevelToString(level) << "\t"
	       << log_type << "\t" << message << "\n";
}

void StdOutLogStorage::Flush() {
	stream.flush();
}

InMemoryLogStorage::InMemoryLogStorage() {
}

InMemoryLogStorage::~InMemoryLogStorage() {
}

void InMemoryLogStorage::WriteLogEntry(int64_t timestamp, LogLevel level, const string &log_type,
                                       const string &message) {
	lock_guard<mutex> guard(lock);
	LogEntry entry;
	entry.timestamp = timestamp;
	entry.level = level;
	entry.log_type = log_type;
	entry.message = message;
	entries.push_back(std::move(entry));
}

void InMemoryLogStorage::Flush() {
	// entries are kept in memory, nothing to flush
}

void InMemoryLogStorage::Truncate() {
	lock_guard<mutex> guard(lock);
	entries.clear();
}

vector<LogEntry> InMemoryLogStorage::GetEntries() const {
	lock_guard<mutex> guard(lock);
	return entries;
}

} // namespace chronorange
