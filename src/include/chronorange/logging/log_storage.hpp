//===----------------------------------------------------------------------===//
//                         chronorange
//
// chronorange/logging/log_storage.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "chronorange/logging/logging.hpp"

#include <ostream>

namespace chronorange {

struct LogEntry {
	//! Microseconds since the epoch
	int64_t timestamp;
	LogLevel level;
	string log_type;
	string message;
};

//! Destination of log entries. Access is serialized by the LogManager
class LogStorage {
public:
	virtual ~LogStorage() {
	}

	virtual void WriteLogEntry(int64_t timestamp, LogLevel level, const string &log_type, const string &message) = 0;
	virtual void Flush() = 0;
	virtual void Truncate() {
	}
};

//! Writes each entry as a tab separated line to a stream (stdout by default)
class StdOutLogStorage : public LogStorage {
public:
	StdOutLogStorage();
	explicit StdOutLogStorage(std::ostream &stream);
	~StdOutLogStorage() override;

	void WriteLogEntry(int64_t timestamp, LogLevel level, const string &log_type, const string &message) override;
	void Flush() override;

private:
	std::ostream &stream;
};

//! Keeps every entry in memory
class InMemoryLogStorage : public LogStorage {
public:
	InMemoryLogStorage();
	~InMemoryLogStorage() override;

	void WriteLogEntry(int64_t timestamp, LogLevel level, const string &log_type, const string &message) override;
	void Flush() override;
	void Truncate() override;

	vector<LogEntry> GetEntries() const;

private:
	mutable mutex lock;
	vector<LogEntry> entries;
};

} // namespace chronorange
