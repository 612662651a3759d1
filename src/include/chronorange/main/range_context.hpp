//===----------------------------------------------------------------------===//
//                         chronorange
//
// chronorange/main/range_context.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "chronorange/calendar/time_zone_resolver.hpp"
#include "chronorange/common/types/temporal_column.hpp"
#include "chronorange/common/types/timestamp.hpp"
#include "chronorange/common/types/duration.hpp"
#include "chronorange/logging/log_manager.hpp"
#include "chronorange/main/config.hpp"
#include "chronorange/main/extension.hpp"

namespace chronorange {

//! The RangeContext holds the configuration, the log manager and the time zone resolver
//! used to generate ranges. Ranges generated through the context use the configured defaults.
class RangeContext {
public:
	explicit RangeContext(RangeConfig config = RangeConfig());
	~RangeContext();

public:
	//! Set, reset or read an option by name
	void SetOption(const string &name, const string &value);
	void ResetOption(const string &name);
	string GetOption(const string &name);
	RangeConfigOptions GetOptions();

	LogManager &GetLogManager();
	Logger &GetLogger();

	//! Register the resolver used for time zone aware ranges, replacing any previous one
	void RegisterTimeZoneResolver(unique_ptr<TimeZoneResolver> resolver);
	optional_ptr<TimeZoneResolver> GetTimeZoneResolver();

	template <class T>
	void LoadExtension() {
		T extension;
		if (IsExtensionLoaded(extension.Name())) {
			return;
		}
		extension.Load(*this);
		SetExtensionLoaded(extension.Name());
	}
	bool IsExtensionLoaded(const string &name);

	//! Date range using the configured unit, closed window and time zone
	TemporalColumn DateRange(const string &name, const datetime_t &start, const datetime_t &end,
	                         const duration_t &interval);
	//! Date range with explicit settings; an empty tz_id generates a naive range
	TemporalColumn DateRange(const string &name, const datetime_t &start, const datetime_t &end,
	                         const duration_t &interval, ClosedWindow closed, TimeUnit unit, const string &tz_id);

	//! Time range using the configured closed window
	TemporalColumn TimeRange(const string &name, dtime_t start, dtime_t end, const duration_t &interval);
	TemporalColumn TimeRange(const string &name, dtime_t start, dtime_t end, const duration_t &interval,
	                         ClosedWindow closed);

private:
	void SetExtensionLoaded(const string &name);

private:
	mutex context_lock;
	RangeConfig config;
	unique_ptr<LogManager> log_manager;
	shared_ptr<TimeZoneResolver> resolver;
	unordered_set<string> loaded_extensions;
};

} // namespace chronorange
