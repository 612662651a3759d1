#include "chronorange/main/range_context.hpp"
#include "chronorange/common/exception.hpp"
#include "chronorange/common/helper.hpp"
#include "chronorange/function/date_range.hpp"
#include "chronorange/logging/logger.hpp"

namespace chronorange {

RangeContext::RangeContext(RangeConfig config_p) : config(std::move(config_p)) {
	log_manager = make_uniq<LogManager>(config.options.log_config);
}

RangeContext::~RangeContext() {
}

static const ConfigurationOption &GetContextOption(const string &name) {
	auto option = RangeConfig::GetOptionByName(name);
	if (!option) {
		throw InvalidInputException("Unrecognized configuration option \"%s\", available options: %s", name,
		                            StringUtil::Join(RangeConfig::GetOptionNames(), ", "));
	}
	return *option;
}

void RangeContext::SetOption(const string &name, const string &value) {
	auto &option = GetContextOption(name);
	lock_guard<mutex> guard(context_lock);
	config.SetOption(this, option, value);
}

void RangeContext::ResetOption(const string &name) {
	auto &option = GetContextOption(name);
	lock_guard<mutex> guard(context_lock);
	config.ResetOption(this, option);
}

string RangeContext::GetOption(const string &name) {
	lock_guard<mutex> guard(context_lock);
	return config.GetOptionValue(name);
}

RangeConfigOptions RangeContext::GetOptions() {
	lock_guard<mutex> guard(context_lock);
	return config.options;
}

LogManager &RangeContext::GetLogManager() {
	return *log_manager;
}

Logger &RangeContext::GetLogger() {
	return log_manager->GlobalLogger();
}

void RangeContext::RegisterTimeZoneResolver(unique_ptr<TimeZoneResolver> resolver_p) {
	if (!resolver_p) {
		throw InvalidInputException("Cannot register an empty time zone resolver");
	}
	auto name = resolver_p->GetName();
	{
		lock_guard<mutex> guard(context_lock);
		resolver = shared_ptr<TimeZoneResolver>(std::move(resolver_p));
	}
	CHRONORANGE_LOG_INFO(*this, "Registered time zone resolver \"%s\"", name);
}

optional_ptr<TimeZoneResolver> RangeContext::GetTimeZoneResolver() {
	lock_guard<mutex> guard(context_lock);
	return resolver.get();
}

bool RangeContext::IsExtensionLoaded(const string &name) {
	lock_guard<mutex> guard(context_lock);
	return loaded_extensions.find(name) != loaded_extensions.end();
}

void RangeContext::SetExtensionLoaded(const string &name) {
	{
		lock_guard<mutex> guard(context_lock);
		loaded_extensions.insert(name);
	}
	CHRONORANGE_LOG_INFO(*this, "Loaded extension \"%s\"", name);
}

TemporalColumn RangeContext::DateRange(const string &name, const datetime_t &start, const datetime_t &end,
                                       const duration_t &interval) {
	auto options = GetOptions();
	return DateRange(name, start, end, interval, options.closed, options.time_unit, options.time_zone);
}

TemporalColumn RangeContext::DateRange(const string &name, const datetime_t &start, const datetime_t &end,
                                       const duration_t &interval, ClosedWindow closed, TimeUnit unit,
                                       const string &tz_id) {
	auto &logger = GetLogger();
	if (tz_id.empty()) {
		auto result = DateRangeFun::DateRange(name, start, end, interval, closed, unit, nullptr, logger);
		CHRONORANGE_LOG_INFO(logger, "date_range \"%s\" from %s to %s every %s produced %d values", name,
		                     Timestamp::ToString(start), Timestamp::ToString(end), Duration::ToString(interval),
		                     result.size());
		return result;
	}

	// keep the resolver alive while the range is generated, even if another one gets registered
	shared_ptr<TimeZoneResolver> tz_resolver;
	{
		lock_guard<mutex> guard(context_lock);
		tz_resolver = resolver;
	}
	if (!tz_resolver) {
		throw InvalidInputException("Time zone \"%s\" was requested but no time zone resolver is registered, load "
		                            "the ICU extension or register a resolver first",
		                            tz_id);
	}
	RangeTimeZone tz(*tz_resolver, tz_id);
	auto result = DateRangeFun::DateRange(name, start, end, interval, closed, unit, &tz, logger);
	CHRONORANGE_LOG_INFO(logger, "date_range \"%s\" from %s to %s every %s in time zone %s produced %d values", name,
	                     Timestamp::ToString(start), Timestamp::ToString(end), Duration::ToString(interval), tz_id,
	                     result.size());
	return result;
}

TemporalColumn RangeContext::TimeRange(const string &name, dtime_t start, dtime_t end, const duration_t &interval) {
	return TimeRange(name, start, end, interval, GetOptions().closed);
}

TemporalColumn RangeContext::TimeRange(const string &name, dtime_t start, dtime_t end, const duration_t &interval,
                                       ClosedWindow closed) {
	auto &logger = GetLogger();
	auto result = TimeRangeFun::TimeRange(name, start, end, interval, closed, logger);
	CHRONORANGE_LOG_INFO(logger, "time_range \"%s\" from %s to %s every %s produced %d values", name,
	                     Time::ToString(start), Time::ToString(end), Duration::ToString(interval), result.size());
	return result;
}

} // namespace chronorange
