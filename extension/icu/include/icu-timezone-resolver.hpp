//===----------------------------------------------------------------------===//
//                         chronorange
//
// icu-timezone-resolver.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "chronorange/calendar/time_zone_resolver.hpp"
#include "chronorange/common/optional_ptr.hpp"
#include "chronorange/logging/logger.hpp"
#include "unicode/timezone.h"

namespace chronorange {

//! Resolves wall-clock times with the ICU time zone database.
//! Zones are created on first use and cached; a single resolver can be shared between threads
class ICUTimeZoneResolver : public TimeZoneResolver {
public:
	explicit ICUTimeZoneResolver(optional_ptr<Logger> logger = nullptr);
	~ICUTimeZoneResolver() override;

	int64_t ToLocal(int64_t instant, TimeUnit unit, const string &tz_id) override;
	int64_t FromLocal(int64_t local, TimeUnit unit, const string &tz_id) override;

	string GetName() const override {
		return "icu";
	}

	//! Total offset from UTC (raw offset plus daylight saving) in milliseconds at the given instant
	int32_t GetOffset(const string &tz_id, int64_t millis);

private:
	icu::TimeZone &GetTimeZone(const string &tz_id);

private:
	mutex lock;
	unordered_map<string, unique_ptr<icu::TimeZone>> zones;
	optional_ptr<Logger> logger;
};

} // namespace chronorange
