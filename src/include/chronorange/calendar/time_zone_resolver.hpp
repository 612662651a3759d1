//===----------------------------------------------------------------------===//
//                         chronorange
//
// chronorange/calendar/time_zone_resolver.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "chronorange/common/constants.hpp"
#include "chronorange/common/enums/time_unit.hpp"

namespace chronorange {

//! Maps between absolute instants and the wall-clock time of a named time zone.
//! All values are epoch integers in the given unit; a wall-clock time is encoded as if it were a UTC instant.
//! Implementations throw a TimeZoneException for unknown zone ids.
class TimeZoneResolver {
public:
	virtual ~TimeZoneResolver() {
	}

	//! Returns the wall-clock time of the zone at the given instant
	virtual int64_t ToLocal(int64_t instant, TimeUnit unit, const string &tz_id) = 0;
	//! Returns the instant at which the zone shows the given wall-clock time.
	//! Throws a TimeZoneException if the wall-clock time is ambiguous or does not exist in the zone
	virtual int64_t FromLocal(int64_t local, TimeUnit unit, const string &tz_id) = 0;

	virtual string GetName() const = 0;
};

//! A time zone id together with the resolver that interprets it
struct RangeTimeZone {
	RangeTimeZone(TimeZoneResolver &resolver_p, string tz_id_p) : resolver(resolver_p), tz_id(std::move(tz_id_p)) {
	}

	TimeZoneResolver &resolver;
	string tz_id;
};

} // namespace chronorange
