#include "chronorange/common/enums/time_unit.hpp"
#include "chronorange/common/exception.hpp"
#include "chronorange/common/string_util.hpp"

namespace chronorange {

string TimeUnitToString(TimeUnit unit) {
	switch (unit) {
	case TimeUnit::NANOSECONDS:
		return "ns";
	case TimeUnit::MICROSECONDS:
		return "us";
	case TimeUnit::MILLISECONDS:
		return "ms";
	default:
		throw InternalException("Unrecognized time unit %d", int(unit));
	}
}

bool TryGetTimeUnit(const string &name_p, TimeUnit &result) {
	auto name = StringUtil::Lower(name_p);
	if (name == "ns" || name == "nanoseconds" || name == "nanosecond") {
		result = TimeUnit::NANOSECONDS;
	} else if (name == "us" || name == "microseconds" || name == "microsecond") {
		result = TimeUnit::MICROSECONDS;
	} else if (name == "ms" || name == "milliseconds" || name == "millisecond") {
		result = TimeUnit::MILLISECONDS;
	} else {
		return false;
	}
	return true;
}

TimeUnit TimeUnitFromString(const string &name) {
	TimeUnit result;
	if (!TryGetTimeUnit(name, result)) {
		throw InvalidInputException("time unit \"%s\" not recognized, expected one of ns, us, ms", name);
	}
	return result;
}

int64_t TimeUnitsPerSecond(TimeUnit unit) {
	switch (unit) {
	case TimeUnit::NANOSECONDS:
		return 1000000000;
	case TimeUnit::MICROSECONDS:
		return 1000000;
	case TimeUnit::MILLISECONDS:
		return 1000;
	default:
		throw InternalException("Unrecognized time unit %d", int(unit));
	}
}

int64_t NanosPerTimeUnit(TimeUnit unit) {
	switch (unit) {
	case TimeUnit::NANOSECONDS:
		return 1;
	case TimeUnit::MICROSECONDS:
		return 1000;
	case TimeUnit::MILLISECONDS:
		return 1000000;
	default:
		throw InternalException("Unrecognized time unit %d", int(unit));
	}
}

} // namespace chronorange
