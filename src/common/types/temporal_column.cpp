#include "chronorange/common/types/temporal_column.hpp"
#include "chronorange/common/exception.hpp"
#include "chronorange/common/types/time.hpp"
#include "chronorange/common/types/timestamp.hpp"

namespace chronorange {

string TemporalTypeToString(TemporalType type) {
	switch (type) {
	case TemporalType::DATETIME:
		return "DATETIME";
	case TemporalType::TIME:
		return "TIME";
	default:
		throw InternalException("Unrecognized temporal type %d", int(type));
	}
}

string SortedFlagToString(SortedFlag flag) {
	switch (flag) {
	case SortedFlag::NOT_SORTED:
		return "NOT_SORTED";
	case SortedFlag::ASCENDING:
		return "ASCENDING";
	case SortedFlag::DESCENDING:
		return "DESCENDING";
	default:
		throw InternalException("Unrecognized sorted flag %d", int(flag));
	}
}

TemporalColumn::TemporalColumn(string name_p, TemporalType type_p, TimeUnit unit_p, string time_zone_p,
                               vector<int64_t> data_p)
    : name(std::move(name_p)), type(type_p), unit(unit_p), time_zone(std::move(time_zone_p)),
      data(std::move(data_p)), sorted(SortedFlag::NOT_SORTED) {
}

int64_t TemporalColumn::GetValue(idx_t row) const {
	if (row >= data.size()) {
		throw OutOfRangeException("Row %d is out of range for column \"%s\" of size %d", row, name, data.size());
	}
	return data[row];
}

string TemporalColumn::ToString(idx_t row) const {
	auto value = GetValue(row);
	switch (type) {
	case TemporalType::DATETIME:
		return Timestamp::ToString(value, unit);
	case TemporalType::TIME:
		return Time::ToString(dtime_t(Timestamp::ConvertUnit(value, unit, TimeUnit::NANOSECONDS)));
	default:
		throw InternalException("Unrecognized temporal type %d", int(type));
	}
}

string TemporalColumn::ToString() const {
	string result = name + " (" + TemporalTypeToString(type) + "[" + TimeUnitToString(unit);
	if (HasTimeZone()) {
		result += ", " + time_zone;
	}
	result += "], " + SortedFlagToString(sorted) + ")\n";
	for (idx_t row = 0; row < data.size(); row++) {
		result += ToString(row) + "\n";
	}
	return result;
}

} // namespace chronorange
