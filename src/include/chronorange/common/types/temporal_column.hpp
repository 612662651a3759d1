//===----------------------------------------------------------------------===//
//                         chronorange
//
// chronorange/common/types/temporal_column.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "chronorange/common/constants.hpp"
#include "chronorange/common/enums/time_unit.hpp"

namespace chronorange {

enum class TemporalType : uint8_t { DATETIME = 0, TIME = 1 };

//! Known ordering of the values of a column
enum class SortedFlag : uint8_t { NOT_SORTED = 0, ASCENDING = 1, DESCENDING = 2 };

string TemporalTypeToString(TemporalType type);
string SortedFlagToString(SortedFlag flag);

//! A named column of epoch integers together with the metadata needed to interpret them.
//! The sorted flag is trusted by consumers and is never verified against the values.
class TemporalColumn {
public:
	TemporalColumn(string name, TemporalType type, TimeUnit unit, string time_zone, vector<int64_t> data);

public:
	const string &GetName() const {
		return name;
	}
	TemporalType GetType() const {
		return type;
	}
	TimeUnit GetTimeUnit() const {
		return unit;
	}
	bool HasTimeZone() const {
		return !time_zone.empty();
	}
	const string &GetTimeZone() const {
		return time_zone;
	}
	const vector<int64_t> &GetData() const {
		return data;
	}
	idx_t size() const { // NOLINT: mimic std casing
		return data.size();
	}
	bool empty() const { // NOLINT: mimic std casing
		return data.empty();
	}
	int64_t GetValue(idx_t row) const;

	SortedFlag GetSortedFlag() const {
		return sorted;
	}
	void SetSortedFlag(SortedFlag flag) {
		sorted = flag;
	}

	//! Render the value of a row as an ISO datetime (DATETIME) or a time of day (TIME)
	string ToString(idx_t row) const;
	//! Render the full column, one value per line, preceded by a header
	string ToString() const;

private:
	string name;
	TemporalType type;
	TimeUnit unit;
	string time_zone;
	vector<int64_t> data;
	SortedFlag sorted;
};

} // namespace chronorange
