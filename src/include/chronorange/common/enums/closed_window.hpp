//===----------------------------------------------------------------------===//
//                         chronorange
//
// chronorange/common/enums/closed_window.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "chronorange/common/constants.hpp"

namespace chronorange {

//! Which boundaries of a range [start, end] are part of the range
enum class ClosedWindow : uint8_t { BOTH = 0, LEFT = 1, RIGHT = 2, NONE = 3 };

string ClosedWindowToString(ClosedWindow closed);
bool TryGetClosedWindow(const string &name, ClosedWindow &result);
ClosedWindow ClosedWindowFromString(const string &name);

//! Whether the start instant is part of the range
bool ClosedWindowIncludesStart(ClosedWindow closed);
//! Whether the end instant is part of the range
bool ClosedWindowIncludesEnd(ClosedWindow closed);

} // namespace chronorange
