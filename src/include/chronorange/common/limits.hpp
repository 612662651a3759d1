//===----------------------------------------------------------------------===//
//                         chronorange
//
// chronorange/common/limits.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <limits>

namespace chronorange {

template <class T>
struct NumericLimits {
	static constexpr T Minimum() {
		return std::numeric_limits<T>::lowest();
	}
	static constexpr T Maximum() {
		return std::numeric_limits<T>::max();
	}
};

} // namespace chronorange
