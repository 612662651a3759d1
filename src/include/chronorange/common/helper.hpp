//===----------------------------------------------------------------------===//
//                         chronorange
//
// chronorange/common/helper.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "chronorange/common/constants.hpp"

#include <utility>

namespace chronorange {

template <class DATA_TYPE, class... ARGS>
unique_ptr<DATA_TYPE> make_uniq(ARGS &&...args) { // NOLINT: mimic std style
	return unique_ptr<DATA_TYPE>(new DATA_TYPE(std::forward<ARGS>(args)...));
}

template <class DATA_TYPE, class... ARGS>
shared_ptr<DATA_TYPE> make_shared_ptr(ARGS &&...args) { // NOLINT: mimic std style
	return std::make_shared<DATA_TYPE>(std::forward<ARGS>(args)...);
}

template <class T>
T MinValue(T a, T b) {
	return a < b ? a : b;
}

} // namespace chronorange
