//===----------------------------------------------------------------------===//
//                         chronorange
//
// chronorange/common/operator/add.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "chronorange/common/exception.hpp"

namespace chronorange {

struct TryAddOperator {
	template <class TA, class TB, class TR>
	static inline bool Operation(TA left, TB right, TR &result) {
		return !__builtin_add_overflow(left, right, &result);
	}
};

struct AddOperatorOverflowCheck {
	template <class TA, class TB, class TR>
	static inline TR Operation(TA left, TB right) {
		TR result;
		if (!TryAddOperator::Operation<TA, TB, TR>(left, right, result)) {
			throw OutOfRangeException("Overflow in addition of %d and %d", int64_t(left), int64_t(right));
		}
		return result;
	}
};

} // namespace chronorange
