//===----------------------------------------------------------------------===//
//                         chronorange
//
// chronorange/common/operator/subtract.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "chronorange/common/exception.hpp"

namespace chronorange {

struct TrySubtractOperator {
	template <class TA, class TB, class TR>
	static inline bool Operation(TA left, TB right, TR &result) {
		return !__builtin_sub_overflow(left, right, &result);
	}
};

struct SubtractOperatorOverflowCheck {
	template <class TA, class TB, class TR>
	static inline TR Operation(TA left, TB right) {
		TR result;
		if (!TrySubtractOperator::Operation<TA, TB, TR>(left, right, result)) {
			throw OutOfRangeException("Overflow in subtraction of %d and %d", int64_t(left), int64_t(right));
		}
		return result;
	}
};

} // namespace chronorange
