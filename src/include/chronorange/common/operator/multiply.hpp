//===----------------------------------------------------------------------===//
//                         chronorange
//
// chronorange/common/operator/multiply.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "chronorange/common/exception.hpp"

namespace chronorange {

struct TryMultiplyOperator {
	template <class TA, class TB, class TR>
	static inline bool Operation(TA left, TB right, TR &result) {
		return !__builtin_mul_overflow(left, right, &result);
	}
};

struct MultiplyOperatorOverflowCheck {
	template <class TA, class TB, class TR>
	static inline TR Operation(TA left, TB right) {
		TR result;
		if (!TryMultiplyOperator::Operation<TA, TB, TR>(left, right, result)) {
			throw OutOfRangeException("Overflow in multiplication of %d and %d", int64_t(left), int64_t(right));
		}
		return result;
	}
};

} // namespace chronorange
