//===----------------------------------------------------------------------===//
//                         chronorange
//
// chronorange/main/extension.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "chronorange/common/constants.hpp"

namespace chronorange {

class RangeContext;

//! The Extension class is the base class used to define extensions
class Extension {
public:
	virtual ~Extension() {
	}

	virtual void Load(RangeContext &context) = 0;
	virtual string Name() = 0;
};

} // namespace chronorange
