//===----------------------------------------------------------------------===//
//                         chronorange
//
// icu_extension.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "chronorange/main/extension.hpp"

namespace chronorange {

//! Registers the ICU time zone resolver with a context
class ICUExtension : public Extension {
public:
	void Load(RangeContext &context) override;
	std::string Name() override;
};

} // namespace chronorange
