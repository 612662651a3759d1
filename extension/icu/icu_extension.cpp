#include "include/icu_extension.hpp"
#include "include/icu-timezone-resolver.hpp"
#include "chronorange/common/helper.hpp"
#include "chronorange/main/range_context.hpp"

namespace chronorange {

void ICUExtension::Load(RangeContext &context) {
	context.RegisterTimeZoneResolver(make_uniq<ICUTimeZoneResolver>(context.GetLogger()));
}

std::string ICUExtension::Name() {
	return "icu";
}

} // namespace chronorange
