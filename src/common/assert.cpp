#include "chronorange/common/assert.hpp"
#include "chronorange/common/exception.hpp"

namespace chronorange {

void ChronorangeAssertInternal(bool condition, const char *condition_name, const char *file, int linenr) {
	if (condition) {
		return;
	}
	throw InternalException("Assertion triggered in file \"%s\" on line %d: %s", file, linenr, condition_name);
}

} // namespace chronorange
