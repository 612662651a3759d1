//===----------------------------------------------------------------------===//
//                         chronorange
//
// chronorange/common/assert.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

namespace chronorange {

void ChronorangeAssertInternal(bool condition, const char *condition_name, const char *file, int linenr);

} // namespace chronorange

#ifdef DEBUG
#define CR_ASSERT(condition) chronorange::ChronorangeAssertInternal(bool(condition), #condition, __FILE__, __LINE__)
#else
#define CR_ASSERT(condition)
#endif
