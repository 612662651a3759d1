//===----------------------------------------------------------------------===//
//                         chronorange
//
// chronorange/common/constants.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace chronorange {

using std::string;
using std::vector;
using std::unordered_map;
using std::unordered_set;
using std::mutex;
using std::lock_guard;
using std::unique_lock;
using std::unique_ptr;
using std::shared_ptr;

//! Index type
typedef uint64_t idx_t;

} // namespace chronorange
