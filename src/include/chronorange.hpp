//===----------------------------------------------------------------------===//
//                         chronorange
//
// chronorange.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "chronorange/calendar/offset_applier.hpp"
#include "chronorange/calendar/time_zone_resolver.hpp"
#include "chronorange/common/enums/closed_window.hpp"
#include "chronorange/common/enums/time_unit.hpp"
#include "chronorange/common/exception.hpp"
#include "chronorange/common/helper.hpp"
#include "chronorange/common/types/date.hpp"
#include "chronorange/common/types/duration.hpp"
#include "chronorange/common/types/temporal_column.hpp"
#include "chronorange/common/types/time.hpp"
#include "chronorange/common/types/timestamp.hpp"
#include "chronorange/function/date_range.hpp"
#include "chronorange/function/datetime_range.hpp"
#include "chronorange/logging/log_manager.hpp"
#include "chronorange/logging/logger.hpp"
#include "chronorange/main/config.hpp"
#include "chronorange/main/range_context.hpp"
