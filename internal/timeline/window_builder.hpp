#pragma once

#include <vector>

#include <absl/time/civil_time.h>
#include <absl/time/time.h>

#include "internal/model/time_of_day.hpp"
#include "internal/util/time.hpp"

namespace airtime::timeline {

// Half-open in intent; end of an overnight first half is the last
// microsecond of the local day.
struct UtcWindow {
  util::TimePoint start{};
  util::TimePoint end{};

  bool Overlaps(util::TimePoint range_start, util::TimePoint range_end) const {
    return range_start < end && range_end > start;
  }
};

/*
  Local time-of-day window on one local date -> UTC.

  start <= end : [date+start, date+end]
  start >  end : [date+start, date 23:59:59.999999] and [date+1 00:00, date+1 end]

  Skipped or repeated local times resolve with the pre-transition offset.
*/
std::vector<UtcWindow> BuildLocalDayWindows(const model::TimeOfDay& start, const model::TimeOfDay& end,
                                            absl::CivilDay local_date, const absl::TimeZone& tz);

// Local wall-clock instant on a date, converted to UTC.
util::TimePoint LocalToUtc(absl::CivilDay local_date, const model::TimeOfDay& tod, const absl::TimeZone& tz);

} // namespace airtime::timeline
