#pragma once

#include <string>
#include <vector>

#include "internal/model/channel_settings.hpp"
#include "internal/timeline/window_builder.hpp"

namespace airtime::timeline {

/*
  OR of UTC windows. A segment matches when it overlaps any window:
  seg.start < window.end && seg.end > window.start.
*/
class ShiftFilter {
 public:
  ShiftFilter() = default;
  explicit ShiftFilter(std::vector<UtcWindow> windows) : windows_(std::move(windows)) {
  }

  bool Matches(util::TimePoint start, util::TimePoint end) const;

  bool MatchesNothing() const {
    return windows_.empty();
  }

  const std::vector<UtcWindow>& Windows() const {
    return windows_;
  }

 private:
  std::vector<UtcWindow> windows_;
};

// Windows of one shift over every local day touching [utc_start, utc_end],
// starting one day early so an overnight tail from the previous evening is
// included. Ignores is_active.
std::vector<UtcWindow> ShiftWindows(const model::Shift& shift, const absl::TimeZone& tz, util::TimePoint utc_start,
                                    util::TimePoint utc_end);

// True when the range overlaps any active shift of the channel. A channel
// without active shifts has nothing in-shift.
bool IsWithinAnyShift(const model::ChannelSettings& channel, util::TimePoint utc_start, util::TimePoint utc_end);

// Throws util::NotFound for an unknown shift name.
ShiftFilter BuildShiftFilterPredicate(const model::ChannelSettings& channel, const std::string& shift_name,
                                      util::TimePoint utc_range_start, util::TimePoint utc_range_end);

// Predefined filter windows: each local day contributes its own schedules
// and the overnight schedules of the previous day.
std::vector<UtcWindow> ScheduleFilterWindows(const model::ScheduleFilter& filter, const absl::TimeZone& tz,
                                             util::TimePoint utc_start, util::TimePoint utc_end);

// Throws util::NotFound for an unknown filter name.
ShiftFilter BuildScheduleFilterPredicate(const model::ChannelSettings& channel, const std::string& filter_name,
                                         util::TimePoint utc_range_start, util::TimePoint utc_range_end);

} // namespace airtime::timeline
