#include "shift_membership.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace airtime::timeline {

bool ShiftFilter::Matches(util::TimePoint start, util::TimePoint end) const {
  return std::any_of(windows_.begin(), windows_.end(), [&](const UtcWindow& w) { return w.Overlaps(start, end); });
}

std::vector<UtcWindow> ShiftWindows(const model::Shift& shift, const absl::TimeZone& tz, util::TimePoint utc_start,
                                    util::TimePoint utc_end) {
  std::vector<UtcWindow> windows;

  const auto last = util::LocalDay(utc_end, tz);
  for (auto day = util::LocalDay(utc_start, tz) - 1; day <= last; ++day) {
    if (!shift.AppliesOn(absl::GetWeekday(day))) continue;
    auto day_windows = BuildLocalDayWindows(shift.start_time, shift.end_time, day, tz);
    windows.insert(windows.end(), day_windows.begin(), day_windows.end());
  }
  return windows;
}

bool IsWithinAnyShift(const model::ChannelSettings& channel, util::TimePoint utc_start, util::TimePoint utc_end) {
  const auto tz = util::LoadZone(channel.timezone);

  for (const auto& shift : channel.shifts) {
    if (!shift.is_active) continue;
    for (const auto& window : ShiftWindows(shift, tz, utc_start, utc_end)) {
      if (window.Overlaps(utc_start, utc_end)) return true;
    }
  }
  return false;
}

ShiftFilter BuildShiftFilterPredicate(const model::ChannelSettings& channel, const std::string& shift_name,
                                      util::TimePoint utc_range_start, util::TimePoint utc_range_end) {
  const auto it = std::find_if(channel.shifts.begin(), channel.shifts.end(),
                               [&](const model::Shift& s) { return s.name == shift_name; });
  if (it == channel.shifts.end()) {
    throw util::NotFound("shift not found: " + shift_name);
  }
  if (utc_range_end <= utc_range_start) {
    return ShiftFilter{};
  }

  const auto tz = util::LoadZone(channel.timezone);
  return ShiftFilter(ShiftWindows(*it, tz, utc_range_start, utc_range_end));
}

std::vector<UtcWindow> ScheduleFilterWindows(const model::ScheduleFilter& filter, const absl::TimeZone& tz,
                                             util::TimePoint utc_start, util::TimePoint utc_end) {
  std::vector<UtcWindow> windows;
  auto                   append = [&](const model::Schedule& schedule, absl::CivilDay day) {
    auto day_windows = BuildLocalDayWindows(schedule.start_time, schedule.end_time, day, tz);
    windows.insert(windows.end(), day_windows.begin(), day_windows.end());
  };

  const auto last = util::LocalDay(utc_end, tz);
  for (auto day = util::LocalDay(utc_start, tz); day <= last; ++day) {
    const auto weekday      = absl::GetWeekday(day);
    const auto prev         = day - 1;
    const auto prev_weekday = absl::GetWeekday(prev);

    for (const auto& schedule : filter.schedules) {
      if (schedule.day_of_week == weekday) append(schedule, day);
    }
    for (const auto& schedule : filter.schedules) {
      if (schedule.day_of_week == prev_weekday && schedule.start_time > schedule.end_time) append(schedule, prev);
    }
  }
  return windows;
}

ShiftFilter BuildScheduleFilterPredicate(const model::ChannelSettings& channel, const std::string& filter_name,
                                         util::TimePoint utc_range_start, util::TimePoint utc_range_end) {
  const auto it = std::find_if(channel.schedule_filters.begin(), channel.schedule_filters.end(),
                               [&](const model::ScheduleFilter& f) { return f.name == filter_name; });
  if (it == channel.schedule_filters.end()) {
    throw util::NotFound("schedule filter not found: " + filter_name);
  }
  if (!it->is_active) {
    AIRTIME_LOG_DEBUG("schedule filter inactive", {observability::StringField("filter", filter_name)});
    return ShiftFilter{};
  }
  if (utc_range_end <= utc_range_start) {
    return ShiftFilter{};
  }

  const auto tz = util::LoadZone(channel.timezone);
  return ShiftFilter(ScheduleFilterWindows(*it, tz, utc_range_start, utc_range_end));
}

} // namespace airtime::timeline
