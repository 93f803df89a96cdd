#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/time/civil_time.h>

#include "internal/model/time_of_day.hpp"

namespace airtime::model {

/*
  Recurring, weekday-scoped, channel-local time-of-day window.

  start_time > end_time wraps past midnight. An empty day list applies the
  shift on every day of the week.
*/
struct Shift {
  std::string               name;
  TimeOfDay                 start_time;
  TimeOfDay                 end_time;
  std::vector<absl::Weekday> days;
  bool                      is_active = true;

  bool AppliesOn(absl::Weekday day) const;
  bool IsOvernight() const {
    return start_time > end_time;
  }
};

/*
  One entry of a predefined filter: a window on a single weekday.
*/
struct Schedule {
  absl::Weekday day_of_week = absl::Weekday::monday;
  TimeOfDay     start_time;
  TimeOfDay     end_time;
};

struct ScheduleFilter {
  std::string           name;
  std::vector<Schedule> schedules;
  bool                  is_active = true;
};

// "monday".."sunday", case-insensitive.
std::optional<absl::Weekday> ParseWeekday(std::string_view value);
std::string_view             ToString(absl::Weekday day);

} // namespace airtime::model
