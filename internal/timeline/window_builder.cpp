#include "window_builder.hpp"

namespace airtime::timeline {

util::TimePoint LocalToUtc(absl::CivilDay local_date, const model::TimeOfDay& tod, const absl::TimeZone& tz) {
  const absl::CivilSecond civil(local_date.year(), local_date.month(), local_date.day(), tod.hour, tod.minute, tod.second);
  return util::FromAbsl(tz.At(civil).pre + absl::Microseconds(tod.micros));
}

std::vector<UtcWindow> BuildLocalDayWindows(const model::TimeOfDay& start, const model::TimeOfDay& end,
                                            absl::CivilDay local_date, const absl::TimeZone& tz) {
  if (start <= end) {
    return {UtcWindow{LocalToUtc(local_date, start, tz), LocalToUtc(local_date, end, tz)}};
  }

  const auto next_day = local_date + 1;
  return {
      UtcWindow{LocalToUtc(local_date, start, tz), LocalToUtc(local_date, model::kEndOfDay, tz)},
      UtcWindow{LocalToUtc(next_day, model::TimeOfDay{}, tz), LocalToUtc(next_day, end, tz)},
  };
}

} // namespace airtime::timeline
