#include "internal/timeline/window_builder.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

namespace {

using airtime::model::TimeOfDay;
using airtime::timeline::BuildLocalDayWindows;
using airtime::util::ParseUtc;

// 2025-08-11 is a Monday.
const absl::CivilDay kMonday(2025, 8, 11);

void TestDaytimeWindowIsSingle() {
  const auto windows = BuildLocalDayWindows(TimeOfDay{9, 0}, TimeOfDay{17, 0}, kMonday, absl::UTCTimeZone());
  assert(windows.size() == 1);
  assert(windows[0].start == ParseUtc("2025-08-11 09:00:00"));
  assert(windows[0].end == ParseUtc("2025-08-11 17:00:00"));
}

void TestOvernightWindowSplitsAtMidnight() {
  const auto windows = BuildLocalDayWindows(TimeOfDay{22, 0}, TimeOfDay{6, 0}, kMonday, absl::UTCTimeZone());
  assert(windows.size() == 2);

  assert(windows[0].start == ParseUtc("2025-08-11 22:00:00"));
  assert(windows[0].end == ParseUtc("2025-08-11T23:59:59.999999Z"));
  assert(windows[1].start == ParseUtc("2025-08-12 00:00:00"));
  assert(windows[1].end == ParseUtc("2025-08-12 06:00:00"));

  // Nothing between the halves but the last microsecond of the day.
  assert(windows[1].start - windows[0].end == std::chrono::microseconds(1));
}

void TestLocalTimesConvertThroughZoneOffset() {
  const auto tz      = absl::FixedTimeZone(10 * 60 * 60);
  const auto windows = BuildLocalDayWindows(TimeOfDay{6, 0}, TimeOfDay{10, 0}, absl::CivilDay(2025, 8, 12), tz);
  assert(windows.size() == 1);
  assert(windows[0].start == ParseUtc("2025-08-11 20:00:00"));
  assert(windows[0].end == ParseUtc("2025-08-12 00:00:00"));
}

void TestOverlapIsStrictOnBothEnds() {
  const auto windows = BuildLocalDayWindows(TimeOfDay{9, 0}, TimeOfDay{17, 0}, kMonday, absl::UTCTimeZone());
  const auto& w      = windows[0];

  assert(!w.Overlaps(ParseUtc("2025-08-11 08:55:00"), ParseUtc("2025-08-11 09:00:00")));
  assert(!w.Overlaps(ParseUtc("2025-08-11 17:00:00"), ParseUtc("2025-08-11 17:05:00")));
  assert(w.Overlaps(ParseUtc("2025-08-11 08:55:00"), ParseUtc("2025-08-11 09:00:01")));
  assert(w.Overlaps(ParseUtc("2025-08-11 16:59:59"), ParseUtc("2025-08-11 17:05:00")));
}

} // namespace

int main() {
  TestDaytimeWindowIsSingle();
  TestOvernightWindowSplitsAtMidnight();
  TestLocalTimesConvertThroughZoneOffset();
  TestOverlapIsStrictOnBothEnds();

  std::cout << "airtime_unit_window_builder: pass\n";
  return 0;
}
