#include "page_windows.hpp"

#include <algorithm>
#include <string>

#include <absl/time/civil_time.h>

#include "internal/util/errors.hpp"

namespace airtime::timeline {

UtcWindow ClampRange(util::TimePoint start, std::optional<util::TimePoint> end) {
  const auto max_end = start + kMaxPageRange;
  auto       clamped = end.value_or(max_end);
  if (clamped > max_end) clamped = max_end;
  if (clamped <= start) {
    throw util::InvalidArgument("range end must be after start");
  }
  return UtcWindow{start, clamped};
}

std::vector<UtcWindow> ShiftValidWindows(const UtcWindow& range, const model::Shift& shift, const absl::TimeZone& tz) {
  std::vector<UtcWindow> valid;

  const auto last = util::LocalDay(range.end, tz);
  for (auto day = util::LocalDay(range.start, tz); day <= last; ++day) {
    if (!shift.AppliesOn(absl::GetWeekday(day))) continue;
    for (const auto& w : BuildLocalDayWindows(shift.start_time, shift.end_time, day, tz)) {
      const auto start = std::max(range.start, w.start);
      const auto end   = std::min(range.end, w.end);
      if (start < end) valid.push_back(UtcWindow{start, end});
    }
  }
  return valid;
}

namespace {

struct PageCount {
  int64_t full    = 0;
  bool    partial = false;
};

// Counted in whole hours so a huge page size is never widened to clock ticks.
PageCount CountPages(const UtcWindow& range, std::chrono::hours size) {
  const auto span  = range.end - range.start;
  const auto hours = std::chrono::duration_cast<std::chrono::hours>(span);
  return PageCount{hours / size, hours % size != std::chrono::hours::zero() || span != hours};
}

UtcWindow NthPage(const UtcWindow& range, std::chrono::hours size, int64_t full, int64_t index) {
  const auto start = range.start + size * index;
  return UtcWindow{start, index < full ? start + size : range.end};
}

} // namespace

UtcWindow PageWindow(const UtcWindow& range, uint32_t page, uint32_t page_size_hours) {
  if (page == 0 || page_size_hours == 0) {
    throw util::InvalidArgument("page and page size must be positive");
  }

  const auto    size  = std::chrono::hours(page_size_hours);
  const auto    count = CountPages(range, size);
  const int64_t index = static_cast<int64_t>(page) - 1;
  if (index > count.full || (index == count.full && !count.partial)) {
    throw util::InvalidArgument("page " + std::to_string(page) + " is beyond the available time range");
  }
  return NthPage(range, size, count.full, index);
}

std::vector<PageInfo> ListPages(const UtcWindow& range, uint32_t page_size_hours) {
  if (page_size_hours == 0) {
    throw util::InvalidArgument("page size must be positive");
  }

  const auto    size  = std::chrono::hours(page_size_hours);
  const auto    count = CountPages(range, size);
  const int64_t total = count.full + (count.partial ? 1 : 0);

  std::vector<PageInfo> pages;
  pages.reserve(static_cast<std::size_t>(std::max<int64_t>(total, 0)));
  for (int64_t index = 0; index < total; ++index) {
    pages.push_back(PageInfo{static_cast<uint32_t>(index + 1), NthPage(range, size, count.full, index)});
  }
  return pages;
}

std::size_t CountInWindows(const std::vector<db::model::SegmentRecord>& segments, const std::vector<UtcWindow>& windows) {
  return static_cast<std::size_t>(std::count_if(segments.begin(), segments.end(), [&](const db::model::SegmentRecord& s) {
    return std::any_of(windows.begin(), windows.end(),
                       [&](const UtcWindow& w) { return s.start_time >= w.start && s.start_time < w.end; });
  }));
}

} // namespace airtime::timeline
