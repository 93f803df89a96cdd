#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "internal/db/model/segment_record.hpp"
#include "internal/model/shift.hpp"
#include "internal/timeline/window_builder.hpp"

namespace airtime::timeline {

inline constexpr auto kMaxPageRange = std::chrono::hours(24 * 7);

struct PageInfo {
  uint32_t  page = 0;
  UtcWindow window;
};

// end defaults to start + 7 days and is capped there. Throws
// util::InvalidArgument when end <= start.
UtcWindow ClampRange(util::TimePoint start, std::optional<util::TimePoint> end);

// Shift windows for every local day of the range, intersected with it.
// Empty intersections are dropped.
std::vector<UtcWindow> ShiftValidWindows(const UtcWindow& range, const model::Shift& shift, const absl::TimeZone& tz);

// Page numbers start at 1. Throws util::InvalidArgument when the page starts
// at or after the range end, or for a zero page/page size.
UtcWindow PageWindow(const UtcWindow& range, uint32_t page, uint32_t page_size_hours);

std::vector<PageInfo> ListPages(const UtcWindow& range, uint32_t page_size_hours);

// Segments whose start lies in any [start, end) window.
std::size_t CountInWindows(const std::vector<db::model::SegmentRecord>& segments, const std::vector<UtcWindow>& windows);

} // namespace airtime::timeline
