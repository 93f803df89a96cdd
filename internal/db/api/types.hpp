#pragma once

#include <cstdint>
#include <optional>

#include "internal/util/time.hpp"

namespace airtime::db {

/*
  Filtered read over one channel's segments.

  Every set field narrows the result (logical AND). Results are ordered by
  start_time, then id.
*/
struct SegmentFilter {
  int64_t channel_id = 0;

  std::optional<util::TimePoint> start_at_or_after;
  std::optional<util::TimePoint> start_before;
  std::optional<util::TimePoint> start_at_or_before;
  std::optional<util::TimePoint> end_at_or_after;
  std::optional<util::TimePoint> created_before;

  std::optional<bool> is_active;
  std::optional<bool> is_delete;
};

} // namespace airtime::db
