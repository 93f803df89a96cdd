#pragma once

#include <cstdint>
#include <string>

#include "internal/util/time.hpp"

namespace airtime::model {

/*
  Synthesized timeline entry that has not been persisted yet.

  Recognized candidates carry title; gap candidates carry title_before and
  title_after.
*/
struct SegmentCandidate {
  util::TimePoint start_time{};
  util::TimePoint end_time{};
  int64_t         duration_seconds = 0;
  bool            is_recognized    = false;
  bool            is_active        = true;
  std::string     title;
  std::string     title_before;
  std::string     title_after;
  std::string     metadata_json;
};

} // namespace airtime::model
