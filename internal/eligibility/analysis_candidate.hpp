#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/model/segment_record.hpp"

namespace airtime::eligibility {

// Segment view evaluated by the eligibility engine.
struct AnalysisCandidate {
  int64_t id         = 0; // 0 = not persisted, decisions stay in memory
  int64_t channel_id = 0;

  std::optional<std::string> title;

  util::TimePoint start_time{};
  util::TimePoint end_time{};

  // Missing means unknown; the duration floor does not apply.
  std::optional<int64_t> duration_seconds;

  bool is_recognized     = false;
  bool requires_analysis = true;

  static AnalysisCandidate FromRecord(const db::model::SegmentRecord& record) {
    AnalysisCandidate c;
    c.id               = record.id;
    c.channel_id       = record.channel_id;
    c.title            = record.title;
    c.start_time       = record.start_time;
    c.end_time         = record.end_time;
    c.duration_seconds = record.duration_seconds;
    c.is_recognized    = record.is_recognized;
    return c;
  }
};

} // namespace airtime::eligibility
