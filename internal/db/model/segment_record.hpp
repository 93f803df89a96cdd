#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/segment_source.hpp"
#include "internal/util/time.hpp"

namespace airtime::db::model {

/*
  Persistent segment row.

  IMPORTANT:
  - Segments are never hard-deleted. Superseded rows carry is_delete=true and
    is_active=false; the edit log records what replaced them.
  - file_path is the stable identity used for deduplication.
  - duration_seconds is whole seconds of end_time - start_time.
*/

struct SegmentRecord {
  int64_t id         = 0; // assigned on insert
  int64_t channel_id = 0;

  util::TimePoint start_time{};
  util::TimePoint end_time{};
  int64_t         duration_seconds = 0;

  bool is_recognized = false;

  std::optional<std::string> title;
  std::optional<std::string> title_before;
  std::optional<std::string> title_after;

  bool is_active = true;
  bool is_delete = false;

  airtime::model::SegmentSource source = airtime::model::SegmentSource::kRecognition;

  bool requires_analysis = false;

  std::string metadata_json;
  std::string file_name;
  std::string file_path;
  std::string notes;

  util::TimePoint created_at{};
};

} // namespace airtime::db::model
