#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace airtime::db::model {

/*
  Append-only audit entry.

  segment ---> source segments it supersedes
*/

struct EditLogRecord {
  int64_t id         = 0;
  int64_t segment_id = 0;

  std::string action;  // "merge", "split", "adjust"
  std::string trigger; // "automatic", "manual"

  // sorted ascending
  std::vector<int64_t> source_segment_ids;

  std::string     notes;
  util::TimePoint created_at{};
};

} // namespace airtime::db::model
