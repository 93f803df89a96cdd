#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/channel_settings.hpp"
#include "internal/model/segment_candidate.hpp"

namespace airtime::ingest {

struct IngestOptions {
  // Slack on both ends when looking for older overlapping segments.
  util::Micros overlap_tolerance = std::chrono::seconds(1);

  // Segments created this recently are never deactivated.
  std::chrono::seconds session_window = std::chrono::minutes(5);

  std::function<util::TimePoint()> now = util::Now;
};

struct IngestReport {
  // Persisted rows for every accepted candidate (inserted or existing).
  std::vector<db::model::SegmentRecord> segments;

  std::size_t inserted     = 0;
  std::size_t deduplicated = 0;
  std::size_t invalid      = 0;
  std::size_t failed       = 0;
  std::size_t deactivated  = 0;
};

/*
  Persists synthesized candidates for one channel.

  Each candidate is handled in its own transaction:
    1. validate
    2. exact (channel, start, end) match -> no deactivation
       otherwise deactivate older active segments overlapping within tolerance
    3. file_path already present -> existing row is returned
       otherwise insert

  A failing candidate is logged and the rest continue.
*/
class SegmentIngestor {
 public:
  SegmentIngestor(std::shared_ptr<db::Repository> repository, IngestOptions options = {});

  IngestReport Ingest(const model::ChannelSettings& channel, const std::vector<model::SegmentCandidate>& candidates);

  // audio_{project}_{provider_channel}_{YYYYmmddHHMMSS}_{duration}.mp3
  static std::string FileName(const model::ChannelSettings& channel, util::TimePoint start, int64_t duration_seconds);
  // media/{YYYYmmdd}/{file_name}
  static std::string FilePath(util::TimePoint start, const std::string& file_name);

 private:
  enum class Outcome { kInserted, kExisting };

  Outcome IngestOne(const model::ChannelSettings& channel, const model::SegmentCandidate& candidate, IngestReport& report);

  std::shared_ptr<db::Repository> repository_;
  IngestOptions                   options_;
};

} // namespace airtime::ingest
