#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/channel_settings.hpp"

namespace airtime::merge {

struct MergeOptions {
  // Recognized segments shorter than this are merge candidates.
  int64_t min_recognized_seconds = 20;

  // Largest |gap| between neighbors still treated as adjacent.
  util::Micros adjacency_tolerance = std::chrono::seconds(1);
};

struct MergeResult {
  // Non-deleted inputs plus created merged segments, sorted by start_time.
  std::vector<db::model::SegmentRecord> segments;

  std::size_t merges  = 0;
  std::size_t skipped = 0; // candidates without a usable neighbor or rejected by the idempotency check
  std::size_t failed  = 0;
};

/*
  Collapses short recognized segments into their immediate neighbors.

  One left-to-right pass, one hop: a candidate absorbs at most its direct
  predecessor and successor. Merged segments are never merge inputs, so a
  second run over the output performs no merges.

  Each merge is a single transaction:
    re-read constituents -> insert merged -> soft-delete constituents ->
    edit-log entry (skipped when an identical one exists)
*/
class SegmentMergeEngine {
 public:
  SegmentMergeEngine(std::shared_ptr<db::Repository> repository, MergeOptions options = {});

  MergeResult MergeShortRecognizedSegments(const model::ChannelSettings& channel, std::vector<db::model::SegmentRecord> segments);

 private:
  db::model::SegmentRecord BuildMerged(const model::ChannelSettings& channel,
                                       const std::vector<const db::model::SegmentRecord*>& constituents) const;

  // nullopt when a constituent was already merged or deleted.
  std::optional<db::model::SegmentRecord> Persist(db::model::SegmentRecord merged,
                                                  const std::vector<const db::model::SegmentRecord*>& constituents);

  bool Adjacent(const db::model::SegmentRecord& earlier, const db::model::SegmentRecord& later) const;

  std::shared_ptr<db::Repository> repository_;
  MergeOptions                    options_;
};

} // namespace airtime::merge
