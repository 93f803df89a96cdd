#include "segment_merge_engine.hpp"

#include <algorithm>
#include <sstream>

#include "internal/ingest/segment_ingestor.hpp"
#include "internal/observability/logging.hpp"

namespace airtime::merge {

using db::model::SegmentRecord;
using observability::IntField;
using observability::StringField;

namespace {

bool IsMergeInput(const SegmentRecord& s) {
  return s.source != model::SegmentSource::kMerged && !s.is_delete;
}

std::string BoundaryTitle(const SegmentRecord& s, bool leading) {
  if (s.is_recognized) return s.title.value_or("");
  return (leading ? s.title_before : s.title_after).value_or("");
}

std::string JoinIds(const std::vector<int64_t>& ids) {
  std::ostringstream out;
  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (i) out << ',';
    out << ids[i];
  }
  return out.str();
}

} // namespace

SegmentMergeEngine::SegmentMergeEngine(std::shared_ptr<db::Repository> repository, MergeOptions options)
    : repository_(std::move(repository)), options_(options) {
}

bool SegmentMergeEngine::Adjacent(const SegmentRecord& earlier, const SegmentRecord& later) const {
  const auto gap = later.start_time - earlier.end_time;
  return gap <= options_.adjacency_tolerance && gap >= -options_.adjacency_tolerance;
}

MergeResult SegmentMergeEngine::MergeShortRecognizedSegments(const model::ChannelSettings& channel, std::vector<SegmentRecord> segments) {
  std::stable_sort(segments.begin(), segments.end(),
                   [](const SegmentRecord& a, const SegmentRecord& b) { return a.start_time < b.start_time; });

  MergeResult                result;
  std::vector<bool>          consumed(segments.size(), false);
  std::vector<SegmentRecord> created;

  auto usable = [&](std::size_t j) { return !consumed[j] && IsMergeInput(segments[j]); };

  for (std::size_t i = 0; i < segments.size(); ++i) {
    const auto& current = segments[i];
    if (!usable(i)) continue;
    if (!current.is_recognized || current.duration_seconds >= options_.min_recognized_seconds) continue;

    std::vector<std::size_t> picked;
    if (i > 0 && usable(i - 1) && Adjacent(segments[i - 1], current)) picked.push_back(i - 1);
    picked.push_back(i);
    if (i + 1 < segments.size() && usable(i + 1) && Adjacent(current, segments[i + 1])) picked.push_back(i + 1);

    if (picked.size() == 1) {
      AIRTIME_LOG_DEBUG("short segment left unmerged: no adjacent neighbor",
                        {IntField("channel_id", channel.id), IntField("segment_id", current.id),
                         IntField("duration_seconds", current.duration_seconds)});
      ++result.skipped;
      continue;
    }

    std::vector<const SegmentRecord*> constituents;
    for (const auto j : picked) constituents.push_back(&segments[j]);

    try {
      auto merged = Persist(BuildMerged(channel, constituents), constituents);
      if (!merged) {
        ++result.skipped;
        continue;
      }
      for (const auto j : picked) consumed[j] = true;
      created.push_back(std::move(*merged));
      ++result.merges;
    } catch (const std::exception& e) {
      AIRTIME_LOG_ERROR("segment merge failed",
                        {IntField("channel_id", channel.id), IntField("segment_id", current.id), StringField("error", e.what())});
      ++result.failed;
    }
  }

  for (std::size_t i = 0; i < segments.size(); ++i) {
    if (!consumed[i] && !segments[i].is_delete) result.segments.push_back(std::move(segments[i]));
  }
  for (auto& s : created) result.segments.push_back(std::move(s));
  std::stable_sort(result.segments.begin(), result.segments.end(),
                   [](const SegmentRecord& a, const SegmentRecord& b) { return a.start_time < b.start_time; });

  AIRTIME_LOG_INFO("short segment merge pass finished",
                   {IntField("channel_id", channel.id), IntField("merges", static_cast<int64_t>(result.merges)),
                    IntField("skipped", static_cast<int64_t>(result.skipped)), IntField("failed", static_cast<int64_t>(result.failed))});
  return result;
}

SegmentRecord SegmentMergeEngine::BuildMerged(const model::ChannelSettings& channel,
                                              const std::vector<const SegmentRecord*>& constituents) const {
  SegmentRecord merged;
  merged.channel_id = channel.id;
  merged.start_time = constituents.front()->start_time;
  merged.end_time   = constituents.front()->end_time;
  for (const auto* c : constituents) {
    merged.start_time = std::min(merged.start_time, c->start_time);
    merged.end_time   = std::max(merged.end_time, c->end_time);
  }
  merged.duration_seconds = util::WholeSeconds(merged.start_time, merged.end_time);

  const bool all_recognized =
      std::all_of(constituents.begin(), constituents.end(), [](const SegmentRecord* c) { return c->is_recognized; });
  if (all_recognized) {
    const SegmentRecord* longest = constituents.front();
    for (const auto* c : constituents) {
      if (c->duration_seconds > longest->duration_seconds) longest = c;
    }
    merged.is_recognized = true;
    merged.title         = longest->title;
    merged.metadata_json = longest->metadata_json;
  } else {
    merged.is_recognized = false;
    merged.title_before  = BoundaryTitle(*constituents.front(), true);
    merged.title_after   = BoundaryTitle(*constituents.back(), false);
  }

  merged.source    = model::SegmentSource::kMerged;
  merged.is_active = true;
  merged.file_name = ingest::SegmentIngestor::FileName(channel, merged.start_time, merged.duration_seconds);
  merged.file_path = ingest::SegmentIngestor::FilePath(merged.start_time, merged.file_name);
  return merged;
}

std::optional<SegmentRecord> SegmentMergeEngine::Persist(SegmentRecord merged, const std::vector<const SegmentRecord*>& constituents) {
  auto tx = repository_->Begin();

  std::vector<int64_t> source_ids;
  for (const auto* c : constituents) {
    const auto current = repository_->GetSegment(*tx, c->id);
    if (!current || current->is_delete || current->source == model::SegmentSource::kMerged) {
      AIRTIME_LOG_WARN("merge skipped: constituent already merged or deleted",
                       {IntField("channel_id", merged.channel_id), IntField("segment_id", c->id)});
      tx->Rollback();
      return std::nullopt;
    }
    source_ids.push_back(c->id);
  }
  std::sort(source_ids.begin(), source_ids.end());

  db::ThrowIfDbError(repository_->InsertSegment(*tx, merged), "insert merged segment " + merged.file_path);
  db::ThrowIfDbError(repository_->SoftDeleteSegments(*tx, source_ids), "soft-delete merge sources");

  const auto logs      = repository_->ListEditLogs(*tx, merged.id);
  const bool duplicate = std::any_of(logs.begin(), logs.end(), [&](const db::model::EditLogRecord& log) {
    auto ids = log.source_segment_ids;
    std::sort(ids.begin(), ids.end());
    return log.action == "merge" && ids == source_ids;
  });

  if (duplicate) {
    AIRTIME_LOG_DEBUG("edit log entry already present", {IntField("segment_id", merged.id)});
  } else {
    db::model::EditLogRecord log;
    log.segment_id         = merged.id;
    log.action             = "merge";
    log.trigger            = "automatic";
    log.source_segment_ids = source_ids;
    log.notes              = "Merged short recognized segment with adjacent neighbors: " + JoinIds(source_ids);
    db::ThrowIfDbError(repository_->InsertEditLog(*tx, log), "insert merge edit log");
  }

  tx->Commit();

  AIRTIME_LOG_INFO("segments merged",
                   {IntField("channel_id", merged.channel_id), IntField("merged_segment_id", merged.id),
                    StringField("sources", JoinIds(source_ids)), IntField("duration_seconds", merged.duration_seconds)});
  return merged;
}

} // namespace airtime::merge
