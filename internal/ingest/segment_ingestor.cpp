#include "segment_ingestor.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace airtime::ingest {

using observability::IntField;
using observability::StringField;
using observability::TimeField;

namespace {

// Empty string on success.
std::string Validate(const model::SegmentCandidate& c) {
  // Sub-second spans persist with duration_seconds == 0.
  if (c.end_time <= c.start_time || c.duration_seconds < 0) return "non-positive duration";
  if (c.is_recognized && c.title.empty()) return "recognized segment without title";
  if (!c.is_recognized && (c.title_before.empty() || c.title_after.empty())) return "gap segment without bounding titles";
  return {};
}

} // namespace

SegmentIngestor::SegmentIngestor(std::shared_ptr<db::Repository> repository, IngestOptions options)
    : repository_(std::move(repository)), options_(std::move(options)) {
}

std::string SegmentIngestor::FileName(const model::ChannelSettings& channel, util::TimePoint start, int64_t duration_seconds) {
  return "audio_" + std::to_string(channel.project_id) + "_" + std::to_string(channel.provider_channel_id) + "_" +
         util::FormatUtc(start, "%Y%m%d%H%M%S") + "_" + std::to_string(duration_seconds) + ".mp3";
}

std::string SegmentIngestor::FilePath(util::TimePoint start, const std::string& file_name) {
  return "media/" + util::FormatUtc(start, "%Y%m%d") + "/" + file_name;
}

IngestReport SegmentIngestor::Ingest(const model::ChannelSettings& channel, const std::vector<model::SegmentCandidate>& candidates) {
  IngestReport report;

  for (const auto& candidate : candidates) {
    const auto problem = Validate(candidate);
    if (!problem.empty()) {
      AIRTIME_LOG_WARN("segment candidate skipped",
                       {IntField("channel_id", channel.id), TimeField("start", candidate.start_time),
                        TimeField("end", candidate.end_time), StringField("reason", problem)});
      ++report.invalid;
      continue;
    }

    try {
      const auto outcome = IngestOne(channel, candidate, report);
      if (outcome == Outcome::kInserted) {
        ++report.inserted;
      } else {
        ++report.deduplicated;
      }
    } catch (const std::exception& e) {
      AIRTIME_LOG_ERROR("segment persistence failed",
                        {IntField("channel_id", channel.id), TimeField("start", candidate.start_time),
                         TimeField("end", candidate.end_time), StringField("error", e.what())});
      ++report.failed;
    }
  }

  AIRTIME_LOG_INFO("segments ingested",
                   {IntField("channel_id", channel.id), IntField("inserted", static_cast<int64_t>(report.inserted)),
                    IntField("deduplicated", static_cast<int64_t>(report.deduplicated)),
                    IntField("invalid", static_cast<int64_t>(report.invalid)), IntField("failed", static_cast<int64_t>(report.failed)),
                    IntField("deactivated", static_cast<int64_t>(report.deactivated))});
  return report;
}

SegmentIngestor::Outcome SegmentIngestor::IngestOne(const model::ChannelSettings& channel, const model::SegmentCandidate& candidate,
                                                    IngestReport& report) {
  const auto now = options_.now();
  auto       tx  = repository_->Begin();

  // Older rows overlapping the newcomer, collected before the insert.
  std::vector<db::model::SegmentRecord> stale;
  const bool exact = !repository_->FindSegmentsBySpan(*tx, channel.id, candidate.start_time, candidate.end_time).empty();
  if (exact) {
    AIRTIME_LOG_DEBUG("exact span already persisted, skipping deactivation",
                      {IntField("channel_id", channel.id), TimeField("start", candidate.start_time), TimeField("end", candidate.end_time)});
  } else {
    db::SegmentFilter filter;
    filter.channel_id         = channel.id;
    filter.is_active          = true;
    filter.start_at_or_before = candidate.end_time + options_.overlap_tolerance;
    filter.end_at_or_after    = candidate.start_time - options_.overlap_tolerance;
    filter.created_before     = now - options_.session_window;
    stale = repository_->ListSegments(*tx, filter);
  }

  const auto file_name = FileName(channel, candidate.start_time, candidate.duration_seconds);
  const auto file_path = FilePath(candidate.start_time, file_name);

  db::model::SegmentRecord persisted;
  Outcome                  outcome = Outcome::kInserted;
  if (auto existing = repository_->FindSegmentByFilePath(*tx, file_path)) {
    AIRTIME_LOG_DEBUG("segment already persisted", {IntField("segment_id", existing->id), StringField("file_path", file_path)});
    persisted = *existing;
    outcome   = Outcome::kExisting;
  } else {
    persisted.channel_id       = channel.id;
    persisted.start_time       = candidate.start_time;
    persisted.end_time         = candidate.end_time;
    persisted.duration_seconds = candidate.duration_seconds;
    persisted.is_recognized    = candidate.is_recognized;
    if (candidate.is_recognized) {
      persisted.title = candidate.title;
    } else {
      persisted.title_before = candidate.title_before;
      persisted.title_after  = candidate.title_after;
    }
    persisted.is_active     = true;
    persisted.source        = model::SegmentSource::kRecognition;
    persisted.metadata_json = candidate.metadata_json;
    persisted.file_name     = file_name;
    persisted.file_path     = file_path;
    persisted.created_at    = now;

    db::ThrowIfDbError(repository_->InsertSegment(*tx, persisted), "insert segment " + file_path);
  }

  std::size_t deactivated = 0;
  for (auto& old : stale) {
    if (old.id == persisted.id) continue;
    old.is_active = false;
    old.notes     = "Deactivated due to overlap with segment ID:" + std::to_string(persisted.id) + " (time: " +
                util::FormatUtc(candidate.start_time) + " - " + util::FormatUtc(candidate.end_time) + ")";
    db::ThrowIfDbError(repository_->UpdateSegment(*tx, old), "deactivate segment " + std::to_string(old.id));
    AIRTIME_LOG_INFO("segment deactivated: overlaps newer segment",
                     {IntField("channel_id", channel.id), IntField("segment_id", old.id), IntField("newer_segment_id", persisted.id)});
    ++deactivated;
  }

  tx->Commit();
  report.deactivated += deactivated;
  report.segments.push_back(std::move(persisted));
  return outcome;
}

} // namespace airtime::ingest
