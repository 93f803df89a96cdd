#include "timeline_synthesizer.hpp"

#include <algorithm>
#include <cmath>

#include "internal/observability/logging.hpp"

namespace airtime::timeline {

namespace {

enum class OverlapDecision { kAccept, kContained, kInsufficientExtension };

OverlapDecision Decide(const model::SegmentCandidate& existing, util::TimePoint start, util::TimePoint end, util::Micros threshold) {
  if (start >= existing.start_time && end <= existing.end_time) {
    return OverlapDecision::kContained;
  }
  if (end - existing.end_time >= threshold) {
    return OverlapDecision::kAccept;
  }
  return OverlapDecision::kInsufficientExtension;
}

} // namespace

TimelineSynthesizer::TimelineSynthesizer(SynthesisOptions options) : options_(options) {
}

Timeline TimelineSynthesizer::Synthesize(const std::vector<model::RecognitionEvent>& events) const {
  Timeline                             result;
  std::vector<model::SegmentCandidate> accepted;
  accepted.reserve(events.size());

  for (const auto& event : events) {
    if (!std::isfinite(event.played_duration_seconds) || event.played_duration_seconds <= 0.0 || event.title.empty()) {
      AIRTIME_LOG_WARN("recognition event skipped: invalid duration or title",
                       {observability::TimeField("timestamp", event.timestamp), observability::StringField("title", event.title)});
      ++result.discarded_invalid;
      continue;
    }

    const auto start = event.timestamp;
    const auto end   = start + util::SecondsToMicros(event.played_duration_seconds);
    if (end <= start) {
      ++result.discarded_invalid;
      continue;
    }

    const auto overlapping = std::find_if(accepted.begin(), accepted.end(), [&](const model::SegmentCandidate& c) {
      return start < c.end_time && end > c.start_time;
    });

    if (overlapping != accepted.end()) {
      const auto decision = Decide(*overlapping, start, end, options_.gap_threshold);
      if (decision != OverlapDecision::kAccept) {
        AIRTIME_LOG_DEBUG("recognition event discarded: overlaps accepted window",
                          {observability::TimeField("start", start), observability::TimeField("end", end),
                           observability::StringField("title", event.title),
                           observability::StringField("reason", decision == OverlapDecision::kContained ? "contained" : "short_extension")});
        ++result.discarded_overlap;
        continue;
      }
    }

    model::SegmentCandidate candidate;
    candidate.start_time       = start;
    candidate.end_time         = end;
    candidate.duration_seconds = util::WholeSeconds(start, end);
    candidate.is_recognized    = true;
    candidate.title            = event.title;
    candidate.metadata_json    = event.metadata_json;
    accepted.push_back(std::move(candidate));
  }

  std::stable_sort(accepted.begin(), accepted.end(),
                   [](const model::SegmentCandidate& a, const model::SegmentCandidate& b) { return a.start_time < b.start_time; });

  // A partially overlapping event keeps only the part past its predecessor.
  std::vector<model::SegmentCandidate> recognized;
  recognized.reserve(accepted.size());
  for (auto& candidate : accepted) {
    if (!recognized.empty() && candidate.start_time < recognized.back().end_time) {
      candidate.start_time = recognized.back().end_time;
      if (candidate.end_time <= candidate.start_time) {
        ++result.discarded_overlap;
        continue;
      }
      candidate.duration_seconds = util::WholeSeconds(candidate.start_time, candidate.end_time);
    }
    recognized.push_back(std::move(candidate));
  }
  result.accepted = recognized.size();

  result.segments.reserve(recognized.size() * 2);
  for (std::size_t i = 0; i < recognized.size(); ++i) {
    result.segments.push_back(recognized[i]);
    if (i + 1 == recognized.size()) break;

    const auto& current = recognized[i];
    const auto& next    = recognized[i + 1];
    if (next.start_time <= current.end_time) continue;

    model::SegmentCandidate gap;
    gap.start_time       = current.end_time;
    gap.end_time         = next.start_time;
    gap.duration_seconds = util::WholeSeconds(gap.start_time, gap.end_time);
    gap.is_recognized    = false;
    gap.title_before     = current.title;
    gap.title_after      = next.title;
    result.segments.push_back(std::move(gap));
  }

  AIRTIME_LOG_DEBUG("timeline synthesized",
                    {observability::IntField("events", static_cast<int64_t>(events.size())),
                     observability::IntField("accepted", static_cast<int64_t>(result.accepted)),
                     observability::IntField("discarded_overlap", static_cast<int64_t>(result.discarded_overlap)),
                     observability::IntField("discarded_invalid", static_cast<int64_t>(result.discarded_invalid)),
                     observability::IntField("segments", static_cast<int64_t>(result.segments.size()))});
  return result;
}

} // namespace airtime::timeline
