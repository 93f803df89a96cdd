#include "transcription_submitter.hpp"

#include "internal/observability/logging.hpp"

namespace airtime::pipeline {

std::size_t LoggingTranscriptionSubmitter::Submit(const std::vector<eligibility::AnalysisCandidate>& candidates) {
  std::size_t      count = 0;
  std::scoped_lock lock(mutex_);

  for (const auto& c : candidates) {
    if (!c.requires_analysis || c.id == 0) continue;
    if (!submitted_.insert(c.id).second) {
      AIRTIME_LOG_DEBUG("transcription job already exists", {observability::IntField("segment_id", c.id)});
      continue;
    }

    AIRTIME_LOG_INFO("transcription requested",
                     {observability::IntField("channel_id", c.channel_id), observability::IntField("segment_id", c.id),
                      observability::TimeField("start", c.start_time), observability::TimeField("end", c.end_time)});
    ++count;
  }
  return count;
}

} // namespace airtime::pipeline
