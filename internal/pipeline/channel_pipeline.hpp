#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "internal/eligibility/eligibility_engine.hpp"
#include "internal/ingest/segment_ingestor.hpp"
#include "internal/merge/segment_merge_engine.hpp"
#include "internal/model/recognition_event.hpp"
#include "internal/pipeline/transcription_submitter.hpp"
#include "internal/timeline/timeline_synthesizer.hpp"

namespace airtime::pipeline {

struct RunReport {
  int64_t channel_id = 0;

  std::size_t events            = 0;
  std::size_t accepted          = 0;
  std::size_t discarded_overlap = 0;
  std::size_t discarded_invalid = 0;
  std::size_t candidates        = 0;

  std::size_t inserted     = 0;
  std::size_t deduplicated = 0;
  std::size_t deactivated  = 0;

  std::size_t merges = 0;

  std::size_t eligible   = 0;
  std::size_t suppressed = 0;
  std::size_t submitted  = 0;

  std::vector<eligibility::AnalysisCandidate> segments;
};

/*
  synthesize -> ingest -> merge -> eligibility -> submit, for one channel.

  Stages run strictly in sequence; each one commits before the next reads.
*/
class ChannelPipeline {
 public:
  ChannelPipeline(timeline::TimelineSynthesizer synthesizer, std::shared_ptr<ingest::SegmentIngestor> ingestor,
                  std::shared_ptr<merge::SegmentMergeEngine> merger, std::shared_ptr<eligibility::EligibilityEngine> eligibility,
                  std::shared_ptr<TranscriptionSubmitter> submitter);

  RunReport Run(const model::ChannelSettings& channel, const std::vector<model::RecognitionEvent>& events);

 private:
  timeline::TimelineSynthesizer                  synthesizer_;
  std::shared_ptr<ingest::SegmentIngestor>       ingestor_;
  std::shared_ptr<merge::SegmentMergeEngine>     merger_;
  std::shared_ptr<eligibility::EligibilityEngine> eligibility_;
  std::shared_ptr<TranscriptionSubmitter>        submitter_;
};

} // namespace airtime::pipeline
