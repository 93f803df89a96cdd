#include "channel_pipeline.hpp"

#include "internal/observability/logging.hpp"

namespace airtime::pipeline {

using observability::IntField;

ChannelPipeline::ChannelPipeline(timeline::TimelineSynthesizer synthesizer, std::shared_ptr<ingest::SegmentIngestor> ingestor,
                                 std::shared_ptr<merge::SegmentMergeEngine> merger,
                                 std::shared_ptr<eligibility::EligibilityEngine> eligibility,
                                 std::shared_ptr<TranscriptionSubmitter> submitter)
    : synthesizer_(synthesizer),
      ingestor_(std::move(ingestor)),
      merger_(std::move(merger)),
      eligibility_(std::move(eligibility)),
      submitter_(std::move(submitter)) {
}

RunReport ChannelPipeline::Run(const model::ChannelSettings& channel, const std::vector<model::RecognitionEvent>& events) {
  RunReport report;
  report.channel_id = channel.id;
  report.events     = events.size();

  AIRTIME_LOG_INFO("channel run started", {IntField("channel_id", channel.id), IntField("events", static_cast<int64_t>(events.size()))});

  auto synthesized         = synthesizer_.Synthesize(events);
  report.accepted          = synthesized.accepted;
  report.discarded_overlap = synthesized.discarded_overlap;
  report.discarded_invalid = synthesized.discarded_invalid;
  report.candidates        = synthesized.segments.size();

  auto ingested        = ingestor_->Ingest(channel, synthesized.segments);
  report.inserted      = ingested.inserted;
  report.deduplicated  = ingested.deduplicated;
  report.deactivated   = ingested.deactivated;

  auto merged   = merger_->MergeShortRecognizedSegments(channel, std::move(ingested.segments));
  report.merges = merged.merges;

  std::vector<eligibility::AnalysisCandidate> candidates;
  candidates.reserve(merged.segments.size());
  for (const auto& record : merged.segments) {
    candidates.push_back(eligibility::AnalysisCandidate::FromRecord(record));
  }

  auto annotated    = eligibility_->MarkRequiresAnalysis(channel, std::move(candidates));
  report.eligible   = annotated.eligible;
  report.suppressed = annotated.suppressed;

  if (submitter_) {
    report.submitted = submitter_->Submit(annotated.segments);
  }
  report.segments = std::move(annotated.segments);

  AIRTIME_LOG_INFO("channel run finished",
                   {IntField("channel_id", channel.id), IntField("segments", static_cast<int64_t>(report.segments.size())),
                    IntField("merges", static_cast<int64_t>(report.merges)), IntField("eligible", static_cast<int64_t>(report.eligible)),
                    IntField("submitted", static_cast<int64_t>(report.submitted))});
  return report;
}

} // namespace airtime::pipeline
