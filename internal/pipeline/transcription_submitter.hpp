#pragma once

#include <cstddef>
#include <mutex>
#include <set>
#include <vector>

#include "internal/eligibility/analysis_candidate.hpp"

namespace airtime::pipeline {

/*
  Downstream transcription collaborator.

  Receives the annotated candidate list; decides on its own whether a job
  already exists for a segment. Returns the number of jobs submitted.
*/
class TranscriptionSubmitter {
 public:
  virtual ~TranscriptionSubmitter() = default;

  virtual std::size_t Submit(const std::vector<eligibility::AnalysisCandidate>& candidates) = 0;
};

// Logs one line per eligible persisted segment, once per segment id.
class LoggingTranscriptionSubmitter final : public TranscriptionSubmitter {
 public:
  std::size_t Submit(const std::vector<eligibility::AnalysisCandidate>& candidates) override;

 private:
  std::mutex        mutex_;
  std::set<int64_t> submitted_;
};

} // namespace airtime::pipeline
