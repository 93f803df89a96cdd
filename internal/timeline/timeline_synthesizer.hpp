#pragma once

#include <cstddef>
#include <vector>

#include "internal/model/recognition_event.hpp"
#include "internal/model/segment_candidate.hpp"

namespace airtime::timeline {

struct SynthesisOptions {
  // Minimum extension past an accepted window for a partially overlapping
  // event to be kept.
  util::Micros gap_threshold = std::chrono::seconds(2);
};

struct Timeline {
  // Sorted by start_time; recognized and gap candidates interleaved.
  std::vector<model::SegmentCandidate> segments;

  std::size_t accepted          = 0;
  std::size_t discarded_overlap = 0;
  std::size_t discarded_invalid = 0;
};

/*
  Sparse, possibly overlapping recognition windows -> gapless,
  non-overlapping candidate timeline.

  Events are considered in arrival order; the first accepted interval that
  overlaps a newcomer decides whether it is kept.
*/
class TimelineSynthesizer {
 public:
  explicit TimelineSynthesizer(SynthesisOptions options = {});

  Timeline Synthesize(const std::vector<model::RecognitionEvent>& events) const;

 private:
  SynthesisOptions options_;
};

} // namespace airtime::timeline
