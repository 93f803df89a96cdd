#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "internal/eligibility/analysis_candidate.hpp"
#include "internal/model/title_rule.hpp"

namespace airtime::eligibility {

struct SuppressionInterval {
  util::TimePoint start{};
  util::TimePoint end{};

  // Inclusive on the interval end: start <= iv.end && end > iv.start.
  bool Covers(util::TimePoint seg_start, util::TimePoint seg_end) const {
    return seg_start <= end && seg_end > start;
  }
};

// One channel's timeline, ordered by start_time.
using Timeline = std::vector<const AnalysisCandidate*>;

// title -> positions in the timeline, ascending. Untitled segments are not indexed.
using TitleIndex = std::unordered_map<std::string, std::vector<std::size_t>>;

TitleIndex BuildTitleIndex(const Timeline& timeline);

/*
  Per rule:
    after_title empty -> each before_title segment's own [start, end]
    otherwise         -> [before.start, min(next after_title start, before.start + cap))

  "Next" means the first after_title occurrence later in the timeline than
  the before_title occurrence. Zero-length intervals are dropped. The result
  is merged.
*/
std::vector<SuppressionInterval> BuildSuppressionIntervals(const Timeline& timeline, const TitleIndex& index,
                                                           const std::vector<model::TitleMappingRule>& rules, util::Micros cap);

// Sorted union; touching intervals coalesce.
std::vector<SuppressionInterval> MergeIntervals(std::vector<SuppressionInterval> intervals);

} // namespace airtime::eligibility
