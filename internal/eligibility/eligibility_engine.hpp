#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/eligibility/analysis_candidate.hpp"
#include "internal/model/channel_settings.hpp"

namespace airtime::eligibility {

struct EligibilityOptions {
  int64_t              min_unrecognized_seconds = 10;
  std::chrono::seconds suppression_window       = std::chrono::minutes(10);
};

struct EligibilityResult {
  // Same candidates, annotated, in input order.
  std::vector<AnalysisCandidate> segments;

  std::size_t eligible    = 0;
  std::size_t suppressed  = 0;
  std::size_t renamed     = 0;
  std::size_t deactivated = 0;
  std::size_t failed      = 0;
};

/*
  Decides requires_analysis per segment:

    1. default true
    2. recognized, or unrecognized shorter than the floor -> false
    3. inside a merged title-transition suppression interval -> false
    4. rename: the unrecognized segment right after a before_title segment
       takes the rule's category as title (persisted when changed)
    5. outside every active shift of the channel -> false
    6. persist requires_analysis; deactivate every false segment

  Nothing flips a suppressed segment back to eligible.
*/
class EligibilityEngine {
 public:
  static constexpr std::size_t kMaxTitleLength = 500;

  EligibilityEngine(std::shared_ptr<db::Repository> repository, EligibilityOptions options = {});

  // Segments of channels missing from the list are treated as having no
  // shifts and no rules.
  EligibilityResult MarkRequiresAnalysis(const std::vector<model::ChannelSettings>& channels,
                                         std::vector<AnalysisCandidate> segments);

  EligibilityResult MarkRequiresAnalysis(const model::ChannelSettings& channel, std::vector<AnalysisCandidate> segments);

 private:
  void RenameAfterBeforeTitles(const model::ChannelSettings& channel, std::vector<AnalysisCandidate*>& timeline,
                               EligibilityResult& result);

  void Finalize(int64_t channel_id, const std::vector<AnalysisCandidate*>& timeline, EligibilityResult& result);

  std::shared_ptr<db::Repository> repository_;
  EligibilityOptions              options_;
};

} // namespace airtime::eligibility
