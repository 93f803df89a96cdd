#pragma once

#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "internal/eligibility/analysis_candidate.hpp"
#include "internal/eligibility/suppression_intervals.hpp"
#include "internal/model/channel_settings.hpp"
#include "internal/timeline/shift_membership.hpp"

namespace airtime::eligibility {

/*
  Eligibility rules. Every rule can only suppress; none re-enables a
  candidate, so evaluation order between rule kinds does not change the
  outcome.
*/

// Recognized audio is already known content.
struct RecognizedRule {};

// Unrecognized clips shorter than the floor are too short to analyze.
struct DurationFloorRule {
  int64_t min_seconds = 10;
};

// Time-boxed title transitions configured per channel.
struct TitleTransitionRule {
  std::vector<SuppressionInterval> intervals;
};

// Outside every active shift of the channel. A null channel suppresses.
struct ShiftWindowRule {
  const model::ChannelSettings* channel = nullptr;
};

using Rule = std::variant<RecognizedRule, DurationFloorRule, TitleTransitionRule, ShiftWindowRule>;

inline bool Suppresses(const Rule& rule, const AnalysisCandidate& c) {
  return std::visit(
      [&](const auto& r) -> bool {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, RecognizedRule>) {
          return c.is_recognized;
        } else if constexpr (std::is_same_v<T, DurationFloorRule>) {
          return !c.is_recognized && c.duration_seconds && *c.duration_seconds < r.min_seconds;
        } else if constexpr (std::is_same_v<T, TitleTransitionRule>) {
          for (const auto& iv : r.intervals) {
            if (iv.Covers(c.start_time, c.end_time)) return true;
          }
          return false;
        } else {
          return r.channel == nullptr || !timeline::IsWithinAnyShift(*r.channel, c.start_time, c.end_time);
        }
      },
      rule);
}

inline std::string_view RuleName(const Rule& rule) {
  static constexpr std::string_view kNames[] = {"recognized", "duration_floor", "title_transition", "shift_window"};
  return kNames[rule.index()];
}

// Applies rules in order; the first suppressing rule is reported through
// matched (when given). Returns true when the candidate was suppressed.
inline bool ApplyRules(const std::vector<Rule>& rules, AnalysisCandidate& c, const Rule** matched = nullptr) {
  if (!c.requires_analysis) return false;
  for (const auto& rule : rules) {
    if (Suppresses(rule, c)) {
      c.requires_analysis = false;
      if (matched) *matched = &rule;
      return true;
    }
  }
  return false;
}

} // namespace airtime::eligibility
