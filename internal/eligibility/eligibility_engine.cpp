#include "eligibility_engine.hpp"

#include <algorithm>
#include <map>

#include "internal/eligibility/rules.hpp"
#include "internal/eligibility/suppression_intervals.hpp"
#include "internal/observability/logging.hpp"

namespace airtime::eligibility {

using observability::IntField;
using observability::StringField;

namespace {

void LogSuppressed(const AnalysisCandidate& c, const Rule& rule) {
  AIRTIME_LOG_DEBUG("segment not eligible for analysis",
                    {IntField("channel_id", c.channel_id), IntField("segment_id", c.id), StringField("rule", RuleName(rule))});
}

void Apply(const std::vector<Rule>& rules, AnalysisCandidate& c) {
  const Rule* matched = nullptr;
  if (ApplyRules(rules, c, &matched)) LogSuppressed(c, *matched);
}

} // namespace

EligibilityEngine::EligibilityEngine(std::shared_ptr<db::Repository> repository, EligibilityOptions options)
    : repository_(std::move(repository)), options_(options) {
}

EligibilityResult EligibilityEngine::MarkRequiresAnalysis(const model::ChannelSettings& channel, std::vector<AnalysisCandidate> segments) {
  return MarkRequiresAnalysis(std::vector<model::ChannelSettings>{channel}, std::move(segments));
}

EligibilityResult EligibilityEngine::MarkRequiresAnalysis(const std::vector<model::ChannelSettings>& channels,
                                                          std::vector<AnalysisCandidate> segments) {
  EligibilityResult result;
  result.segments = std::move(segments);

  // 1-2: immediate rules
  const std::vector<Rule> immediate = {RecognizedRule{}, DurationFloorRule{options_.min_unrecognized_seconds}};
  for (auto& c : result.segments) {
    c.requires_analysis = true;
    Apply(immediate, c);
  }

  std::map<int64_t, std::vector<AnalysisCandidate*>> by_channel;
  for (auto& c : result.segments) by_channel[c.channel_id].push_back(&c);

  for (auto& [channel_id, timeline] : by_channel) {
    std::stable_sort(timeline.begin(), timeline.end(),
                     [](const AnalysisCandidate* a, const AnalysisCandidate* b) { return a->start_time < b->start_time; });

    const auto it = std::find_if(channels.begin(), channels.end(), [&](const model::ChannelSettings& ch) { return ch.id == channel_id; });
    if (it == channels.end()) {
      AIRTIME_LOG_WARN("no settings for channel, suppressing its segments", {IntField("channel_id", channel_id)});
      for (auto* c : timeline) Apply({ShiftWindowRule{nullptr}}, *c);
      Finalize(channel_id, timeline, result);
      continue;
    }
    const auto& channel = *it;

    // 3: title-transition suppression
    std::vector<model::TitleMappingRule> active_rules;
    for (const auto& rule : channel.title_rules) {
      if (rule.is_active) active_rules.push_back(rule);
    }

    const Timeline view(timeline.begin(), timeline.end());
    const auto     index     = BuildTitleIndex(view);
    auto           intervals = BuildSuppressionIntervals(view, index, active_rules, options_.suppression_window);
    if (!intervals.empty()) {
      AIRTIME_LOG_DEBUG("title suppression intervals built",
                        {IntField("channel_id", channel_id), IntField("intervals", static_cast<int64_t>(intervals.size()))});
      const std::vector<Rule> transition = {TitleTransitionRule{std::move(intervals)}};
      for (auto* c : timeline) Apply(transition, *c);
    }

    // 4: rename
    RenameAfterBeforeTitles(channel, timeline, result);

    // 5: shift membership
    const bool has_shift = std::any_of(channel.shifts.begin(), channel.shifts.end(), [](const model::Shift& s) { return s.is_active; });
    if (!has_shift) {
      AIRTIME_LOG_INFO("channel has no active shifts, all segments suppressed", {IntField("channel_id", channel_id)});
    }
    const std::vector<Rule> shift = {ShiftWindowRule{&channel}};
    for (auto* c : timeline) Apply(shift, *c);

    // 6: persist
    Finalize(channel_id, timeline, result);
  }

  for (const auto& c : result.segments) {
    if (c.requires_analysis) {
      ++result.eligible;
    } else {
      ++result.suppressed;
    }
  }

  AIRTIME_LOG_INFO("eligibility evaluated",
                   {IntField("segments", static_cast<int64_t>(result.segments.size())), IntField("eligible", static_cast<int64_t>(result.eligible)),
                    IntField("suppressed", static_cast<int64_t>(result.suppressed)), IntField("renamed", static_cast<int64_t>(result.renamed)),
                    IntField("deactivated", static_cast<int64_t>(result.deactivated)), IntField("failed", static_cast<int64_t>(result.failed))});
  return result;
}

void EligibilityEngine::RenameAfterBeforeTitles(const model::ChannelSettings& channel, std::vector<AnalysisCandidate*>& timeline,
                                                EligibilityResult& result) {
  // Indexed on titles as they were before any rename, so renames never chain.
  const Timeline view(timeline.begin(), timeline.end());
  const auto     index = BuildTitleIndex(view);

  for (const auto& rule : channel.title_rules) {
    if (!rule.is_active || rule.category.empty()) continue;

    const auto it = index.find(rule.before_title);
    if (it == index.end()) continue;

    const auto new_title = rule.category.substr(0, kMaxTitleLength);
    for (const auto b : it->second) {
      if (b + 1 >= timeline.size()) continue;
      auto* next = timeline[b + 1];
      if (next->is_recognized || next->title == new_title) continue;

      next->title = new_title;
      if (next->id == 0) continue;

      try {
        auto tx = repository_->Begin();
        db::ThrowIfDbError(repository_->UpdateSegmentTitle(*tx, next->id, new_title), "rename segment " + std::to_string(next->id));
        tx->Commit();
        ++result.renamed;
        AIRTIME_LOG_INFO("segment renamed from title rule",
                         {IntField("channel_id", channel.id), IntField("segment_id", next->id), StringField("title", new_title)});
      } catch (const std::exception& e) {
        AIRTIME_LOG_ERROR("segment rename failed", {IntField("segment_id", next->id), StringField("error", e.what())});
        ++result.failed;
      }
    }
  }
}

void EligibilityEngine::Finalize(int64_t channel_id, const std::vector<AnalysisCandidate*>& timeline, EligibilityResult& result) {
  std::vector<int64_t> eligible;
  std::vector<int64_t> suppressed;
  for (const auto* c : timeline) {
    if (c->id == 0) continue;
    (c->requires_analysis ? eligible : suppressed).push_back(c->id);
  }
  if (eligible.empty() && suppressed.empty()) return;

  try {
    auto tx = repository_->Begin();
    db::ThrowIfDbError(repository_->SetRequiresAnalysis(*tx, eligible, true), "mark eligible segments");
    db::ThrowIfDbError(repository_->SetRequiresAnalysis(*tx, suppressed, false), "mark suppressed segments");
    db::ThrowIfDbError(repository_->SetSegmentsActive(*tx, suppressed, false), "deactivate suppressed segments");
    tx->Commit();
    result.deactivated += suppressed.size();
  } catch (const std::exception& e) {
    AIRTIME_LOG_ERROR("eligibility finalization failed", {IntField("channel_id", channel_id), StringField("error", e.what())});
    ++result.failed;
  }
}

} // namespace airtime::eligibility
