#include "internal/eligibility/eligibility_engine.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/ingest/segment_ingestor.hpp"

namespace {

using airtime::db::memory::MemoryRepository;
using airtime::eligibility::AnalysisCandidate;
using airtime::eligibility::EligibilityEngine;
using airtime::ingest::SegmentIngestor;
using airtime::model::ChannelSettings;
using airtime::model::SegmentCandidate;
using airtime::model::Shift;
using airtime::model::TimeOfDay;
using airtime::model::TitleMappingRule;
using airtime::util::ParseUtc;

SegmentCandidate Recognized(const char* start, const char* end, const char* title) {
  SegmentCandidate c;
  c.start_time       = ParseUtc(start);
  c.end_time         = ParseUtc(end);
  c.duration_seconds = airtime::util::WholeSeconds(c.start_time, c.end_time);
  c.is_recognized    = true;
  c.title            = title;
  return c;
}

SegmentCandidate Gap(const char* start, const char* end, const char* before, const char* after) {
  SegmentCandidate c;
  c.start_time       = ParseUtc(start);
  c.end_time         = ParseUtc(end);
  c.duration_seconds = airtime::util::WholeSeconds(c.start_time, c.end_time);
  c.title_before     = before;
  c.title_after      = after;
  return c;
}

Shift AllDay() {
  Shift shift;
  shift.name       = "all_day";
  shift.start_time = TimeOfDay{};
  shift.end_time   = airtime::model::kEndOfDay;
  return shift;
}

ChannelSettings MakeChannel() {
  ChannelSettings channel;
  channel.id       = 9;
  channel.timezone = "UTC";
  channel.shifts.push_back(AllDay());

  TitleMappingRule news;
  news.before_title = "News Intro";
  news.after_title  = "News Outro";
  news.category     = "News";
  channel.title_rules.push_back(news);
  return channel;
}

// index: 0 R1, 1 G1, 2 R2, 3 G2 (8s), 4 R3, 5 G3, 6 R4
std::vector<AnalysisCandidate> PersistTimeline(const std::shared_ptr<MemoryRepository>& repo, const ChannelSettings& channel) {
  SegmentIngestor ingestor(repo);
  const auto      report = ingestor.Ingest(channel, {
                                                   Recognized("2025-08-12 10:00:00", "2025-08-12 10:01:00", "News Intro"),
                                                   Gap("2025-08-12 10:01:00", "2025-08-12 10:03:00", "News Intro", "Song"),
                                                   Recognized("2025-08-12 10:03:00", "2025-08-12 10:20:00", "Song"),
                                                   Gap("2025-08-12 10:20:00", "2025-08-12 10:20:08", "Song", "Song 2"),
                                                   Recognized("2025-08-12 10:20:08", "2025-08-12 10:30:00", "Song 2"),
                                                   Gap("2025-08-12 10:30:00", "2025-08-12 10:32:00", "Song 2", "End"),
                                                   Recognized("2025-08-12 10:32:00", "2025-08-12 10:40:00", "End"),
                                               });
  assert(report.inserted == 7);

  std::vector<AnalysisCandidate> candidates;
  for (const auto& record : report.segments) candidates.push_back(AnalysisCandidate::FromRecord(record));
  return candidates;
}

void TestFullRuleChain() {
  auto       repo       = std::make_shared<MemoryRepository>();
  const auto channel    = MakeChannel();
  auto       candidates = PersistTimeline(repo, channel);

  EligibilityEngine engine(repo);
  const auto        result = engine.MarkRequiresAnalysis(channel, candidates);

  assert(result.segments.size() == 7);
  assert(result.eligible == 1);
  assert(result.suppressed == 6);
  assert(result.renamed == 1);
  assert(result.deactivated == 6);
  assert(result.failed == 0);

  const auto& g1 = result.segments[1];
  assert(!g1.requires_analysis);
  assert(g1.title == std::optional<std::string>("News"));

  assert(!result.segments[3].requires_analysis);
  assert(result.segments[5].requires_analysis);

  auto tx = repo->Begin();
  const auto g1_row = repo->GetSegment(*tx, g1.id);
  assert(g1_row->title == std::optional<std::string>("News"));
  assert(!g1_row->requires_analysis && !g1_row->is_active);

  const auto g3_row = repo->GetSegment(*tx, result.segments[5].id);
  assert(g3_row->requires_analysis && g3_row->is_active);
}

void TestShortUnrecognizedIsNeverEligible() {
  auto       repo    = std::make_shared<MemoryRepository>();
  const auto channel = MakeChannel();

  AnalysisCandidate clip;
  clip.channel_id       = channel.id;
  clip.start_time       = ParseUtc("2025-08-12 12:00:00");
  clip.end_time         = ParseUtc("2025-08-12 12:00:08");
  clip.duration_seconds = 8;

  EligibilityEngine engine(repo);
  const auto        result = engine.MarkRequiresAnalysis(channel, {clip});
  assert(!result.segments[0].requires_analysis);
  assert(result.deactivated == 0);

  // Unknown duration skips the floor.
  clip.duration_seconds.reset();
  assert(engine.MarkRequiresAnalysis(channel, {clip}).segments[0].requires_analysis);
}

void TestNoShiftsSuppressesEverything() {
  auto repo    = std::make_shared<MemoryRepository>();
  auto channel = MakeChannel();
  channel.shifts.clear();
  auto candidates = PersistTimeline(repo, channel);

  EligibilityEngine engine(repo);
  const auto        result = engine.MarkRequiresAnalysis(channel, candidates);
  assert(result.eligible == 0);
  assert(result.suppressed == 7);
}

void TestSegmentOutsideShiftIsSuppressed() {
  auto repo    = std::make_shared<MemoryRepository>();
  auto channel = MakeChannel();
  channel.shifts[0].start_time = TimeOfDay{9, 0};
  channel.shifts[0].end_time   = TimeOfDay{10, 15};
  auto candidates              = PersistTimeline(repo, channel);

  EligibilityEngine engine(repo);
  const auto        result = engine.MarkRequiresAnalysis(channel, candidates);
  assert(result.eligible == 0);
  assert(!result.segments[5].requires_analysis);
}

void TestUnknownChannelIsSuppressed() {
  auto       repo       = std::make_shared<MemoryRepository>();
  const auto channel    = MakeChannel();
  auto       candidates = PersistTimeline(repo, channel);

  EligibilityEngine engine(repo);
  const auto        result = engine.MarkRequiresAnalysis(std::vector<ChannelSettings>{}, candidates);
  assert(result.eligible == 0);
  assert(result.renamed == 0);
}

void TestEveryActiveRuleSuppresses() {
  auto repo    = std::make_shared<MemoryRepository>();
  auto channel = MakeChannel();
  channel.title_rules[0].skip_transcription = false;
  auto candidates                           = PersistTimeline(repo, channel);

  EligibilityEngine engine(repo);
  const auto        result = engine.MarkRequiresAnalysis(channel, candidates);
  assert(result.renamed == 1);
  assert(!result.segments[1].requires_analysis);
  assert(result.segments[1].title == std::optional<std::string>("News"));
  assert(result.eligible == 1);

  // Title already matches: nothing is written again.
  auto again = candidates;
  again[1].title = "News";
  assert(engine.MarkRequiresAnalysis(channel, again).renamed == 0);
}

void TestInactiveRuleIsIgnored() {
  auto repo    = std::make_shared<MemoryRepository>();
  auto channel = MakeChannel();
  channel.title_rules[0].is_active = false;
  auto candidates                  = PersistTimeline(repo, channel);

  EligibilityEngine engine(repo);
  const auto        result = engine.MarkRequiresAnalysis(channel, candidates);
  assert(result.renamed == 0);
  assert(result.segments[1].requires_analysis);
}

} // namespace

int main() {
  TestFullRuleChain();
  TestShortUnrecognizedIsNeverEligible();
  TestNoShiftsSuppressesEverything();
  TestSegmentOutsideShiftIsSuppressed();
  TestUnknownChannelIsSuppressed();
  TestEveryActiveRuleSuppresses();
  TestInactiveRuleIsIgnored();

  std::cout << "airtime_unit_eligibility_engine: pass\n";
  return 0;
}
