#include "internal/timeline/timeline_synthesizer.hpp"

#include <cassert>
#include <iostream>
#include <limits>

namespace {

using airtime::model::RecognitionEvent;
using airtime::timeline::SynthesisOptions;
using airtime::timeline::TimelineSynthesizer;
using airtime::util::ParseUtc;

RecognitionEvent Event(const char* timestamp, double seconds, const char* title) {
  RecognitionEvent event;
  event.timestamp               = ParseUtc(timestamp);
  event.played_duration_seconds = seconds;
  event.title                   = title;
  return event;
}

void TestGapIsSynthesizedBetweenRecognizedEvents() {
  const TimelineSynthesizer synthesizer;
  const auto                timeline =
      synthesizer.Synthesize({Event("2025-08-12 10:00:00", 300, "X"), Event("2025-08-12 10:05:30", 200, "Y")});

  assert(timeline.accepted == 2);
  assert(timeline.segments.size() == 3);

  const auto& x = timeline.segments[0];
  assert(x.is_recognized && x.title == "X");
  assert(x.start_time == ParseUtc("2025-08-12 10:00:00"));
  assert(x.end_time == ParseUtc("2025-08-12 10:05:00"));
  assert(x.duration_seconds == 300);

  const auto& gap = timeline.segments[1];
  assert(!gap.is_recognized);
  assert(gap.start_time == ParseUtc("2025-08-12 10:05:00"));
  assert(gap.end_time == ParseUtc("2025-08-12 10:05:30"));
  assert(gap.duration_seconds == 30);
  assert(gap.title_before == "X" && gap.title_after == "Y");

  const auto& y = timeline.segments[2];
  assert(y.is_recognized && y.title == "Y");
  assert(y.end_time == ParseUtc("2025-08-12 10:08:50"));
}

void TestContainedEventIsDiscarded() {
  const TimelineSynthesizer synthesizer;
  const auto                timeline =
      synthesizer.Synthesize({Event("2025-08-12 10:00:00", 300, "X"), Event("2025-08-12 10:01:00", 60, "Inner")});

  assert(timeline.accepted == 1);
  assert(timeline.discarded_overlap == 1);
  assert(timeline.segments.size() == 1);
}

void TestShortExtensionIsDiscarded() {
  const TimelineSynthesizer synthesizer;

  // Extends X by one second only; threshold is two.
  const auto short_tail =
      synthesizer.Synthesize({Event("2025-08-12 10:00:00", 300, "X"), Event("2025-08-12 10:04:00", 61, "Tail")});
  assert(short_tail.accepted == 1);
  assert(short_tail.discarded_overlap == 1);

  // Extends X by 30 seconds: kept, trimmed to start where X ends.
  const auto long_tail =
      synthesizer.Synthesize({Event("2025-08-12 10:00:00", 300, "X"), Event("2025-08-12 10:04:30", 60, "Tail")});
  assert(long_tail.accepted == 2);
  assert(long_tail.segments.size() == 2);
  assert(long_tail.segments[1].start_time == ParseUtc("2025-08-12 10:05:00"));
  assert(long_tail.segments[1].end_time == ParseUtc("2025-08-12 10:05:30"));
  assert(long_tail.segments[1].duration_seconds == 30);
}

void TestThresholdIsConfigurable() {
  SynthesisOptions options;
  options.gap_threshold = std::chrono::seconds(60);
  const TimelineSynthesizer synthesizer(options);

  const auto timeline =
      synthesizer.Synthesize({Event("2025-08-12 10:00:00", 300, "X"), Event("2025-08-12 10:04:30", 60, "Tail")});
  assert(timeline.accepted == 1);
  assert(timeline.discarded_overlap == 1);
}

void TestTouchingEventsProduceNoGap() {
  const TimelineSynthesizer synthesizer;
  const auto                timeline =
      synthesizer.Synthesize({Event("2025-08-12 10:00:00", 300, "X"), Event("2025-08-12 10:05:00", 120, "Y")});

  assert(timeline.segments.size() == 2);
  assert(timeline.segments[0].is_recognized && timeline.segments[1].is_recognized);
}

void TestSingleAndInvalidEvents() {
  const TimelineSynthesizer synthesizer;

  const auto single = synthesizer.Synthesize({Event("2025-08-12 10:00:00", 42.7, "Solo")});
  assert(single.segments.size() == 1);
  assert(single.segments[0].duration_seconds == 42);

  const auto invalid = synthesizer.Synthesize({Event("2025-08-12 10:00:00", 0, "Zero"), Event("2025-08-12 10:01:00", 30, "")});
  assert(invalid.segments.empty());
  assert(invalid.discarded_invalid == 2);

  assert(synthesizer.Synthesize({}).segments.empty());
}

void TestDurationFollowsSpanAndRejectsNonFinite() {
  const TimelineSynthesizer synthesizer;

  const auto timeline = synthesizer.Synthesize({Event("2025-08-12 10:00:00", 299.9999996, "X")});
  assert(timeline.segments.size() == 1);
  assert(timeline.segments[0].end_time == ParseUtc("2025-08-12 10:05:00"));
  assert(timeline.segments[0].duration_seconds == 300);

  const auto invalid = synthesizer.Synthesize({Event("2025-08-12 10:00:00", std::numeric_limits<double>::quiet_NaN(), "NaN"),
                                               Event("2025-08-12 10:01:00", std::numeric_limits<double>::infinity(), "Inf")});
  assert(invalid.segments.empty());
  assert(invalid.discarded_invalid == 2);
}

void TestOutOfOrderArrivalIsSorted() {
  const TimelineSynthesizer synthesizer;
  const auto                timeline =
      synthesizer.Synthesize({Event("2025-08-12 11:00:00", 60, "Late"), Event("2025-08-12 10:00:00", 60, "Early")});

  assert(timeline.segments.size() == 3);
  assert(timeline.segments[0].title == "Early");
  assert(timeline.segments[1].title_before == "Early" && timeline.segments[1].title_after == "Late");
  assert(timeline.segments[2].title == "Late");
}

} // namespace

int main() {
  TestGapIsSynthesizedBetweenRecognizedEvents();
  TestContainedEventIsDiscarded();
  TestShortExtensionIsDiscarded();
  TestThresholdIsConfigurable();
  TestTouchingEventsProduceNoGap();
  TestSingleAndInvalidEvents();
  TestDurationFollowsSpanAndRejectsNonFinite();
  TestOutOfOrderArrivalIsSorted();

  std::cout << "airtime_unit_timeline_synthesizer: pass\n";
  return 0;
}
