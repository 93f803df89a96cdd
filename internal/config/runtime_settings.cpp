#include "runtime_settings.hpp"

#include <set>

#include "internal/util/errors.hpp"

namespace airtime::config {

using airtime::runtime::config::ChannelConfig;
using airtime::runtime::config::RuntimeConfig;

namespace {

absl::Weekday ToWeekday(const std::string& value, const std::string& context) {
  const auto day = model::ParseWeekday(value);
  if (!day) {
    throw util::InvalidArgument(context + ": unknown weekday '" + value + "'");
  }
  return *day;
}

void RequireDistinct(const model::TimeOfDay& start, const model::TimeOfDay& end, const std::string& context) {
  if (start == end) {
    throw util::InvalidArgument(context + ": start_time equals end_time");
  }
}

util::Micros SecondsOr(bool has, double seconds, util::Micros fallback) {
  return has ? util::SecondsToMicros(seconds) : fallback;
}

} // namespace

model::ChannelSettings ToChannelSettings(const ChannelConfig& config) {
  if (config.id() == 0) {
    throw util::InvalidArgument("channel id must be set");
  }

  model::ChannelSettings channel;
  channel.id                  = config.id();
  channel.name                = config.name();
  channel.timezone            = config.timezone();
  channel.project_id          = config.project_id();
  channel.provider_channel_id = config.provider_channel_id();
  channel.events_path         = config.events_path();

  // fail fast on unknown zones
  util::LoadZone(channel.timezone);

  const auto prefix = "channel " + std::to_string(channel.id);

  for (const auto& s : config.shifts()) {
    const auto context = prefix + " shift '" + s.name() + "'";

    model::Shift shift;
    shift.name       = s.name();
    shift.start_time = model::ParseTimeOfDay(s.start_time());
    shift.end_time   = model::ParseTimeOfDay(s.end_time());
    RequireDistinct(shift.start_time, shift.end_time, context);
    for (const auto& day : s.days()) {
      shift.days.push_back(ToWeekday(day, context));
    }
    shift.is_active = s.has_is_active() ? s.is_active() : true;
    channel.shifts.push_back(std::move(shift));
  }

  for (const auto& r : config.title_rules()) {
    if (r.before_title().empty()) {
      throw util::InvalidArgument(prefix + ": title rule without before_title");
    }

    model::TitleMappingRule rule;
    rule.before_title       = r.before_title();
    rule.after_title        = r.after_title();
    rule.category           = r.category();
    rule.skip_transcription = r.has_skip_transcription() ? r.skip_transcription() : true;
    rule.is_active          = r.has_is_active() ? r.is_active() : true;
    channel.title_rules.push_back(std::move(rule));
  }

  for (const auto& f : config.schedule_filters()) {
    const auto context = prefix + " filter '" + f.name() + "'";

    model::ScheduleFilter filter;
    filter.name      = f.name();
    filter.is_active = f.has_is_active() ? f.is_active() : true;
    for (const auto& s : f.schedules()) {
      model::Schedule schedule;
      schedule.day_of_week = ToWeekday(s.day_of_week(), context);
      schedule.start_time  = model::ParseTimeOfDay(s.start_time());
      schedule.end_time    = model::ParseTimeOfDay(s.end_time());
      RequireDistinct(schedule.start_time, schedule.end_time, context);
      filter.schedules.push_back(schedule);
    }
    channel.schedule_filters.push_back(std::move(filter));
  }

  return channel;
}

std::vector<model::ChannelSettings> ToChannelSettings(const RuntimeConfig& config) {
  std::vector<model::ChannelSettings> channels;
  std::set<int64_t>                   seen;

  for (const auto& c : config.channels()) {
    if (!seen.insert(c.id()).second) {
      throw util::InvalidArgument("duplicate channel id " + std::to_string(c.id()));
    }
    channels.push_back(ToChannelSettings(c));
  }
  return channels;
}

timeline::SynthesisOptions ToSynthesisOptions(const RuntimeConfig& config) {
  timeline::SynthesisOptions options;
  const auto&                s = config.synthesis();
  options.gap_threshold        = SecondsOr(s.has_gap_threshold_seconds(), s.gap_threshold_seconds(), options.gap_threshold);
  return options;
}

ingest::IngestOptions ToIngestOptions(const RuntimeConfig& config) {
  ingest::IngestOptions options;
  const auto&           i = config.ingest();
  options.overlap_tolerance = SecondsOr(i.has_overlap_tolerance_seconds(), i.overlap_tolerance_seconds(), options.overlap_tolerance);
  if (i.has_session_window_seconds()) {
    options.session_window = std::chrono::seconds(i.session_window_seconds());
  }
  return options;
}

merge::MergeOptions ToMergeOptions(const RuntimeConfig& config) {
  merge::MergeOptions options;
  const auto&         m = config.merge();
  if (m.has_min_recognized_seconds()) {
    options.min_recognized_seconds = m.min_recognized_seconds();
  }
  options.adjacency_tolerance =
      SecondsOr(m.has_adjacency_tolerance_seconds(), m.adjacency_tolerance_seconds(), options.adjacency_tolerance);
  return options;
}

eligibility::EligibilityOptions ToEligibilityOptions(const RuntimeConfig& config) {
  eligibility::EligibilityOptions options;
  const auto&                     e = config.eligibility();
  if (e.has_min_unrecognized_seconds()) {
    options.min_unrecognized_seconds = e.min_unrecognized_seconds();
  }
  if (e.has_suppression_window_seconds()) {
    options.suppression_window = std::chrono::seconds(e.suppression_window_seconds());
  }
  return options;
}

unsigned WorkerThreads(const RuntimeConfig& config) {
  return config.workers().threads() == 0 ? 1u : config.workers().threads();
}

} // namespace airtime::config
