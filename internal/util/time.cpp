#include "time.hpp"

#include <cmath>

#include "internal/util/errors.hpp"

namespace airtime::util {

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixMicros(TimePoint tp) {
  return std::chrono::duration_cast<Micros>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMicros(int64_t micros) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(Micros(micros));
}

absl::Time ToAbsl(TimePoint tp) {
  return absl::FromUnixMicros(ToUnixMicros(tp));
}

TimePoint FromAbsl(absl::Time t) {
  return FromUnixMicros(absl::ToUnixMicros(t));
}

Micros SecondsToMicros(double seconds) {
  return Micros(static_cast<int64_t>(std::llround(seconds * 1'000'000.0)));
}

int64_t WholeSeconds(TimePoint start, TimePoint end) {
  return std::chrono::duration_cast<std::chrono::seconds>(end - start).count();
}

std::string FormatUtc(TimePoint tp) {
  return FormatUtc(tp, "%Y-%m-%dT%H:%M:%E6SZ");
}

std::string FormatUtc(TimePoint tp, const std::string& format) {
  return absl::FormatTime(format, ToAbsl(tp), absl::UTCTimeZone());
}

TimePoint ParseUtc(std::string_view value) {
  std::string input(value);
  std::string err;
  absl::Time  parsed;

  if (!input.empty() && (input.back() == 'Z' || input.back() == 'z')) {
    input.pop_back();
    if (absl::ParseTime("%Y-%m-%d%ET%H:%M:%E*S", input, absl::UTCTimeZone(), &parsed, &err)) {
      return FromAbsl(parsed);
    }
    throw InvalidArgument("invalid UTC timestamp '" + std::string(value) + "': " + err);
  }

  if (absl::ParseTime(absl::RFC3339_full, input, &parsed, &err)) {
    return FromAbsl(parsed);
  }
  if (absl::ParseTime("%Y-%m-%d %H:%M:%S", input, absl::UTCTimeZone(), &parsed, &err)) {
    return FromAbsl(parsed);
  }
  if (absl::ParseTime("%Y-%m-%d%ET%H:%M:%E*S", input, absl::UTCTimeZone(), &parsed, &err)) {
    return FromAbsl(parsed);
  }
  throw InvalidArgument("invalid UTC timestamp '" + std::string(value) + "': " + err);
}

absl::TimeZone LoadZone(const std::string& name) {
  if (name.empty() || name == "UTC") {
    return absl::UTCTimeZone();
  }
  absl::TimeZone tz;
  if (!absl::LoadTimeZone(name, &tz)) {
    throw InvalidArgument("unknown timezone: " + name);
  }
  return tz;
}

absl::CivilDay LocalDay(TimePoint tp, const absl::TimeZone& tz) {
  return absl::ToCivilDay(ToAbsl(tp), tz);
}

} // namespace airtime::util
