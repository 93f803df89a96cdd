#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <absl/time/civil_time.h>
#include <absl/time/time.h>

namespace airtime::util {

/*
  Time utilities - single place to control clock source and timezone lookup.

  All persisted instants are UTC with microsecond precision.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Micros    = std::chrono::microseconds;

TimePoint Now();

int64_t   ToUnixMicros(TimePoint tp);
TimePoint FromUnixMicros(int64_t micros);

absl::Time ToAbsl(TimePoint tp);
TimePoint  FromAbsl(absl::Time t);

// Fractional seconds, rounded to the nearest microsecond.
Micros SecondsToMicros(double seconds);

// Whole seconds between two instants, truncated toward zero.
int64_t WholeSeconds(TimePoint start, TimePoint end);

// "2025-08-12T09:59:29.000000Z"
std::string FormatUtc(TimePoint tp);
// Arbitrary absl format string, rendered in UTC.
std::string FormatUtc(TimePoint tp, const std::string& format);

// Accepts "YYYY-mm-dd HH:MM:SS" (UTC) and RFC3339 with optional fraction,
// "Z" or numeric offset. Throws InvalidArgument.
TimePoint ParseUtc(std::string_view value);

// Empty name means UTC. Throws InvalidArgument for unknown zones.
absl::TimeZone LoadZone(const std::string& name);

absl::CivilDay LocalDay(TimePoint tp, const absl::TimeZone& tz);

} // namespace airtime::util
