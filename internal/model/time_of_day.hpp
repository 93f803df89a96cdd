#pragma once

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

namespace airtime::model {

/*
  Local wall-clock time of day, microsecond precision.
*/
struct TimeOfDay {
  int hour   = 0;
  int minute = 0;
  int second = 0;
  int micros = 0;

  constexpr int64_t SinceMidnightMicros() const {
    return ((static_cast<int64_t>(hour) * 60 + minute) * 60 + second) * 1'000'000 + micros;
  }

  constexpr auto operator<=>(const TimeOfDay& other) const {
    return SinceMidnightMicros() <=> other.SinceMidnightMicros();
  }
  constexpr bool operator==(const TimeOfDay& other) const {
    return SinceMidnightMicros() == other.SinceMidnightMicros();
  }
};

inline constexpr TimeOfDay kEndOfDay{23, 59, 59, 999'999};

// "HH:MM" or "HH:MM:SS". Throws util::InvalidArgument.
TimeOfDay ParseTimeOfDay(std::string_view value);

std::string ToString(const TimeOfDay& value);

} // namespace airtime::model
