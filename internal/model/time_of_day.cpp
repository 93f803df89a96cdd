#include "time_of_day.hpp"

#include <charconv>
#include <cstdio>
#include <vector>

#include "internal/util/errors.hpp"

namespace airtime::model {

namespace {

int ParsePart(std::string_view part, std::string_view whole) {
  int value = 0;
  if (part.size() != 2) {
    throw util::InvalidArgument("invalid time of day: " + std::string(whole));
  }
  auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
  if (ec != std::errc() || ptr != part.data() + part.size()) {
    throw util::InvalidArgument("invalid time of day: " + std::string(whole));
  }
  return value;
}

} // namespace

TimeOfDay ParseTimeOfDay(std::string_view value) {
  std::vector<std::string_view> parts;
  std::size_t                   begin = 0;
  while (true) {
    const auto colon = value.find(':', begin);
    if (colon == std::string_view::npos) {
      parts.push_back(value.substr(begin));
      break;
    }
    parts.push_back(value.substr(begin, colon - begin));
    begin = colon + 1;
  }

  if (parts.size() != 2 && parts.size() != 3) {
    throw util::InvalidArgument("invalid time of day: " + std::string(value));
  }

  TimeOfDay tod;
  tod.hour   = ParsePart(parts[0], value);
  tod.minute = ParsePart(parts[1], value);
  if (parts.size() == 3) {
    tod.second = ParsePart(parts[2], value);
  }

  if (tod.hour > 23 || tod.minute > 59 || tod.second > 59) {
    throw util::InvalidArgument("time of day out of range: " + std::string(value));
  }
  return tod;
}

std::string ToString(const TimeOfDay& value) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d", value.hour, value.minute, value.second);
  return buffer;
}

} // namespace airtime::model
