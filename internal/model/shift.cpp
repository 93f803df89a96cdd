#include "shift.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace airtime::model {

namespace {

struct WeekdayName {
  absl::Weekday    day;
  std::string_view name;
};

constexpr std::array<WeekdayName, 7> kWeekdays = {{
    {absl::Weekday::monday, "monday"},
    {absl::Weekday::tuesday, "tuesday"},
    {absl::Weekday::wednesday, "wednesday"},
    {absl::Weekday::thursday, "thursday"},
    {absl::Weekday::friday, "friday"},
    {absl::Weekday::saturday, "saturday"},
    {absl::Weekday::sunday, "sunday"},
}};

} // namespace

bool Shift::AppliesOn(absl::Weekday day) const {
  return days.empty() || std::find(days.begin(), days.end(), day) != days.end();
}

std::optional<absl::Weekday> ParseWeekday(std::string_view value) {
  std::string lowered;
  lowered.reserve(value.size());
  for (char c : value) {
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  for (const auto& entry : kWeekdays) {
    if (entry.name == lowered) return entry.day;
  }
  return std::nullopt;
}

std::string_view ToString(absl::Weekday day) {
  for (const auto& entry : kWeekdays) {
    if (entry.day == day) return entry.name;
  }
  return "unknown";
}

} // namespace airtime::model
