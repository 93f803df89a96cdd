#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace airtime::model {

// Provenance tag of a persisted segment.
enum class SegmentSource : std::uint8_t {
  kRecognition = 0,
  kMerged      = 1,
  kUser        = 2,
};

constexpr std::string_view ToString(SegmentSource source) {
  switch (source) {
    case SegmentSource::kMerged:
      return "merged";
    case SegmentSource::kUser:
      return "user";
    case SegmentSource::kRecognition:
    default:
      return "recognition";
  }
}

constexpr std::optional<SegmentSource> ParseSegmentSource(std::string_view value) {
  if (value == "recognition") return SegmentSource::kRecognition;
  if (value == "merged") return SegmentSource::kMerged;
  if (value == "user") return SegmentSource::kUser;
  return std::nullopt;
}

} // namespace airtime::model
