#pragma once

#include <string>

#include "internal/util/time.hpp"

namespace airtime::model {

// One provider detection, already parsed and resolved to a title.
struct RecognitionEvent {
  util::TimePoint timestamp{};
  double          played_duration_seconds = 0.0;
  std::string     title;
  std::string     metadata_json;
};

} // namespace airtime::model
