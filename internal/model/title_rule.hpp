#pragma once

#include <string>

namespace airtime::model {

/*
  Title transition rule, configured per channel by operators.

  Read-only to the pipeline. An empty after_title suppresses only the
  before_title segments themselves.
*/
struct TitleMappingRule {
  std::string before_title;
  std::string after_title;
  std::string category;
  bool        skip_transcription = true;
  bool        is_active          = true;
};

} // namespace airtime::model
