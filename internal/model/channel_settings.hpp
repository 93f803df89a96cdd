#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/shift.hpp"
#include "internal/model/title_rule.hpp"

namespace airtime::model {

/*
  Read-only configuration snapshot for one broadcast channel.

  Engines receive this explicitly; nothing looks configuration up globally.
*/
struct ChannelSettings {
  int64_t     id = 0;
  std::string name;
  std::string timezone; // IANA name, empty = UTC

  // identifiers on the recognition provider side, used for file naming
  int64_t project_id          = 0;
  int64_t provider_channel_id = 0;

  std::vector<Shift>            shifts;
  std::vector<TitleMappingRule> title_rules;
  std::vector<ScheduleFilter>   schedule_filters;

  std::string events_path;
};

} // namespace airtime::model
