#pragma once

#include <vector>

#include "config/config.pb.h"
#include "internal/eligibility/eligibility_engine.hpp"
#include "internal/ingest/segment_ingestor.hpp"
#include "internal/merge/segment_merge_engine.hpp"
#include "internal/model/channel_settings.hpp"
#include "internal/timeline/timeline_synthesizer.hpp"

namespace airtime::config {

/*
  RuntimeConfig (protobuf) -> validated, read-only domain snapshots.

  Unset optional fields fall back to the engine defaults. Malformed input
  throws util::InvalidArgument:
    - bad time of day, unknown weekday
    - shift or schedule with start == end
    - unknown timezone
    - duplicate channel id, channel id 0
*/

model::ChannelSettings ToChannelSettings(const airtime::runtime::config::ChannelConfig& config);

std::vector<model::ChannelSettings> ToChannelSettings(const airtime::runtime::config::RuntimeConfig& config);

timeline::SynthesisOptions     ToSynthesisOptions(const airtime::runtime::config::RuntimeConfig& config);
ingest::IngestOptions          ToIngestOptions(const airtime::runtime::config::RuntimeConfig& config);
merge::MergeOptions            ToMergeOptions(const airtime::runtime::config::RuntimeConfig& config);
eligibility::EligibilityOptions ToEligibilityOptions(const airtime::runtime::config::RuntimeConfig& config);

// At least one.
unsigned WorkerThreads(const airtime::runtime::config::RuntimeConfig& config);

} // namespace airtime::config
