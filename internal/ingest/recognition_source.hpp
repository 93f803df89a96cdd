#pragma once

#include <string>
#include <vector>

#include "internal/model/channel_settings.hpp"
#include "internal/model/recognition_event.hpp"

namespace airtime::ingest {

/*
  Provider of already-parsed recognition events for one channel.
*/
class RecognitionSource {
 public:
  virtual ~RecognitionSource() = default;

  virtual std::vector<model::RecognitionEvent> Fetch(const model::ChannelSettings& channel) = 0;
};

/*
  Reads channel.events_path:

    events:
      - timestamp_utc: "2025-08-12 10:00:00"
        played_duration: 300
        title: "X"
        metadata: {...}      # optional, kept as JSON

  Malformed entries are logged and skipped; an unreadable file throws.
*/
class YamlRecognitionSource final : public RecognitionSource {
 public:
  std::vector<model::RecognitionEvent> Fetch(const model::ChannelSettings& channel) override;

  static std::vector<model::RecognitionEvent> ParseYaml(const std::string& yaml_text);
};

} // namespace airtime::ingest
