#include "recognition_source.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace airtime::ingest {

namespace {

std::vector<model::RecognitionEvent> FromNode(const YAML::Node& root) {
  std::vector<model::RecognitionEvent> events;

  const auto list = root["events"];
  if (!list) return events;
  if (!list.IsSequence()) {
    throw util::InvalidArgument("'events' must be a sequence");
  }

  for (std::size_t i = 0; i < list.size(); ++i) {
    const auto& item = list[i];
    try {
      model::RecognitionEvent event;
      event.timestamp               = util::ParseUtc(item["timestamp_utc"].as<std::string>());
      event.played_duration_seconds = item["played_duration"].as<double>();
      event.title                   = item["title"] ? item["title"].as<std::string>() : std::string();
      if (item["metadata"]) {
        event.metadata_json = config::ConfigLoader::YamlToJson(item["metadata"]);
      }
      events.push_back(std::move(event));
    } catch (const std::exception& e) {
      AIRTIME_LOG_WARN("recognition event skipped: malformed entry",
                       {observability::IntField("index", static_cast<int64_t>(i)), observability::StringField("error", e.what())});
    }
  }
  return events;
}

} // namespace

std::vector<model::RecognitionEvent> YamlRecognitionSource::Fetch(const model::ChannelSettings& channel) {
  if (channel.events_path.empty()) {
    AIRTIME_LOG_INFO("channel has no events file", {observability::IntField("channel_id", channel.id)});
    return {};
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(channel.events_path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load events file " + channel.events_path + ": " + e.what());
  }
  return FromNode(root);
}

std::vector<model::RecognitionEvent> YamlRecognitionSource::ParseYaml(const std::string& yaml_text) {
  return FromNode(YAML::Load(yaml_text));
}

} // namespace airtime::ingest
