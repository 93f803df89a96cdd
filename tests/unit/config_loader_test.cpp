#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/runtime_settings.hpp"
#include "internal/util/errors.hpp"

namespace {

using airtime::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "airtime_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Fn>
bool ThrowsInvalidArgument(Fn&& fn) {
  try {
    fn();
  } catch (const airtime::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestFullConfigIsLoaded() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
database:
  sqlite:
    path: "C:\\airtime\\\"quoted\"\\db.sqlite"
    wal_mode: true
synthesis:
  gap_threshold_seconds: 2.5
ingest:
  session_window_seconds: 600
merge:
  min_recognized_seconds: 15
eligibility:
  suppression_window_seconds: 300
workers:
  threads: 3
channels:
  - id: 4
    name: "Radio Four"
    timezone: "UTC"
    project_id: 7
    provider_channel_id: 1201
    shifts:
      - name: "Overnight"
        start_time: "22:00"
        end_time: "06:00:30"
        days: [monday, Friday]
    title_rules:
      - before_title: "024010108"
        after_title: "News Outro"
        category: "News"
        skip_transcription: false
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\airtime\\\"quoted\"\\db.sqlite");
  assert(config.channels_size() == 1);

  const auto channels = airtime::config::ToChannelSettings(config);
  assert(channels.size() == 1);

  const auto& channel = channels[0];
  assert(channel.id == 4);
  assert(channel.provider_channel_id == 1201);
  assert(channel.shifts.size() == 1);
  assert(channel.shifts[0].IsOvernight());
  assert(channel.shifts[0].end_time.second == 30);
  assert(channel.shifts[0].days.size() == 2);
  assert(channel.shifts[0].days[1] == absl::Weekday::friday);

  // quoted numeric-looking titles stay strings
  assert(channel.title_rules[0].before_title == "024010108");
  assert(!channel.title_rules[0].skip_transcription);
  assert(channel.title_rules[0].is_active);

  assert(airtime::config::ToSynthesisOptions(config).gap_threshold == std::chrono::milliseconds(2500));
  assert(airtime::config::ToIngestOptions(config).session_window == std::chrono::seconds(600));
  assert(airtime::config::ToIngestOptions(config).overlap_tolerance == std::chrono::seconds(1));
  assert(airtime::config::ToMergeOptions(config).min_recognized_seconds == 15);
  assert(airtime::config::ToEligibilityOptions(config).suppression_window == std::chrono::minutes(5));
  assert(airtime::config::ToEligibilityOptions(config).min_unrecognized_seconds == 10);
  assert(airtime::config::WorkerThreads(config) == 3);
}

void TestDefaultsWhenSectionsAreMissing() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  memory: {}
)");
  assert(config.database().has_memory());
  assert(airtime::config::ToChannelSettings(config).empty());
  assert(airtime::config::ToMergeOptions(config).min_recognized_seconds == 20);
  assert(airtime::config::WorkerThreads(config) == 1);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  memory: {}
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMalformedChannelsAreRejected() {
  const auto bad_time = ConfigLoader::LoadFromYamlString(R"(channels:
  - id: 1
    shifts:
      - name: "Broken"
        start_time: "25:00"
        end_time: "06:00"
)");
  assert(ThrowsInvalidArgument([&] { (void)airtime::config::ToChannelSettings(bad_time); }));

  const auto empty_shift = ConfigLoader::LoadFromYamlString(R"(channels:
  - id: 1
    shifts:
      - name: "Zero"
        start_time: "06:00"
        end_time: "06:00"
)");
  assert(ThrowsInvalidArgument([&] { (void)airtime::config::ToChannelSettings(empty_shift); }));

  const auto bad_day = ConfigLoader::LoadFromYamlString(R"(channels:
  - id: 1
    shifts:
      - name: "Day"
        start_time: "06:00"
        end_time: "10:00"
        days: [someday]
)");
  assert(ThrowsInvalidArgument([&] { (void)airtime::config::ToChannelSettings(bad_day); }));

  const auto bad_zone = ConfigLoader::LoadFromYamlString(R"(channels:
  - id: 1
    timezone: "Nowhere/Imaginary"
)");
  assert(ThrowsInvalidArgument([&] { (void)airtime::config::ToChannelSettings(bad_zone); }));

  const auto duplicate = ConfigLoader::LoadFromYamlString(R"(channels:
  - id: 1
  - id: 1
)");
  assert(ThrowsInvalidArgument([&] { (void)airtime::config::ToChannelSettings(duplicate); }));

  const auto no_before = ConfigLoader::LoadFromYamlString(R"(channels:
  - id: 1
    title_rules:
      - after_title: "Outro"
)");
  assert(ThrowsInvalidArgument([&] { (void)airtime::config::ToChannelSettings(no_before); }));
}

} // namespace

int main() {
  TestFullConfigIsLoaded();
  TestDefaultsWhenSectionsAreMissing();
  TestUnknownFieldsAreRejected();
  TestMalformedChannelsAreRejected();

  std::cout << "airtime_unit_config_loader: pass\n";
  return 0;
}
