#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using airtime::factory::Build;

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: airtime-pipeline <config.yaml> OR airtime-pipeline --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = airtime::config::ConfigLoader::LoadFromYaml(config_path);

    airtime::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    std::mutex                                reports_mutex;
    std::vector<airtime::pipeline::RunReport> reports;

    auto app = Build(config, std::make_shared<airtime::ingest::YamlRecognitionSource>(),
                     std::make_shared<airtime::pipeline::LoggingTranscriptionSubmitter>(),
                     [&](const airtime::pipeline::RunReport& report) {
                       std::lock_guard<std::mutex> lock(reports_mutex);
                       reports.push_back(report);
                     });

    AIRTIME_LOG_INFO("airtime pipeline started", {airtime::observability::IntField("channels", static_cast<int64_t>(app.channels.size()))});

    // ------------------------------------------------------------
    // One run per configured channel
    // ------------------------------------------------------------
    for (const auto& channel : app.channels) {
      app.scheduler->Enqueue({channel});
    }
    for (auto& worker : app.workers) {
      worker->Stop();
    }

    for (const auto& report : reports) {
      std::cout << "channel " << report.channel_id << ": events=" << report.events << " accepted=" << report.accepted
                << " discarded_overlap=" << report.discarded_overlap << " discarded_invalid=" << report.discarded_invalid
                << " inserted=" << report.inserted << " deduplicated=" << report.deduplicated << " deactivated=" << report.deactivated
                << " merges=" << report.merges << " eligible=" << report.eligible << " suppressed=" << report.suppressed
                << " submitted=" << report.submitted << std::endl;
    }

    AIRTIME_LOG_INFO("airtime pipeline finished", {airtime::observability::IntField("runs", static_cast<int64_t>(reports.size()))});
    airtime::observability::ShutdownLogging();

    if (reports.size() != app.channels.size()) return 3;
  } catch (const std::exception& e) {
    AIRTIME_LOG_ERROR("Fatal error", {airtime::observability::StringField("error", e.what())});
    airtime::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
