#include "factory.hpp"

#include <string>
#include <vector>

#include "internal/config/runtime_settings.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/eligibility/eligibility_engine.hpp"
#include "internal/ingest/segment_ingestor.hpp"
#include "internal/merge/segment_merge_engine.hpp"
#include "internal/observability/logging.hpp"

namespace airtime::factory {

namespace {

void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS segments (id INTEGER PRIMARY KEY AUTOINCREMENT, channel_id INTEGER NOT NULL, start_us INTEGER NOT NULL, end_us INTEGER NOT NULL, duration_seconds INTEGER NOT NULL, is_recognized INTEGER NOT NULL, title TEXT, title_before TEXT, title_after TEXT, is_active INTEGER NOT NULL DEFAULT 1, is_delete INTEGER NOT NULL DEFAULT 0, source TEXT NOT NULL, requires_analysis INTEGER NOT NULL DEFAULT 0, metadata_json TEXT NOT NULL DEFAULT '', file_name TEXT NOT NULL, file_path TEXT NOT NULL UNIQUE, notes TEXT NOT NULL DEFAULT '', created_at_us INTEGER NOT NULL, CHECK (end_us > start_us));",
      "CREATE INDEX IF NOT EXISTS segments_channel_start ON segments(channel_id, start_us);",
      "CREATE INDEX IF NOT EXISTS segments_channel_span ON segments(channel_id, start_us, end_us);",
      "CREATE TABLE IF NOT EXISTS segment_edit_logs (id INTEGER PRIMARY KEY AUTOINCREMENT, segment_id INTEGER NOT NULL REFERENCES segments(id), action TEXT NOT NULL, trigger TEXT NOT NULL, source_segment_ids TEXT NOT NULL, notes TEXT NOT NULL DEFAULT '', created_at_us INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS segment_edit_logs_segment ON segment_edit_logs(segment_id);"};

  for (const auto& sql : kBootstrapSql) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id,channel_id,start_us,end_us,file_path,created_at_us FROM segments LIMIT 1;");
  sqlite_db->Exec("SELECT id,segment_id,action,trigger,source_segment_ids FROM segment_edit_logs LIMIT 1;");
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const airtime::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    const auto path = database.sqlite().path().empty() ? std::string(":memory:") : database.sqlite().path();
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path);
    sqlite_db->Configure(database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    AIRTIME_LOG_INFO("sqlite repository ready", {observability::StringField("path", path)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  AIRTIME_LOG_INFO("memory repository ready");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const airtime::runtime::config::RuntimeConfig& config, std::shared_ptr<ingest::RecognitionSource> source,
                  std::shared_ptr<pipeline::TranscriptionSubmitter> submitter, pipeline::PipelineWorker::ReportSink sink) {
  Application app;

  // ------------------------------------------------------------------
  // Configuration snapshots
  // ------------------------------------------------------------------
  app.channels   = config::ToChannelSettings(config);
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Engines
  // ------------------------------------------------------------------
  auto ingestor    = std::make_shared<ingest::SegmentIngestor>(app.repository, config::ToIngestOptions(config));
  auto merger      = std::make_shared<merge::SegmentMergeEngine>(app.repository, config::ToMergeOptions(config));
  auto eligibility = std::make_shared<eligibility::EligibilityEngine>(app.repository, config::ToEligibilityOptions(config));

  app.pipeline = std::make_shared<pipeline::ChannelPipeline>(timeline::TimelineSynthesizer(config::ToSynthesisOptions(config)),
                                                             std::move(ingestor), std::move(merger), std::move(eligibility),
                                                             std::move(submitter));

  // ------------------------------------------------------------------
  // Workers
  // ------------------------------------------------------------------
  app.scheduler = std::make_shared<pipeline::PipelineScheduler>();

  const auto threads = config::WorkerThreads(config);
  for (unsigned i = 0; i < threads; ++i) {
    auto worker = std::make_shared<pipeline::PipelineWorker>(app.scheduler, app.pipeline, source, sink);
    worker->Start();
    app.workers.push_back(std::move(worker));
  }

  AIRTIME_LOG_INFO("application built", {observability::IntField("channels", static_cast<int64_t>(app.channels.size())),
                                         observability::IntField("workers", threads)});
  return app;
}

} // namespace airtime::factory
