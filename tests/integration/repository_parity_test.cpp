#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/factory.hpp"

namespace {

using airtime::db::ErrorCode;
using airtime::db::Repository;
using airtime::db::SegmentFilter;
using airtime::db::model::EditLogRecord;
using airtime::db::model::SegmentRecord;
using airtime::runtime::config::RuntimeConfig;
using airtime::util::ParseUtc;

constexpr int64_t kChannel = 21;

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

SegmentRecord MakeSegment(const std::string& start, const std::string& end, const std::string& file_path) {
  SegmentRecord r;
  r.channel_id       = kChannel;
  r.start_time       = ParseUtc(start);
  r.end_time         = ParseUtc(end);
  r.duration_seconds = airtime::util::WholeSeconds(r.start_time, r.end_time);
  r.is_recognized    = true;
  r.title            = "Title " + file_path;
  r.file_name        = file_path;
  r.file_path        = "media/20250812/" + file_path;
  r.metadata_json    = R"({"isrc":"X"})";
  r.created_at       = ParseUtc("2025-08-12 12:00:00");
  return r;
}

void VerifyInsertReadUpdate(Repository& repo) {
  auto tx = repo.Begin();

  auto seg = MakeSegment("2025-08-12 10:00:00", "2025-08-12 10:05:00", "a.mp3");
  assert(repo.InsertSegment(*tx, seg));
  assert(seg.id != 0);

  auto read = repo.GetSegment(*tx, seg.id);
  assert(read.has_value());
  assert(read->start_time == seg.start_time);
  assert(read->end_time == seg.end_time);
  assert(read->title == seg.title);
  assert(!read->title_before.has_value());
  assert(read->source == airtime::model::SegmentSource::kRecognition);
  assert(read->metadata_json == seg.metadata_json);
  assert(read->created_at == seg.created_at);

  auto by_path = repo.FindSegmentByFilePath(*tx, seg.file_path);
  assert(by_path && by_path->id == seg.id);
  assert(repo.FindSegmentsBySpan(*tx, kChannel, seg.start_time, seg.end_time).size() == 1);
  assert(repo.FindSegmentsBySpan(*tx, kChannel + 1, seg.start_time, seg.end_time).empty());

  read->notes     = "Deactivated";
  read->is_active = false;
  assert(repo.UpdateSegment(*tx, *read));
  assert(!repo.GetSegment(*tx, seg.id)->is_active);

  SegmentRecord missing = *read;
  missing.id            = seg.id + 1000;
  assert(repo.UpdateSegment(*tx, missing).code == ErrorCode::NotFound);
  assert(repo.UpdateSegmentTitle(*tx, seg.id + 1000, "x").code == ErrorCode::NotFound);

  auto duplicate = MakeSegment("2025-08-12 11:00:00", "2025-08-12 11:05:00", "a.mp3");
  assert(repo.InsertSegment(*tx, duplicate).code == ErrorCode::AlreadyExists);

  tx->Commit();
}

void VerifyFilterAndBulkFlags(Repository& repo) {
  std::vector<int64_t> ids;
  {
    auto tx = repo.Begin();
    for (const auto& [start, end, path] : std::vector<std::tuple<std::string, std::string, std::string>>{
             {"2025-08-13 10:10:00", "2025-08-13 10:15:00", "f3.mp3"},
             {"2025-08-13 10:00:00", "2025-08-13 10:05:00", "f1.mp3"},
             {"2025-08-13 10:05:00", "2025-08-13 10:10:00", "f2.mp3"},
         }) {
      auto seg = MakeSegment(start, end, path);
      assert(repo.InsertSegment(*tx, seg));
      ids.push_back(seg.id);
    }
    tx->Commit();
  }

  auto tx = repo.Begin();

  SegmentFilter day;
  day.channel_id        = kChannel;
  day.start_at_or_after = ParseUtc("2025-08-13 00:00:00");
  day.start_before      = ParseUtc("2025-08-14 00:00:00");
  auto rows             = repo.ListSegments(*tx, day);
  assert(rows.size() == 3);
  assert(rows[0].file_name == "f1.mp3");
  assert(rows[1].file_name == "f2.mp3");
  assert(rows[2].file_name == "f3.mp3");

  SegmentFilter overlapping = day;
  overlapping.start_at_or_before = ParseUtc("2025-08-13 10:06:00");
  overlapping.end_at_or_after    = ParseUtc("2025-08-13 10:04:00");
  assert(repo.ListSegments(*tx, overlapping).size() == 2);

  SegmentFilter created = day;
  created.created_before = ParseUtc("2025-08-12 12:00:00");
  assert(repo.ListSegments(*tx, created).empty());

  assert(repo.SoftDeleteSegments(*tx, {ids[0]}));
  assert(repo.SetRequiresAnalysis(*tx, {ids[1], ids[2]}, true));
  assert(repo.SetSegmentsActive(*tx, {ids[2]}, false));
  assert(repo.UpdateSegmentTitle(*tx, ids[1], "News"));

  const auto deleted = repo.GetSegment(*tx, ids[0]);
  assert(deleted->is_delete && !deleted->is_active);

  const auto renamed = repo.GetSegment(*tx, ids[1]);
  assert(renamed->requires_analysis && renamed->is_active);
  assert(renamed->title == std::optional<std::string>("News"));

  SegmentFilter active = day;
  active.is_active     = true;
  assert(repo.ListSegments(*tx, active).size() == 1);

  SegmentFilter live = day;
  live.is_delete     = false;
  assert(repo.ListSegments(*tx, live).size() == 2);

  tx->Commit();
}

void VerifyEditLog(Repository& repo) {
  auto tx = repo.Begin();

  auto merged   = MakeSegment("2025-08-14 10:00:00", "2025-08-14 10:10:00", "m.mp3");
  merged.source = airtime::model::SegmentSource::kMerged;
  assert(repo.InsertSegment(*tx, merged));

  EditLogRecord log;
  log.segment_id         = merged.id;
  log.action             = "merge";
  log.trigger            = "automatic";
  log.source_segment_ids = {9, 4};
  assert(repo.InsertEditLog(*tx, log));
  assert(log.id != 0);

  const auto logs = repo.ListEditLogs(*tx, merged.id);
  assert(logs.size() == 1);
  assert(logs[0].action == "merge");
  assert((logs[0].source_segment_ids == std::vector<int64_t>{4, 9}));
  assert(repo.GetSegment(*tx, merged.id)->source == airtime::model::SegmentSource::kMerged);

  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo) {
  int64_t id = 0;
  {
    auto tx  = repo.Begin();
    auto seg = MakeSegment("2025-08-15 10:00:00", "2025-08-15 10:05:00", "rolled_back.mp3");
    assert(repo.InsertSegment(*tx, seg));
    id = seg.id;
    tx->Rollback();
  }
  {
    auto tx  = repo.Begin();
    auto seg = MakeSegment("2025-08-15 11:00:00", "2025-08-15 11:05:00", "dropped.mp3");
    assert(repo.InsertSegment(*tx, seg));
    // destroyed without commit
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetSegment(*check_tx, id).has_value());
  assert(!repo.FindSegmentByFilePath(*check_tx, "media/20250812/rolled_back.mp3").has_value());
  assert(!repo.FindSegmentByFilePath(*check_tx, "media/20250812/dropped.mp3").has_value());
  check_tx->Commit();
}

void VerifyConcurrentTransactions(Repository& repo, bool supports_parallel_transactions) {
  if (!supports_parallel_transactions) return;

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();

  // Different rows: both commit.
  auto a = MakeSegment("2025-08-16 10:00:00", "2025-08-16 10:05:00", "tx1.mp3");
  auto b = MakeSegment("2025-08-16 10:05:00", "2025-08-16 10:10:00", "tx2.mp3");
  assert(repo.InsertSegment(*tx1, a));
  assert(repo.InsertSegment(*tx2, b));
  tx1->Commit();
  tx2->Commit();

  // Same file_path: the second commit is rejected.
  auto tx3 = repo.Begin();
  auto tx4 = repo.Begin();
  auto c   = MakeSegment("2025-08-16 11:00:00", "2025-08-16 11:05:00", "race.mp3");
  auto d   = MakeSegment("2025-08-16 11:00:00", "2025-08-16 11:05:00", "race.mp3");
  assert(repo.InsertSegment(*tx3, c));
  assert(repo.InsertSegment(*tx4, d));
  tx3->Commit();

  bool threw = false;
  try {
    tx4->Commit();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  auto verify = repo.Begin();
  assert(repo.GetSegment(*verify, a.id).has_value());
  assert(repo.GetSegment(*verify, b.id).has_value());
  assert(repo.FindSegmentByFilePath(*verify, c.file_path)->id == c.id);
  verify->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto    repo = backend.make_repository();
  int64_t id   = 0;
  {
    auto tx  = repo->Begin();
    auto seg = MakeSegment("2025-08-17 10:00:00", "2025-08-17 10:05:00", "durable.mp3");
    assert(repo->InsertSegment(*tx, seg));
    id = seg.id;

    EditLogRecord log;
    log.segment_id         = id;
    log.action             = "merge";
    log.trigger            = "automatic";
    log.source_segment_ids = {1, 2};
    assert(repo->InsertEditLog(*tx, log));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto s  = repo->GetSegment(*tx, id);
  assert(s.has_value());
  assert(s->file_path == "media/20250812/durable.mp3");
  assert(repo->ListEditLogs(*tx, id).size() == 1);
  tx->Commit();

  backend.cleanup();
}

RuntimeConfig MemoryConfig() {
  RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  return config;
}

RuntimeConfig SqliteConfig(const std::string& path) {
  RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path(path);
  config.mutable_database()->mutable_sqlite()->set_wal_mode(true);
  return config;
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return airtime::factory::BuildRepository(MemoryConfig()); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

BackendFactory MakeSqliteFactory() {
  const auto stamp   = std::chrono::system_clock::now().time_since_epoch().count();
  const auto db_path = (std::filesystem::temp_directory_path() / ("airtime_integration_sqlite_" + std::to_string(stamp) + ".db")).string();

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = [db_path]() { return airtime::factory::BuildRepository(SqliteConfig(db_path)); },
      .supports_restart               = []() { return true; },
      .restart                        = [db_path](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = airtime::factory::BuildRepository(SqliteConfig(db_path));
      },
      .cleanup =
          [db_path]() {
            std::error_code ec;
            std::filesystem::remove(db_path, ec);
            std::filesystem::remove(db_path + "-wal", ec);
            std::filesystem::remove(db_path + "-shm", ec);
          },
      // one connection, one transaction at a time
      .supports_parallel_transactions = false,
  };
}

void RunSuite(BackendFactory backend) {
  {
    auto repo = backend.make_repository();
    VerifyInsertReadUpdate(*repo);
    VerifyFilterAndBulkFlags(*repo);
    VerifyEditLog(*repo);
    VerifyRollbackBehavior(*repo);
    VerifyConcurrentTransactions(*repo, backend.supports_parallel_transactions);
  }
  VerifyRestartDurability(backend);
  backend.cleanup();

  std::cout << "  " << backend.name << ": ok\n";
}

} // namespace

int main() {
  RunSuite(MakeMemoryFactory());
  RunSuite(MakeSqliteFactory());

  std::cout << "airtime_integration_repository_parity: pass\n";
  return 0;
}
