#pragma once

#include <functional>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace airtime::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertSegment(Transaction&, model::SegmentRecord&) override;
  std::optional<model::SegmentRecord> GetSegment(Transaction&, int64_t id) override;
  std::optional<model::SegmentRecord> FindSegmentByFilePath(Transaction&, const std::string& file_path) override;
  std::vector<model::SegmentRecord> FindSegmentsBySpan(Transaction&, int64_t channel_id, util::TimePoint start_time,
                                                       util::TimePoint end_time) override;
  std::vector<model::SegmentRecord> ListSegments(Transaction&, const SegmentFilter& filter) override;
  Result UpdateSegment(Transaction&, const model::SegmentRecord&) override;

  Result SetSegmentsActive(Transaction&, const std::vector<int64_t>& ids, bool is_active) override;
  Result SoftDeleteSegments(Transaction&, const std::vector<int64_t>& ids) override;
  Result SetRequiresAnalysis(Transaction&, const std::vector<int64_t>& ids, bool requires_analysis) override;
  Result UpdateSegmentTitle(Transaction&, int64_t id, const std::string& title) override;

  Result InsertEditLog(Transaction&, model::EditLogRecord&) override;
  std::vector<model::EditLogRecord> ListEditLogs(Transaction&, int64_t segment_id) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::vector<model::SegmentRecord> QuerySegments(Transaction& t, const std::string& where,
                                                  const std::function<void(sqlite3_stmt*)>& bind);
  Result UpdateFlag(Transaction& t, const char* assignment, const std::vector<int64_t>& ids, int value);
};

}
