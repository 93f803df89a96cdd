#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <set>

#include "internal/db/api/repository.hpp"

namespace airtime::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::map<int64_t, model::SegmentRecord>  segments;
    std::map<int64_t, model::EditLogRecord>  edit_logs;
  };

  // Rows touched by one transaction; only these are published on commit.
  struct WriteSet {
    std::set<int64_t> segments;
    std::set<int64_t> edit_logs;
  };

  std::mutex mutex_;
  State      committed_;

  std::atomic<int64_t> next_segment_id_{1};
  std::atomic<int64_t> next_edit_log_id_{1};
};

} // namespace airtime::db::memory
