#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/edit_log_record.hpp"
#include "internal/db/model/segment_record.hpp"

namespace airtime::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - file_path is unique across segments
  - Bulk updates are all-or-nothing within their transaction

  The DB is the source of truth for:
    segment timeline
    soft-delete / active flags
    edit history
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Segments
  // ---------------------------------------------------------------------

  // Assigns record.id (and created_at when unset).
  virtual Result InsertSegment(Transaction&, model::SegmentRecord& record) = 0;

  virtual std::optional<model::SegmentRecord> GetSegment(Transaction&, int64_t id) = 0;

  virtual std::optional<model::SegmentRecord> FindSegmentByFilePath(Transaction&, const std::string& file_path) = 0;

  // Exact (channel, start, end) match.
  virtual std::vector<model::SegmentRecord> FindSegmentsBySpan(Transaction&, int64_t channel_id, util::TimePoint start_time,
                                                               util::TimePoint end_time) = 0;

  virtual std::vector<model::SegmentRecord> ListSegments(Transaction&, const SegmentFilter& filter) = 0;

  virtual Result UpdateSegment(Transaction&, const model::SegmentRecord& record) = 0;

  // ---------------------------------------------------------------------
  // Bulk field updates
  // ---------------------------------------------------------------------

  virtual Result SetSegmentsActive(Transaction&, const std::vector<int64_t>& ids, bool is_active) = 0;

  // is_delete=true, is_active=false
  virtual Result SoftDeleteSegments(Transaction&, const std::vector<int64_t>& ids) = 0;

  virtual Result SetRequiresAnalysis(Transaction&, const std::vector<int64_t>& ids, bool requires_analysis) = 0;

  virtual Result UpdateSegmentTitle(Transaction&, int64_t id, const std::string& title) = 0;

  // ---------------------------------------------------------------------
  // Edit log (append-only)
  // ---------------------------------------------------------------------

  virtual Result InsertEditLog(Transaction&, model::EditLogRecord& record) = 0;

  virtual std::vector<model::EditLogRecord> ListEditLogs(Transaction&, int64_t segment_id) = 0;
};

} // namespace airtime::db
