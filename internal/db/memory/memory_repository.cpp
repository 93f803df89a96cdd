#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace airtime::db::memory {

namespace {

bool Matches(const model::SegmentRecord& r, const SegmentFilter& f) {
  if (r.channel_id != f.channel_id) return false;
  if (f.start_at_or_after && r.start_time < *f.start_at_or_after) return false;
  if (f.start_before && r.start_time >= *f.start_before) return false;
  if (f.start_at_or_before && r.start_time > *f.start_at_or_before) return false;
  if (f.end_at_or_after && r.end_time < *f.end_at_or_after) return false;
  if (f.created_before && r.created_at >= *f.created_before) return false;
  if (f.is_active && r.is_active != *f.is_active) return false;
  if (f.is_delete && r.is_delete != *f.is_delete) return false;
  return true;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertSegment(Transaction& t, model::SegmentRecord& r) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  if (!r.file_path.empty()) {
    for (const auto& [_, existing] : s.segments) {
      if (existing.file_path == r.file_path) return Result::Err(ErrorCode::AlreadyExists, r.file_path);
    }
  }

  if (r.id == 0) {
    r.id = next_segment_id_++;
  } else if (s.segments.contains(r.id)) {
    return Result::Err(ErrorCode::AlreadyExists);
  } else {
    int64_t expected = next_segment_id_.load();
    while (expected <= r.id && !next_segment_id_.compare_exchange_weak(expected, r.id + 1)) {
    }
  }
  if (r.created_at == util::TimePoint{}) {
    r.created_at = util::Now();
  }

  s.segments[r.id] = r;
  tx.TouchSegment(r.id);
  return Result::Ok();
}

std::optional<model::SegmentRecord> MemoryRepository::GetSegment(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.segments.find(id);
  if (it == s.segments.end()) return std::nullopt;
  return it->second;
}

std::optional<model::SegmentRecord> MemoryRepository::FindSegmentByFilePath(Transaction& t, const std::string& file_path) {
  for (const auto& [_, r] : TX(t).View().segments) {
    if (r.file_path == file_path) return r;
  }
  return std::nullopt;
}

std::vector<model::SegmentRecord> MemoryRepository::FindSegmentsBySpan(Transaction& t, int64_t channel_id, util::TimePoint start_time,
                                                                       util::TimePoint end_time) {
  std::vector<model::SegmentRecord> out;
  for (const auto& [_, r] : TX(t).View().segments) {
    if (r.channel_id == channel_id && r.start_time == start_time && r.end_time == end_time) out.push_back(r);
  }
  return out;
}

std::vector<model::SegmentRecord> MemoryRepository::ListSegments(Transaction& t, const SegmentFilter& filter) {
  std::vector<model::SegmentRecord> out;
  for (const auto& [_, r] : TX(t).View().segments) {
    if (Matches(r, filter)) out.push_back(r);
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const model::SegmentRecord& a, const model::SegmentRecord& b) { return a.start_time < b.start_time; });
  return out;
}

Result MemoryRepository::UpdateSegment(Transaction& t, const model::SegmentRecord& r) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  if (!s.segments.contains(r.id)) return Result::Err(ErrorCode::NotFound);
  for (const auto& [id, existing] : s.segments) {
    if (id != r.id && !r.file_path.empty() && existing.file_path == r.file_path) {
      return Result::Err(ErrorCode::ConstraintViolation, r.file_path);
    }
  }
  s.segments[r.id] = r;
  tx.TouchSegment(r.id);
  return Result::Ok();
}

Result MemoryRepository::SetSegmentsActive(Transaction& t, const std::vector<int64_t>& ids, bool is_active) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  for (const auto id : ids) {
    auto it = s.segments.find(id);
    if (it == s.segments.end()) continue;
    it->second.is_active = is_active;
    tx.TouchSegment(id);
  }
  return Result::Ok();
}

Result MemoryRepository::SoftDeleteSegments(Transaction& t, const std::vector<int64_t>& ids) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  for (const auto id : ids) {
    auto it = s.segments.find(id);
    if (it == s.segments.end()) continue;
    it->second.is_delete = true;
    it->second.is_active = false;
    tx.TouchSegment(id);
  }
  return Result::Ok();
}

Result MemoryRepository::SetRequiresAnalysis(Transaction& t, const std::vector<int64_t>& ids, bool requires_analysis) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  for (const auto id : ids) {
    auto it = s.segments.find(id);
    if (it == s.segments.end()) continue;
    it->second.requires_analysis = requires_analysis;
    tx.TouchSegment(id);
  }
  return Result::Ok();
}

Result MemoryRepository::UpdateSegmentTitle(Transaction& t, int64_t id, const std::string& title) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  auto  it = s.segments.find(id);
  if (it == s.segments.end()) return Result::Err(ErrorCode::NotFound);
  it->second.title = title;
  tx.TouchSegment(id);
  return Result::Ok();
}

Result MemoryRepository::InsertEditLog(Transaction& t, model::EditLogRecord& r) {
  auto& tx = TX(t);
  if (r.id == 0) r.id = next_edit_log_id_++;
  if (r.created_at == util::TimePoint{}) r.created_at = util::Now();
  std::sort(r.source_segment_ids.begin(), r.source_segment_ids.end());

  tx.Mutable().edit_logs[r.id] = r;
  tx.TouchEditLog(r.id);
  return Result::Ok();
}

std::vector<model::EditLogRecord> MemoryRepository::ListEditLogs(Transaction& t, int64_t segment_id) {
  std::vector<model::EditLogRecord> out;
  for (const auto& [_, e] : TX(t).View().edit_logs) {
    if (e.segment_id == segment_id) out.push_back(e);
  }
  return out;
}

} // namespace airtime::db::memory
