#include "sqlite_repository.hpp"

#include <algorithm>
#include <sstream>

namespace airtime::db::sqlite {

using airtime::db::ErrorCode;
using airtime::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s) {
        BindText(st, idx, *s);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindTime(sqlite3_stmt* st, int idx, util::TimePoint tp) {
    BindI64(st, idx, util::ToUnixMicros(tp));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColText(st, col);
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

static util::TimePoint ColTime(sqlite3_stmt* st, int col) {
    return util::FromUnixMicros(ColI64(st, col));
}

static std::string JoinIds(const std::vector<int64_t>& ids) {
    std::ostringstream out;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i) out << ',';
        out << ids[i];
    }
    return out.str();
}

static std::vector<int64_t> SplitIds(const std::string& s) {
    std::vector<int64_t> out;
    std::istringstream   in(s);
    std::string          item;
    while (std::getline(in, item, ',')) {
        if (!item.empty()) out.push_back(std::stoll(item));
    }
    return out;
}

static constexpr const char* kSegmentColumns =
    "id,channel_id,start_us,end_us,duration_seconds,is_recognized,title,title_before,title_after,"
    "is_active,is_delete,source,requires_analysis,metadata_json,file_name,file_path,notes,created_at_us";

static model::SegmentRecord ReadSegment(sqlite3_stmt* st) {
    model::SegmentRecord r;
    r.id                = ColI64(st, 0);
    r.channel_id        = ColI64(st, 1);
    r.start_time        = ColTime(st, 2);
    r.end_time          = ColTime(st, 3);
    r.duration_seconds  = ColI64(st, 4);
    r.is_recognized     = ColI64(st, 5) != 0;
    r.title             = ColOptText(st, 6);
    r.title_before      = ColOptText(st, 7);
    r.title_after       = ColOptText(st, 8);
    r.is_active         = ColI64(st, 9) != 0;
    r.is_delete         = ColI64(st, 10) != 0;
    r.source            = airtime::model::ParseSegmentSource(ColText(st, 11)).value_or(airtime::model::SegmentSource::kRecognition);
    r.requires_analysis = ColI64(st, 12) != 0;
    r.metadata_json     = ColText(st, 13);
    r.file_name         = ColText(st, 14);
    r.file_path         = ColText(st, 15);
    r.notes             = ColText(st, 16);
    r.created_at        = ColTime(st, 17);
    return r;
}

// Binds every column except id, starting at idx.
static int BindSegmentFields(sqlite3_stmt* st, int idx, const model::SegmentRecord& r) {
    BindI64(st, idx++, r.channel_id);
    BindTime(st, idx++, r.start_time);
    BindTime(st, idx++, r.end_time);
    BindI64(st, idx++, r.duration_seconds);
    BindI64(st, idx++, r.is_recognized ? 1 : 0);
    BindOptText(st, idx++, r.title);
    BindOptText(st, idx++, r.title_before);
    BindOptText(st, idx++, r.title_after);
    BindI64(st, idx++, r.is_active ? 1 : 0);
    BindI64(st, idx++, r.is_delete ? 1 : 0);
    BindText(st, idx++, std::string(airtime::model::ToString(r.source)));
    BindI64(st, idx++, r.requires_analysis ? 1 : 0);
    BindText(st, idx++, r.metadata_json);
    BindText(st, idx++, r.file_name);
    BindText(st, idx++, r.file_path);
    BindText(st, idx++, r.notes);
    BindTime(st, idx++, r.created_at);
    return idx;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Segments
// ------------------------------------------------------------------

Result SqliteRepository::InsertSegment(Transaction& t, model::SegmentRecord& r) {
    auto* db = TX(t).Handle();

    if (r.created_at == util::TimePoint{}) {
        r.created_at = util::Now();
    }

    const std::string sql = r.id == 0
        ? "INSERT INTO segments(channel_id,start_us,end_us,duration_seconds,is_recognized,title,title_before,"
          "title_after,is_active,is_delete,source,requires_analysis,metadata_json,file_name,file_path,notes,"
          "created_at_us) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);"
        : "INSERT INTO segments(channel_id,start_us,end_us,duration_seconds,is_recognized,title,title_before,"
          "title_after,is_active,is_delete,source,requires_analysis,metadata_json,file_name,file_path,notes,"
          "created_at_us,id) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    const int next = BindSegmentFields(st, 1, r);
    if (r.id != 0) BindI64(st, next, r.id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) {
        auto result = Translate(db, rc);
        if (result.code == ErrorCode::ConstraintViolation) result.code = ErrorCode::AlreadyExists;
        return result;
    }

    if (r.id == 0) r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::vector<model::SegmentRecord> SqliteRepository::QuerySegments(
    Transaction& t, const std::string& where, const std::function<void(sqlite3_stmt*)>& bind) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kSegmentColumns + " FROM segments WHERE " + where +
                            " ORDER BY start_us ASC, id ASC;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return {};

    bind(st);

    std::vector<model::SegmentRecord> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadSegment(st));
    }

    sqlite3_finalize(st);
    return out;
}

std::optional<model::SegmentRecord> SqliteRepository::GetSegment(Transaction& t, int64_t id) {
    auto rows = QuerySegments(t, "id=?", [&](sqlite3_stmt* st) { BindI64(st, 1, id); });
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

std::optional<model::SegmentRecord> SqliteRepository::FindSegmentByFilePath(Transaction& t, const std::string& file_path) {
    auto rows = QuerySegments(t, "file_path=?", [&](sqlite3_stmt* st) { BindText(st, 1, file_path); });
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

std::vector<model::SegmentRecord> SqliteRepository::FindSegmentsBySpan(
    Transaction& t, int64_t channel_id, util::TimePoint start_time, util::TimePoint end_time) {
    return QuerySegments(t, "channel_id=? AND start_us=? AND end_us=?", [&](sqlite3_stmt* st) {
        BindI64(st, 1, channel_id);
        BindTime(st, 2, start_time);
        BindTime(st, 3, end_time);
    });
}

std::vector<model::SegmentRecord> SqliteRepository::ListSegments(Transaction& t, const SegmentFilter& f) {
    std::string          where = "channel_id=?";
    std::vector<int64_t> params{f.channel_id};

    auto add = [&](const char* clause, int64_t value) {
        where += " AND ";
        where += clause;
        params.push_back(value);
    };

    if (f.start_at_or_after) add("start_us>=?", util::ToUnixMicros(*f.start_at_or_after));
    if (f.start_before) add("start_us<?", util::ToUnixMicros(*f.start_before));
    if (f.start_at_or_before) add("start_us<=?", util::ToUnixMicros(*f.start_at_or_before));
    if (f.end_at_or_after) add("end_us>=?", util::ToUnixMicros(*f.end_at_or_after));
    if (f.created_before) add("created_at_us<?", util::ToUnixMicros(*f.created_before));
    if (f.is_active) add("is_active=?", *f.is_active ? 1 : 0);
    if (f.is_delete) add("is_delete=?", *f.is_delete ? 1 : 0);

    return QuerySegments(t, where, [&](sqlite3_stmt* st) {
        for (size_t i = 0; i < params.size(); ++i) {
            BindI64(st, static_cast<int>(i + 1), params[i]);
        }
    });
}

Result SqliteRepository::UpdateSegment(Transaction& t, const model::SegmentRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE segments SET channel_id=?,start_us=?,end_us=?,duration_seconds=?,is_recognized=?,title=?,"
        "title_before=?,title_after=?,is_active=?,is_delete=?,source=?,requires_analysis=?,metadata_json=?,"
        "file_name=?,file_path=?,notes=?,created_at_us=? WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    const int next = BindSegmentFields(st, 1, r);
    BindI64(st, next, r.id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

// ------------------------------------------------------------------
// Bulk field updates
// ------------------------------------------------------------------

Result SqliteRepository::UpdateFlag(Transaction& t, const char* assignment, const std::vector<int64_t>& ids, int value) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("UPDATE segments SET ") + assignment + " WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (const auto id : ids) {
        sqlite3_reset(st);
        sqlite3_clear_bindings(st);
        BindI64(st, 1, value);
        BindI64(st, 2, id);

        int rc = sqlite3_step(st);
        if (rc != SQLITE_DONE) {
            sqlite3_finalize(st);
            return Translate(db, rc);
        }
    }

    sqlite3_finalize(st);
    return Result::Ok();
}

Result SqliteRepository::SetSegmentsActive(Transaction& t, const std::vector<int64_t>& ids, bool is_active) {
    return UpdateFlag(t, "is_active=?", ids, is_active ? 1 : 0);
}

Result SqliteRepository::SoftDeleteSegments(Transaction& t, const std::vector<int64_t>& ids) {
    return UpdateFlag(t, "is_delete=?, is_active=0", ids, 1);
}

Result SqliteRepository::SetRequiresAnalysis(Transaction& t, const std::vector<int64_t>& ids, bool requires_analysis) {
    return UpdateFlag(t, "requires_analysis=?", ids, requires_analysis ? 1 : 0);
}

Result SqliteRepository::UpdateSegmentTitle(Transaction& t, int64_t id, const std::string& title) {
    auto* db = TX(t).Handle();

    const char* sql = "UPDATE segments SET title=? WHERE id=?;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, title);
    BindI64(st, 2, id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

// ------------------------------------------------------------------
// Edit log
// ------------------------------------------------------------------

Result SqliteRepository::InsertEditLog(Transaction& t, model::EditLogRecord& r) {
    auto* db = TX(t).Handle();

    if (r.created_at == util::TimePoint{}) r.created_at = util::Now();
    std::sort(r.source_segment_ids.begin(), r.source_segment_ids.end());

    const char* sql =
        "INSERT INTO segment_edit_logs(segment_id,action,trigger,source_segment_ids,notes,created_at_us) "
        "VALUES(?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st, 1, r.segment_id);
    BindText(st, 2, r.action);
    BindText(st, 3, r.trigger);
    BindText(st, 4, JoinIds(r.source_segment_ids));
    BindText(st, 5, r.notes);
    BindTime(st, 6, r.created_at);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) return Translate(db, rc);

    r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::vector<model::EditLogRecord> SqliteRepository::ListEditLogs(Transaction& t, int64_t segment_id) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT id,segment_id,action,trigger,source_segment_ids,notes,created_at_us "
        "FROM segment_edit_logs WHERE segment_id=? ORDER BY id ASC;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return {};

    BindI64(st, 1, segment_id);

    std::vector<model::EditLogRecord> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        model::EditLogRecord r;
        r.id                 = ColI64(st, 0);
        r.segment_id         = ColI64(st, 1);
        r.action             = ColText(st, 2);
        r.trigger            = ColText(st, 3);
        r.source_segment_ids = SplitIds(ColText(st, 4));
        r.notes              = ColText(st, 5);
        r.created_at         = ColTime(st, 6);
        out.push_back(std::move(r));
    }

    sqlite3_finalize(st);
    return out;
}

} // namespace airtime::db::sqlite
