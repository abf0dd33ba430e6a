#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"

namespace ledger::db::sqlite {

using ledger::db::ErrorCode;
using ledger::db::Result;

namespace {

// Finalizes on scope exit.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) st_ = nullptr;
    }
    ~Statement() {
        if (st_) sqlite3_finalize(st_);
    }

    Statement(const Statement&)            = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return st_; }
    explicit operator bool() const { return st_ != nullptr; }

private:
    sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::string& s) {
    if (s.empty()) {
        sqlite3_bind_null(st, idx);
    } else {
        BindText(st, idx, s);
    }
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& bytes) {
    sqlite3_bind_blob(st, idx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
    const void* data = sqlite3_column_blob(st, col);
    const int   size = sqlite3_column_bytes(st, col);
    return data ? std::string(static_cast<const char*>(data), static_cast<std::size_t>(size)) : std::string();
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

bool ColNull(sqlite3_stmt* st, int col) {
    return sqlite3_column_type(st, col) == SQLITE_NULL;
}

model::EventRecord ReadEvent(sqlite3_stmt* st) {
    model::EventRecord r;
    r.row_id          = ColI64(st, 0);
    r.event_id        = ColText(st, 1);
    r.trace_id        = ColText(st, 2);
    r.span_id         = ColText(st, 3);
    r.parent_event_id = ColText(st, 4);
    r.type            = ColText(st, 5);
    r.stage           = ColI32(st, 6);
    r.source          = ColText(st, 7);
    r.worker_id       = ColText(st, 8);
    r.timestamp_ms    = ColI64(st, 9);
    if (!ColNull(st, 10)) r.sequence = static_cast<uint64_t>(ColI64(st, 10));
    r.status          = ColI32(st, 11);
    r.envelope        = ColBlob(st, 12);
    r.ingested_at_ms  = ColI64(st, 13);
    return r;
}

model::SpanRecord ReadSpan(sqlite3_stmt* st) {
    model::SpanRecord r;
    r.span_id       = ColText(st, 0);
    r.trace_id      = ColText(st, 1);
    r.stage         = ColI32(st, 2);
    r.worker_id     = ColText(st, 3);
    r.source        = ColText(st, 4);
    r.started_at_ms = ColI64(st, 5);
    if (!ColNull(st, 6)) r.ended_at_ms = ColI64(st, 6);
    r.status        = ColI32(st, 7);
    r.event_count   = static_cast<uint64_t>(ColI64(st, 8));
    return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_, false);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
    return std::make_unique<SqliteTransaction>(db_, true);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    const ErrorCode code = ToErrorCode(rc);
    if (code == ErrorCode::OK) return Result::Ok();
    return Result::Err(code, sqlite3_errmsg(db));
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result SqliteRepository::InsertEvent(Transaction& t, model::EventRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_EVENT);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.event_id);
    BindText(st.get(), 2, r.trace_id);
    BindText(st.get(), 3, r.span_id);
    BindOptionalText(st.get(), 4, r.parent_event_id);
    BindText(st.get(), 5, r.type);
    BindI32(st.get(), 6, r.stage);
    BindText(st.get(), 7, r.source);
    BindOptionalText(st.get(), 8, r.worker_id);
    BindI64(st.get(), 9, r.timestamp_ms);
    if (r.sequence) {
        BindU64(st.get(), 10, *r.sequence);
    } else {
        sqlite3_bind_null(st.get(), 10);
    }
    BindI32(st.get(), 11, r.status);
    BindBlob(st.get(), 12, r.envelope);
    BindI64(st.get(), 13, r.ingested_at_ms);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) r.row_id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));

    return Translate(db, rc);
}

std::optional<model::EventRecord>
SqliteRepository::GetEvent(Transaction& t, const std::string& event_id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_EVENT);
    if (!st) return std::nullopt;

    BindText(st.get(), 1, event_id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadEvent(st.get());
}

std::vector<model::EventRecord>
SqliteRepository::ListTraceEvents(Transaction& t, const std::string& trace_id, uint32_t limit) {
    auto* db = TX(t).Handle();
    std::vector<model::EventRecord> out;

    Statement st(db, sql::SELECT_TRACE_EVENTS);
    if (!st) return out;

    BindText(st.get(), 1, trace_id);
    BindI64(st.get(), 2, static_cast<int64_t>(limit));
    while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadEvent(st.get()));
    return out;
}

std::vector<std::string>
SqliteRepository::ListTraceRoots(Transaction& t, const std::string& trace_id) {
    auto* db = TX(t).Handle();
    std::vector<std::string> out;

    Statement st(db, sql::SELECT_TRACE_ROOTS);
    if (!st) return out;

    BindText(st.get(), 1, trace_id);
    while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ColText(st.get(), 0));
    return out;
}

std::vector<model::EventRecord>
SqliteRepository::QueryEvents(Transaction& t, const model::EventQuery& q) {
    auto* db = TX(t).Handle();
    std::vector<model::EventRecord> out;

    std::string sql =
        "SELECT row_id,event_id,trace_id,span_id,parent_event_id,type,stage,source,worker_id,ts_ms,seq,status,"
        "envelope,ingested_at_ms FROM ledger_events WHERE 1=1";
    if (q.stage) sql += " AND stage=?";
    if (q.type) sql += " AND type=?";
    if (q.worker_id) sql += " AND worker_id=?";
    if (q.trace_id) sql += " AND trace_id=?";
    if (q.since_ms) sql += " AND ts_ms>=?";
    if (q.until_ms) sql += " AND ts_ms<?";
    if (q.after_row_id) sql += " AND row_id>?";
    if (q.arrival_order) {
        sql += q.descending ? " ORDER BY row_id DESC" : " ORDER BY row_id ASC";
    } else {
        sql += q.descending ? " ORDER BY ts_ms DESC, row_id DESC" : " ORDER BY ts_ms ASC, row_id ASC";
    }
    sql += " LIMIT ?;";

    Statement st(db, sql.c_str());
    if (!st) return out;

    int idx = 1;
    if (q.stage) BindI32(st.get(), idx++, *q.stage);
    if (q.type) BindText(st.get(), idx++, *q.type);
    if (q.worker_id) BindText(st.get(), idx++, *q.worker_id);
    if (q.trace_id) BindText(st.get(), idx++, *q.trace_id);
    if (q.since_ms) BindI64(st.get(), idx++, *q.since_ms);
    if (q.until_ms) BindI64(st.get(), idx++, *q.until_ms);
    if (q.after_row_id) BindI64(st.get(), idx++, *q.after_row_id);
    BindI64(st.get(), idx, static_cast<int64_t>(q.limit));

    while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadEvent(st.get()));
    return out;
}

uint64_t SqliteRepository::CountEvents(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::COUNT_EVENTS);
    if (!st || sqlite3_step(st.get()) != SQLITE_ROW) return 0;
    return static_cast<uint64_t>(ColI64(st.get(), 0));
}

// ------------------------------------------------------------------
// Edges
// ------------------------------------------------------------------

Result SqliteRepository::InsertEdge(Transaction& t, const model::EdgeRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_EDGE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.trace_id);
    BindText(st.get(), 2, r.from_event_id);
    BindText(st.get(), 3, r.to_event_id);
    BindI32(st.get(), 4, r.edge_type);
    BindI64(st.get(), 5, r.created_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::EdgeRecord>
SqliteRepository::ListTraceEdges(Transaction& t, const std::string& trace_id) {
    auto* db = TX(t).Handle();
    std::vector<model::EdgeRecord> out;

    Statement st(db, sql::SELECT_TRACE_EDGES);
    if (!st) return out;

    BindText(st.get(), 1, trace_id);
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        model::EdgeRecord r;
        r.trace_id      = ColText(st.get(), 0);
        r.from_event_id = ColText(st.get(), 1);
        r.to_event_id   = ColText(st.get(), 2);
        r.edge_type     = ColI32(st.get(), 3);
        r.created_at_ms = ColI64(st.get(), 4);
        out.push_back(std::move(r));
    }
    return out;
}

// ------------------------------------------------------------------
// Spans
// ------------------------------------------------------------------

std::optional<model::SpanRecord>
SqliteRepository::GetSpan(Transaction& t, const std::string& trace_id, const std::string& span_id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_SPAN);
    if (!st) return std::nullopt;

    BindText(st.get(), 1, trace_id);
    BindText(st.get(), 2, span_id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadSpan(st.get());
}

Result SqliteRepository::UpsertSpan(Transaction& t, const model::SpanRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::UPSERT_SPAN);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.span_id);
    BindText(st.get(), 2, r.trace_id);
    BindI32(st.get(), 3, r.stage);
    BindOptionalText(st.get(), 4, r.worker_id);
    BindOptionalText(st.get(), 5, r.source);
    BindI64(st.get(), 6, r.started_at_ms);
    if (r.ended_at_ms) {
        BindI64(st.get(), 7, *r.ended_at_ms);
    } else {
        sqlite3_bind_null(st.get(), 7);
    }
    BindI32(st.get(), 8, r.status);
    BindU64(st.get(), 9, r.event_count);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::SpanRecord>
SqliteRepository::ListTraceSpans(Transaction& t, const std::string& trace_id) {
    auto* db = TX(t).Handle();
    std::vector<model::SpanRecord> out;

    Statement st(db, sql::SELECT_TRACE_SPANS);
    if (!st) return out;

    BindText(st.get(), 1, trace_id);
    while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadSpan(st.get()));
    return out;
}

std::vector<model::SpanRecord>
SqliteRepository::ListOpenSpansStartedBefore(Transaction& t, int64_t cutoff_ms) {
    auto* db = TX(t).Handle();
    std::vector<model::SpanRecord> out;

    Statement st(db, sql::SELECT_OPEN_SPANS_BEFORE);
    if (!st) return out;

    BindI64(st.get(), 1, cutoff_ms);
    while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadSpan(st.get()));
    return out;
}

// ------------------------------------------------------------------
// Retention
// ------------------------------------------------------------------

Result SqliteRepository::Prune(Transaction& t, const model::PruneRequest& request, model::PruneCounts* counts) {
    auto* db = TX(t).Handle();
    model::PruneCounts local;

    // binds `arg` to each of the statement's parameters
    auto run = [&](const char* sql, int64_t arg, uint64_t* affected) -> Result {
        Statement st(db, sql);
        if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        for (int i = 1; i <= sqlite3_bind_parameter_count(st.get()); ++i) BindI64(st.get(), i, arg);
        int rc = sqlite3_step(st.get());
        if (rc != SQLITE_DONE) return Translate(db, rc);
        if (affected) *affected += static_cast<uint64_t>(sqlite3_changes(db));
        return Result::Ok();
    };

    if (request.older_than_ms) {
        if (auto r = run(sql::DELETE_EDGES_OF_AGED_EVENTS, *request.older_than_ms, &local.edges); !r) return r;
        if (auto r = run(sql::DELETE_AGED_EVENTS, *request.older_than_ms, &local.events); !r) return r;
    }

    if (request.max_rows) {
        std::optional<int64_t> threshold;
        {
            Statement st(db, sql::SELECT_CAP_THRESHOLD);
            if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
            BindU64(st.get(), 1, *request.max_rows);

            int rc = sqlite3_step(st.get());
            if (rc == SQLITE_ROW) {
                threshold = ColI64(st.get(), 0);
            } else if (rc != SQLITE_DONE) {
                return Translate(db, rc);
            }
        }
        if (threshold) {
            if (auto r = run(sql::DELETE_EDGES_OF_ROWS_BELOW, *threshold, &local.edges); !r) return r;
            if (auto r = run(sql::DELETE_ROWS_BELOW, *threshold, &local.events); !r) return r;
        }
    }

    if (local.events > 0) {
        if (auto r = run(sql::DELETE_ORPHANED_SPANS, 0, &local.spans); !r) return r;
    }

    if (counts) *counts = local;
    return Result::Ok();
}

} // namespace ledger::db::sqlite
