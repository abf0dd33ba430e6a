#pragma once

namespace ledger::db::sql {

/*
  Canonical SQL used by the sqlite backend.

  Every SELECT over ledger_events uses the same column order so one
  row reader serves them all.
*/

#define LEDGER_EVENT_COLUMNS                                                                            \
  "row_id,event_id,trace_id,span_id,parent_event_id,type,stage,source,worker_id,ts_ms,seq,status,envelope," \
  "ingested_at_ms"

// events

static constexpr const char* INSERT_EVENT =
    "INSERT INTO ledger_events(event_id,trace_id,span_id,parent_event_id,type,stage,source,worker_id,ts_ms,seq,"
    "status,envelope,ingested_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_EVENT =
    "SELECT " LEDGER_EVENT_COLUMNS " FROM ledger_events WHERE event_id=?;";

static constexpr const char* SELECT_TRACE_EVENTS =
    "SELECT " LEDGER_EVENT_COLUMNS " FROM ledger_events WHERE trace_id=? ORDER BY row_id ASC LIMIT ?;";

static constexpr const char* SELECT_TRACE_ROOTS =
    "SELECT event_id FROM ledger_events"
    " WHERE trace_id=? AND (parent_event_id IS NULL OR parent_event_id='') ORDER BY row_id ASC;";

static constexpr const char* COUNT_EVENTS = "SELECT COUNT(*) FROM ledger_events;";

// edges

static constexpr const char* INSERT_EDGE =
    "INSERT OR IGNORE INTO ledger_edges(trace_id,from_event_id,to_event_id,edge_type,created_at_ms)"
    " VALUES(?,?,?,?,?);";

static constexpr const char* SELECT_TRACE_EDGES =
    "SELECT trace_id,from_event_id,to_event_id,edge_type,created_at_ms"
    " FROM ledger_edges WHERE trace_id=? ORDER BY edge_id ASC;";

// spans

#define LEDGER_SPAN_COLUMNS "span_id,trace_id,stage,worker_id,source,started_at_ms,ended_at_ms,status,event_count"

static constexpr const char* UPSERT_SPAN =
    "INSERT INTO ledger_spans(" LEDGER_SPAN_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(trace_id, span_id) DO UPDATE SET"
    " ended_at_ms=excluded.ended_at_ms,"
    " status=excluded.status,"
    " event_count=excluded.event_count;";

static constexpr const char* SELECT_SPAN =
    "SELECT " LEDGER_SPAN_COLUMNS " FROM ledger_spans WHERE trace_id=? AND span_id=?;";

static constexpr const char* SELECT_TRACE_SPANS =
    "SELECT " LEDGER_SPAN_COLUMNS " FROM ledger_spans WHERE trace_id=? ORDER BY started_at_ms ASC, span_id ASC;";

static constexpr const char* SELECT_OPEN_SPANS_BEFORE =
    "SELECT " LEDGER_SPAN_COLUMNS " FROM ledger_spans"
    " WHERE ended_at_ms IS NULL AND started_at_ms<? ORDER BY started_at_ms ASC;";

// retention: age is measured from ingestion, never from the producer's clock

static constexpr const char* DELETE_EDGES_OF_AGED_EVENTS =
    "DELETE FROM ledger_edges WHERE from_event_id IN (SELECT event_id FROM ledger_events WHERE ingested_at_ms<?)"
    " OR to_event_id IN (SELECT event_id FROM ledger_events WHERE ingested_at_ms<?);";

static constexpr const char* DELETE_AGED_EVENTS = "DELETE FROM ledger_events WHERE ingested_at_ms<?;";

// row_id of the oldest row that survives the cap; NULL when under the cap
static constexpr const char* SELECT_CAP_THRESHOLD =
    "SELECT row_id FROM ledger_events ORDER BY row_id DESC LIMIT 1 OFFSET ?;";

static constexpr const char* DELETE_EDGES_OF_ROWS_BELOW =
    "DELETE FROM ledger_edges WHERE from_event_id IN (SELECT event_id FROM ledger_events WHERE row_id<=?)"
    " OR to_event_id IN (SELECT event_id FROM ledger_events WHERE row_id<=?);";

static constexpr const char* DELETE_ROWS_BELOW = "DELETE FROM ledger_events WHERE row_id<=?;";

static constexpr const char* DELETE_ORPHANED_SPANS =
    "DELETE FROM ledger_spans WHERE NOT EXISTS (SELECT 1 FROM ledger_events e"
    " WHERE e.trace_id=ledger_spans.trace_id AND e.span_id=ledger_spans.span_id);";

#undef LEDGER_SPAN_COLUMNS
#undef LEDGER_EVENT_COLUMNS

} // namespace ledger::db::sql
