#pragma once

#include <array>

namespace ledger::db::sql {

/*
  Ledger schema. Applied idempotently at open.

  row_id is AUTOINCREMENT so pruned ids are never reused and arrival
  order stays monotonic across restarts.
*/

inline constexpr std::array<const char*, 12> kSchema = {
    "CREATE TABLE IF NOT EXISTS ledger_events ("
    " row_id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " event_id TEXT NOT NULL UNIQUE,"
    " trace_id TEXT NOT NULL,"
    " span_id TEXT NOT NULL,"
    " parent_event_id TEXT,"
    " type TEXT NOT NULL,"
    " stage INTEGER NOT NULL,"
    " source TEXT NOT NULL,"
    " worker_id TEXT,"
    " ts_ms INTEGER NOT NULL,"
    " seq INTEGER,"
    " status INTEGER NOT NULL,"
    " envelope BLOB NOT NULL,"
    " ingested_at_ms INTEGER NOT NULL);",

    "CREATE INDEX IF NOT EXISTS idx_ledger_events_trace ON ledger_events(trace_id, ts_ms, row_id);",
    "CREATE INDEX IF NOT EXISTS idx_ledger_events_type ON ledger_events(type, ts_ms);",
    "CREATE INDEX IF NOT EXISTS idx_ledger_events_stage ON ledger_events(stage, ts_ms);",
    "CREATE INDEX IF NOT EXISTS idx_ledger_events_worker ON ledger_events(worker_id, ts_ms);",
    "CREATE INDEX IF NOT EXISTS idx_ledger_events_parent ON ledger_events(parent_event_id);",
    "CREATE INDEX IF NOT EXISTS idx_ledger_events_span ON ledger_events(trace_id, span_id);",
    "CREATE INDEX IF NOT EXISTS idx_ledger_events_ingested ON ledger_events(ingested_at_ms);",

    "CREATE TABLE IF NOT EXISTS ledger_edges ("
    " edge_id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " trace_id TEXT NOT NULL,"
    " from_event_id TEXT NOT NULL,"
    " to_event_id TEXT NOT NULL,"
    " edge_type INTEGER NOT NULL,"
    " created_at_ms INTEGER NOT NULL,"
    " UNIQUE(trace_id, from_event_id, to_event_id, edge_type));",

    "CREATE INDEX IF NOT EXISTS idx_ledger_edges_to ON ledger_edges(to_event_id);",

    "CREATE TABLE IF NOT EXISTS ledger_spans ("
    " span_id TEXT NOT NULL,"
    " trace_id TEXT NOT NULL,"
    " stage INTEGER NOT NULL,"
    " worker_id TEXT,"
    " source TEXT,"
    " started_at_ms INTEGER NOT NULL,"
    " ended_at_ms INTEGER,"
    " status INTEGER NOT NULL,"
    " event_count INTEGER NOT NULL,"
    " PRIMARY KEY(trace_id, span_id));",

    "CREATE INDEX IF NOT EXISTS idx_ledger_spans_open ON ledger_spans(started_at_ms) WHERE ended_at_ms IS NULL;",
};

} // namespace ledger::db::sql
