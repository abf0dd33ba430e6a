#pragma once

#include <cstdint>
#include <string>

namespace ledger::db::model {

// from = cause (parent, request, original attempt), to = derived event.
// Unique per (trace_id, from_event_id, to_event_id, edge_type).
struct EdgeRecord {
  std::string trace_id;
  std::string from_event_id;
  std::string to_event_id;
  int         edge_type = 0;
  int64_t     created_at_ms = 0;
};

}
