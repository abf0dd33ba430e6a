#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ledger::db::model {

// Conjunctive filter over indexed columns, ordered by (timestamp, row_id)
// or by row_id alone when arrival_order is set.
struct EventQuery {
  std::optional<int>         stage;
  std::optional<std::string> type;
  std::optional<std::string> worker_id;
  std::optional<std::string> trace_id;
  std::optional<int64_t>     since_ms; // inclusive
  std::optional<int64_t>     until_ms; // exclusive
  std::optional<int64_t>     after_row_id; // exclusive
  uint32_t                   limit = 500;
  bool                       descending = false;
  bool                       arrival_order = false;
};

struct PruneRequest {
  // events ingested strictly before this go (ingested_at_ms, not the producer timestamp)
  std::optional<int64_t> older_than_ms;
  // then the oldest rows beyond this count go
  std::optional<uint64_t> max_rows;
};

struct PruneCounts {
  uint64_t events = 0;
  uint64_t edges  = 0;
  uint64_t spans  = 0;
};

}
