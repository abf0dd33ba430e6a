#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ledger::db::model {

struct SpanRecord {
  std::string            span_id;
  std::string            trace_id;
  int                    stage = 0;
  std::string            worker_id;
  std::string            source;
  int64_t                started_at_ms = 0;
  std::optional<int64_t> ended_at_ms;
  int                    status = 0;
  uint64_t               event_count = 0;
};

}
