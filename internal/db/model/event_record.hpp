#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ledger::db::model {

/*
  One row of the event log.

  Indexed columns are copies of envelope fields; envelope holds the
  serialized canonical Event exactly as appended and is what reads return.
  row_id is assigned by the repository in arrival order.
*/
struct EventRecord {
  int64_t                 row_id = 0;
  std::string             event_id;
  std::string             trace_id;
  std::string             span_id;
  std::string             parent_event_id;
  std::string             type;
  int                     stage = 0;
  std::string             source;
  std::string             worker_id;
  int64_t                 timestamp_ms = 0;
  std::optional<uint64_t> sequence;
  int                     status = 0;
  std::string             envelope;
  int64_t                 ingested_at_ms = 0;
};

}
