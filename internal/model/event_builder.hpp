#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "ledger/kernel/v1/event.pb.h"

namespace ledger::model {

// spn_ + 16 hex digits of FNV-1a over "trace|stage|source|worker"
std::string DeriveSpanId(std::string_view trace_id, ledger::kernel::v1::Stage stage, std::string_view source,
                         std::string_view worker_id);

/*
  Builds events the kernel emits itself (diagnostics, contract decisions,
  detector transitions). Ids are minted here; a missing trace gets a fresh
  root, so callers continuing a trace must pass Parent() or Trace().
*/
class EventBuilder {
 public:
  EventBuilder(std::string_view type, ledger::kernel::v1::Stage stage, std::string_view source, std::int64_t now_ms);

  EventBuilder& Trace(std::string_view trace_id);
  // same trace as parent, parent link to it
  EventBuilder& Parent(const ledger::kernel::v1::Event& parent);
  EventBuilder& ParentId(std::string_view trace_id, std::string_view parent_event_id);
  EventBuilder& Worker(std::string_view worker_id);
  EventBuilder& Status(ledger::kernel::v1::EventStatus status);
  EventBuilder& Sequence(std::uint64_t sequence);
  EventBuilder& AckOf(std::string_view event_id);
  EventBuilder& Direction(std::string_view direction);

  EventBuilder& Field(std::string_view key, std::string_view value);
  EventBuilder& Field(std::string_view key, const char* value);
  EventBuilder& Field(std::string_view key, double value);
  EventBuilder& Field(std::string_view key, int value);
  EventBuilder& Field(std::string_view key, std::int64_t value);
  EventBuilder& Field(std::string_view key, std::uint64_t value);
  EventBuilder& Field(std::string_view key, bool value);
  EventBuilder& Field(std::string_view key, const std::vector<std::string>& values);
  EventBuilder& Field(std::string_view key, const google::protobuf::Value& value);

  ledger::kernel::v1::Event Build();

 private:
  ledger::kernel::v1::Event event_;
};

} // namespace ledger::model
