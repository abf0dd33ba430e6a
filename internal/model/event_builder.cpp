#include "internal/model/event_builder.hpp"

#include "internal/model/taxonomy.hpp"
#include "internal/util/ids.hpp"

namespace ledger::model {

using namespace ledger::kernel::v1;

std::string DeriveSpanId(std::string_view trace_id, Stage stage, std::string_view source, std::string_view worker_id) {
  std::string key;
  key.reserve(trace_id.size() + source.size() + worker_id.size() + 16);
  key.append(trace_id);
  key.push_back('|');
  key.append(StageName(stage));
  key.push_back('|');
  key.append(source);
  key.push_back('|');
  key.append(worker_id);
  return "spn_" + util::HexU64(util::Fnv1a64(key));
}

EventBuilder::EventBuilder(std::string_view type, Stage stage, std::string_view source, std::int64_t now_ms) {
  event_.set_event_id(util::NewId("evt"));
  event_.set_type(std::string(type));
  event_.set_stage(stage);
  event_.set_source(std::string(source));
  event_.set_timestamp_ms(now_ms);
  event_.set_status(EVENT_STATUS_OK);
}

EventBuilder& EventBuilder::Trace(std::string_view trace_id) {
  event_.set_trace_id(std::string(trace_id));
  return *this;
}

EventBuilder& EventBuilder::Parent(const Event& parent) {
  return ParentId(parent.trace_id(), parent.event_id());
}

EventBuilder& EventBuilder::ParentId(std::string_view trace_id, std::string_view parent_event_id) {
  event_.set_trace_id(std::string(trace_id));
  event_.set_parent_event_id(std::string(parent_event_id));
  return *this;
}

EventBuilder& EventBuilder::Worker(std::string_view worker_id) {
  event_.set_worker_id(std::string(worker_id));
  return *this;
}

EventBuilder& EventBuilder::Status(EventStatus status) {
  event_.set_status(status);
  return *this;
}

EventBuilder& EventBuilder::Sequence(std::uint64_t sequence) {
  event_.set_sequence(sequence);
  return *this;
}

EventBuilder& EventBuilder::AckOf(std::string_view event_id) {
  event_.set_ack_of_event_id(std::string(event_id));
  return *this;
}

EventBuilder& EventBuilder::Direction(std::string_view direction) {
  event_.set_direction(std::string(direction));
  return *this;
}

EventBuilder& EventBuilder::Field(std::string_view key, std::string_view value) {
  (*event_.mutable_payload()->mutable_fields())[std::string(key)].set_string_value(std::string(value));
  return *this;
}

EventBuilder& EventBuilder::Field(std::string_view key, const char* value) {
  return Field(key, std::string_view(value));
}

EventBuilder& EventBuilder::Field(std::string_view key, double value) {
  (*event_.mutable_payload()->mutable_fields())[std::string(key)].set_number_value(value);
  return *this;
}

EventBuilder& EventBuilder::Field(std::string_view key, int value) {
  return Field(key, static_cast<double>(value));
}

EventBuilder& EventBuilder::Field(std::string_view key, std::int64_t value) {
  return Field(key, static_cast<double>(value));
}

EventBuilder& EventBuilder::Field(std::string_view key, std::uint64_t value) {
  return Field(key, static_cast<double>(value));
}

EventBuilder& EventBuilder::Field(std::string_view key, bool value) {
  (*event_.mutable_payload()->mutable_fields())[std::string(key)].set_bool_value(value);
  return *this;
}

EventBuilder& EventBuilder::Field(std::string_view key, const std::vector<std::string>& values) {
  auto* list = (*event_.mutable_payload()->mutable_fields())[std::string(key)].mutable_list_value();
  list->clear_values();
  for (const auto& value : values) {
    list->add_values()->set_string_value(value);
  }
  return *this;
}

EventBuilder& EventBuilder::Field(std::string_view key, const google::protobuf::Value& value) {
  (*event_.mutable_payload()->mutable_fields())[std::string(key)] = value;
  return *this;
}

Event EventBuilder::Build() {
  if (event_.trace_id().empty()) {
    event_.set_trace_id(util::NewId("trc"));
  }
  if (event_.span_id().empty()) {
    event_.set_span_id(DeriveSpanId(event_.trace_id(), event_.stage(), event_.source(), event_.worker_id()));
  }
  return event_;
}

} // namespace ledger::model
