#include "internal/bridge/ack.hpp"

#include <array>
#include <utility>

#include "internal/model/event_builder.hpp"
#include "internal/model/payload_fields.hpp"

namespace ledger::bridge {

namespace v1 = ledger::kernel::v1;

namespace {

constexpr std::array<std::pair<v1::AckStatus, std::string_view>, 6> kAckNames{{
    {v1::ACK_STATUS_ACCEPTED, "accepted"},
    {v1::ACK_STATUS_REJECTED_TARGET_MISSING, "rejected_target_missing"},
    {v1::ACK_STATUS_REJECTED_NOT_ALIVE, "rejected_not_alive"},
    {v1::ACK_STATUS_REJECTED_MODE_UNSUPPORTED, "rejected_mode_unsupported"},
    {v1::ACK_STATUS_BLOCKED_DEDUP, "blocked_dedup"},
    {v1::ACK_STATUS_ERROR, "error"},
}};

} // namespace

std::string_view AckStatusName(v1::AckStatus status) {
  for (const auto& [value, name] : kAckNames) {
    if (value == status) return name;
  }
  return "error";
}

std::optional<v1::AckStatus> ParseAckStatus(std::string_view name) {
  for (const auto& [value, known] : kAckNames) {
    if (known == name) return value;
  }
  return std::nullopt;
}

v1::EventStatus EventStatusForAck(v1::AckStatus status) {
  switch (status) {
    case v1::ACK_STATUS_ACCEPTED:
      return v1::EVENT_STATUS_OK;
    case v1::ACK_STATUS_BLOCKED_DEDUP:
      return v1::EVENT_STATUS_DROPPED;
    default:
      return v1::EVENT_STATUS_FAILED;
  }
}

v1::Event BuildAck(const v1::Event& request, v1::AckStatus status, std::string_view detail, std::string_view source,
                   int64_t now_ms, std::string_view type) {
  model::EventBuilder builder(type, v1::STAGE_ACK, source, now_ms);
  builder.Parent(request)
      .AckOf(request.event_id())
      .Worker(request.worker_id())
      .Status(EventStatusForAck(status))
      .Field("ackStatus", AckStatusName(status))
      .Field("requestEventId", request.event_id());
  if (!detail.empty()) builder.Field("detail", detail);
  return builder.Build();
}

std::optional<v1::CommandAck> ToCommandAck(const v1::Event& ack) {
  auto name = model::StringField(ack.payload(), "ackStatus");
  if (!name) return std::nullopt;
  auto status = ParseAckStatus(*name);
  if (!status) return std::nullopt;

  v1::CommandAck out;
  out.set_request_event_id(ack.ack_of_event_id().empty() ? ack.parent_event_id() : ack.ack_of_event_id());
  out.set_trace_id(ack.trace_id());
  out.set_status(*status);
  if (auto detail = model::StringField(ack.payload(), "detail")) out.set_detail(*detail);
  return out;
}

} // namespace ledger::bridge
