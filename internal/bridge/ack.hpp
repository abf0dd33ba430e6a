#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "ledger/kernel/v1/bridge.pb.h"
#include "ledger/kernel/v1/event.pb.h"

namespace ledger::bridge {

std::string_view                             AckStatusName(ledger::kernel::v1::AckStatus status);
std::optional<ledger::kernel::v1::AckStatus> ParseAckStatus(std::string_view name);

// accepted is ok, blocked_dedup is dropped, the rest failed
ledger::kernel::v1::EventStatus EventStatusForAck(ledger::kernel::v1::AckStatus status);

/*
  Ack event for a command request. Same trace, parented on the request and
  linked to it by ack_of so the store records the edge.
*/
ledger::kernel::v1::Event BuildAck(const ledger::kernel::v1::Event& request, ledger::kernel::v1::AckStatus status,
                                   std::string_view detail, std::string_view source, int64_t now_ms,
                                   std::string_view type = "daemon.write.ack");

// Reads an ack event back; nullopt when the event carries no ack status.
std::optional<ledger::kernel::v1::CommandAck> ToCommandAck(const ledger::kernel::v1::Event& ack);

} // namespace ledger::bridge
