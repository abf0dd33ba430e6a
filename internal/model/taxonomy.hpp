#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "ledger/kernel/v1/event.pb.h"

namespace ledger::model {

/*
  Closed taxonomy of the event types the kernel itself produces or reacts to.

  Producers may use any other dotted type; those parse as kOther and are
  stored untouched. Payloads stay opaque; only the consumer that needs a
  specific field reads it.
*/
enum class EventKind : std::uint8_t {
  kOther = 0,

  kInjectRequested,
  kInjectApplied,
  kInjectDeferred,
  kInjectResumed,
  kInjectOverride,
  kInjectDropped,
  kInjectSubmitSent,
  kInjectVerified,
  kInjectFailed,

  kResizeRequested,
  kResizeCoalesced,
  kResizeApplied,

  kContractViolation,

  kCompactionSuspected,
  kCompactionStarted,
  kCompactionEnded,
  kCompactionCleared,

  kPaneStateChanged,
  kFocusLocked,
  kFocusReleased,
  kWorkerRestarted,

  kBridgeConnected,
  kBridgeDisconnected,
  kEventDropped,
  kEventInvalid,
  kTraceRootDuplicate,
  kSpanTimeout,
  kSafeModeEntered,
  kSafeModeExited,

  kWriteAck,
  kOutputChunk,
};

// Capacity policy class. Telemetry may be shed under pressure;
// contract and system events are only removed by retention. Only the
// known high-frequency kinds are telemetry: an unrecognised type may be
// causal, so it is never shed.
enum class EventClass : std::uint8_t {
  kTelemetry,
  kContract,
  kSystem,
};

EventKind        ParseEventKind(std::string_view type);
std::string_view EventTypeName(EventKind kind);

EventClass ClassOf(EventKind kind);
EventClass ClassOf(const ledger::kernel::v1::Event& event);

// "a.b" style, lowercase segments of [a-z0-9_]
bool IsDottedType(std::string_view type);

std::string_view                          StageName(ledger::kernel::v1::Stage stage);
std::optional<ledger::kernel::v1::Stage> ParseStage(std::string_view name);

std::string_view                                StatusName(ledger::kernel::v1::EventStatus status);
std::optional<ledger::kernel::v1::EventStatus> ParseStatus(std::string_view name);

// ok, failed, dropped and timeout end a span; deferred and unknown keep it open
bool IsTerminalStatus(ledger::kernel::v1::EventStatus status);

// failed, dropped and timeout
bool IsFailureStatus(ledger::kernel::v1::EventStatus status);

std::string_view EdgeTypeName(ledger::kernel::v1::EdgeType type);

} // namespace ledger::model
