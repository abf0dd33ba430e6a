#include "taxonomy.hpp"

#include <array>
#include <utility>

namespace ledger::model {

using namespace ledger::kernel::v1;

namespace {

constexpr std::array<std::pair<EventKind, std::string_view>, 31> kKindNames = {{
    {EventKind::kInjectRequested, "inject.requested"},
    {EventKind::kInjectApplied, "inject.applied"},
    {EventKind::kInjectDeferred, "inject.deferred"},
    {EventKind::kInjectResumed, "inject.resumed"},
    {EventKind::kInjectOverride, "inject.override"},
    {EventKind::kInjectDropped, "inject.dropped"},
    {EventKind::kInjectSubmitSent, "inject.submit.sent"},
    {EventKind::kInjectVerified, "inject.verified"},
    {EventKind::kInjectFailed, "inject.failed"},
    {EventKind::kResizeRequested, "resize.requested"},
    {EventKind::kResizeCoalesced, "resize.coalesced"},
    {EventKind::kResizeApplied, "resize.applied"},
    {EventKind::kContractViolation, "contract.violation"},
    {EventKind::kCompactionSuspected, "cli.compaction.suspected"},
    {EventKind::kCompactionStarted, "cli.compaction.started"},
    {EventKind::kCompactionEnded, "cli.compaction.ended"},
    {EventKind::kCompactionCleared, "cli.compaction.cleared"},
    {EventKind::kPaneStateChanged, "pane.state.changed"},
    {EventKind::kFocusLocked, "focus.locked"},
    {EventKind::kFocusReleased, "focus.released"},
    {EventKind::kWorkerRestarted, "worker.restarted"},
    {EventKind::kBridgeConnected, "bridge.connected"},
    {EventKind::kBridgeDisconnected, "bridge.disconnected"},
    {EventKind::kEventDropped, "event.dropped"},
    {EventKind::kEventInvalid, "event.invalid"},
    {EventKind::kTraceRootDuplicate, "trace.root.duplicate"},
    {EventKind::kSpanTimeout, "span.timeout"},
    {EventKind::kSafeModeEntered, "safemode.entered"},
    {EventKind::kSafeModeExited, "safemode.exited"},
    {EventKind::kWriteAck, "daemon.write.ack"},
    {EventKind::kOutputChunk, "pty.data.received"},
}};

bool IsSegmentChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
}

} // namespace

EventKind ParseEventKind(std::string_view type) {
  for (const auto& [kind, name] : kKindNames) {
    if (name == type) return kind;
  }
  return EventKind::kOther;
}

std::string_view EventTypeName(EventKind kind) {
  for (const auto& [k, name] : kKindNames) {
    if (k == kind) return name;
  }
  return "event.other";
}

EventClass ClassOf(EventKind kind) {
  switch (kind) {
    case EventKind::kOutputChunk:
    case EventKind::kPaneStateChanged:
    case EventKind::kResizeCoalesced:
      return EventClass::kTelemetry;

    case EventKind::kBridgeConnected:
    case EventKind::kBridgeDisconnected:
    case EventKind::kEventDropped:
    case EventKind::kEventInvalid:
    case EventKind::kTraceRootDuplicate:
    case EventKind::kSpanTimeout:
    case EventKind::kSafeModeEntered:
    case EventKind::kSafeModeExited:
    case EventKind::kWorkerRestarted:
      return EventClass::kSystem;

    default:
      return EventClass::kContract;
  }
}

EventClass ClassOf(const Event& event) {
  const auto kind = ParseEventKind(event.type());
  if (kind == EventKind::kOther && event.stage() == STAGE_SYSTEM) {
    return EventClass::kSystem;
  }
  return ClassOf(kind);
}

bool IsDottedType(std::string_view type) {
  if (type.empty() || type.front() == '.' || type.back() == '.') return false;

  bool has_dot = false;
  char prev    = '\0';
  for (char c : type) {
    if (c == '.') {
      if (prev == '.') return false;
      has_dot = true;
    } else if (!IsSegmentChar(c)) {
      return false;
    }
    prev = c;
  }
  return has_dot;
}

std::string_view StageName(Stage stage) {
  switch (stage) {
    case STAGE_INGRESS:
      return "ingress";
    case STAGE_ROUTE:
      return "route";
    case STAGE_INJECT:
      return "inject";
    case STAGE_TRANSPORT:
      return "transport";
    case STAGE_TERMINAL:
      return "terminal";
    case STAGE_ACK:
      return "ack";
    case STAGE_VERIFY:
      return "verify";
    case STAGE_SYSTEM:
      return "system";
    default:
      return "unspecified";
  }
}

std::optional<Stage> ParseStage(std::string_view name) {
  if (name == "ingress") return STAGE_INGRESS;
  if (name == "route") return STAGE_ROUTE;
  if (name == "inject") return STAGE_INJECT;
  if (name == "transport") return STAGE_TRANSPORT;
  if (name == "terminal") return STAGE_TERMINAL;
  if (name == "ack") return STAGE_ACK;
  if (name == "verify") return STAGE_VERIFY;
  if (name == "system") return STAGE_SYSTEM;
  return std::nullopt;
}

std::string_view StatusName(EventStatus status) {
  switch (status) {
    case EVENT_STATUS_OK:
      return "ok";
    case EVENT_STATUS_DEFERRED:
      return "deferred";
    case EVENT_STATUS_FAILED:
      return "failed";
    case EVENT_STATUS_DROPPED:
      return "dropped";
    case EVENT_STATUS_TIMEOUT:
      return "timeout";
    default:
      return "unknown";
  }
}

std::optional<EventStatus> ParseStatus(std::string_view name) {
  if (name == "ok") return EVENT_STATUS_OK;
  if (name == "deferred") return EVENT_STATUS_DEFERRED;
  if (name == "failed") return EVENT_STATUS_FAILED;
  if (name == "dropped") return EVENT_STATUS_DROPPED;
  if (name == "timeout") return EVENT_STATUS_TIMEOUT;
  if (name == "unknown") return EVENT_STATUS_UNKNOWN;
  return std::nullopt;
}

bool IsTerminalStatus(EventStatus status) {
  return status == EVENT_STATUS_OK || IsFailureStatus(status);
}

bool IsFailureStatus(EventStatus status) {
  return status == EVENT_STATUS_FAILED || status == EVENT_STATUS_DROPPED || status == EVENT_STATUS_TIMEOUT;
}

std::string_view EdgeTypeName(EdgeType type) {
  switch (type) {
    case EDGE_TYPE_PARENT:
      return "parent";
    case EDGE_TYPE_ACK_OF:
      return "ack_of";
    case EDGE_TYPE_RETRY_OF:
      return "retry_of";
    default:
      return "unspecified";
  }
}

} // namespace ledger::model
