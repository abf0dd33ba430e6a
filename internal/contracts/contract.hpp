#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/pane_state.hpp"

namespace ledger::contracts {

enum class OperationClass : std::uint8_t {
  kSubmit,
  kResize,
  kControl,
};

enum class Priority : std::uint8_t {
  kNormal,
  kHigh, // kill/restart style recovery intents
};

struct InjectionRequest {
  std::string    request_id; // event id of the inject.requested / resize.requested event
  std::string    trace_id;
  std::string    worker_id;
  std::string    actor;
  OperationClass op       = OperationClass::kSubmit;
  Priority       priority = Priority::kNormal;
  std::string    intent;
  uint32_t       cols = 0;
  uint32_t       rows = 0;
};

struct DeferredRequest {
  InjectionRequest         request;
  int64_t                  deferred_at_ms = 0;
  int64_t                  expires_at_ms  = 0;
  std::vector<std::string> reasons;
  // newest event of this request's chain, parent of the next one
  std::string last_event_id;
};

struct InFlight {
  std::string actor;
  std::string request_id;
  std::string trace_id;
  int64_t     since_ms = 0;
};

/*
  Per-worker state handed to every contract evaluation. Owned by the
  engine; contracts only read it.
*/
struct WorkerContext {
  std::string                        worker_id;
  model::PaneStateVector             state;
  std::deque<DeferredRequest>        deferred;
  std::map<OperationClass, InFlight> in_flight;
  std::optional<InjectionRequest>    pending_resize;
};

enum class ContractAction : std::uint8_t {
  kDefer,
  kBlock,
};

struct Violation {
  std::string    contract_id;
  std::string    reason; // machine-stable
  ContractAction action = ContractAction::kDefer;
  // high-priority requests pass this gate with an override event
  bool bypassable = false;
};

class Contract {
 public:
  virtual ~Contract() = default;

  virtual std::string_view Id() const = 0;

  virtual bool AppliesTo(const InjectionRequest& request) const = 0;

  virtual std::optional<Violation> Check(const InjectionRequest& request, const WorkerContext& context) const = 0;
};

// focus-lock-guard, compaction-gate, safe-mode-gate, ownership-exclusive, in that order
std::vector<std::unique_ptr<Contract>> BuiltinContracts();

std::string_view OperationClassName(OperationClass op);

} // namespace ledger::contracts
