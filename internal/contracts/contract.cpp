#include "internal/contracts/contract.hpp"

namespace ledger::contracts {

namespace {

bool IsInjection(const InjectionRequest& request) {
  return request.op == OperationClass::kSubmit || request.op == OperationClass::kControl;
}

class FocusLockGuard final : public Contract {
 public:
  std::string_view Id() const override {
    return "focus-lock-guard";
  }

  bool AppliesTo(const InjectionRequest& request) const override {
    return IsInjection(request);
  }

  std::optional<Violation> Check(const InjectionRequest&, const WorkerContext& context) const override {
    if (!context.state.gates.focus_locked) return std::nullopt;
    return Violation{std::string(Id()), "focus_lock", ContractAction::kDefer, true};
  }
};

class CompactionGate final : public Contract {
 public:
  std::string_view Id() const override {
    return "compaction-gate";
  }

  bool AppliesTo(const InjectionRequest& request) const override {
    return IsInjection(request);
  }

  // only a confirmed compaction gates; suspected and cooldown do not
  std::optional<Violation> Check(const InjectionRequest&, const WorkerContext& context) const override {
    if (context.state.gates.compacting != model::CompactionState::kConfirmed) return std::nullopt;
    return Violation{std::string(Id()), "compaction_gate", ContractAction::kDefer, true};
  }
};

class SafeModeGate final : public Contract {
 public:
  std::string_view Id() const override {
    return "safe-mode-gate";
  }

  bool AppliesTo(const InjectionRequest& request) const override {
    return IsInjection(request);
  }

  std::optional<Violation> Check(const InjectionRequest&, const WorkerContext& context) const override {
    if (!context.state.gates.safe_mode) return std::nullopt;
    return Violation{std::string(Id()), "safe_mode", ContractAction::kDefer, true};
  }
};

class OwnershipExclusive final : public Contract {
 public:
  std::string_view Id() const override {
    return "ownership-exclusive";
  }

  bool AppliesTo(const InjectionRequest& request) const override {
    return IsInjection(request);
  }

  std::optional<Violation> Check(const InjectionRequest& request, const WorkerContext& context) const override {
    auto it = context.in_flight.find(request.op);
    if (it == context.in_flight.end() || it->second.request_id == request.request_id) return std::nullopt;

    if (it->second.actor == request.actor) {
      return Violation{std::string(Id()), "in_flight", ContractAction::kDefer, false};
    }
    return Violation{std::string(Id()), "ownership_conflict", ContractAction::kBlock, false};
  }
};

} // namespace

std::vector<std::unique_ptr<Contract>> BuiltinContracts() {
  std::vector<std::unique_ptr<Contract>> contracts;
  contracts.push_back(std::make_unique<FocusLockGuard>());
  contracts.push_back(std::make_unique<CompactionGate>());
  contracts.push_back(std::make_unique<SafeModeGate>());
  contracts.push_back(std::make_unique<OwnershipExclusive>());
  return contracts;
}

std::string_view OperationClassName(OperationClass op) {
  switch (op) {
    case OperationClass::kSubmit:
      return "submit";
    case OperationClass::kResize:
      return "resize";
    case OperationClass::kControl:
      return "control";
  }
  return "submit";
}

} // namespace ledger::contracts
