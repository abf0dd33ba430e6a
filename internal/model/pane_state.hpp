#pragma once

#include <cstdint>
#include <string_view>

namespace ledger::model {

enum class Activity : std::uint8_t {
  kIdle = 0,
  kInjecting = 1,
  kResizing = 2,
  kRecovering = 3,
  kError = 4,
};

enum class CompactionState : std::uint8_t {
  kNone = 0,
  kSuspected = 1,
  kConfirmed = 2,
  kCooldown = 3,
};

enum class LinkState : std::uint8_t {
  kUp = 0,
  kDown = 1,
};

struct Gates {
  bool            focus_locked{false};
  CompactionState compacting{CompactionState::kNone};
  bool            safe_mode{false};
};

struct Connectivity {
  LinkState bridge{LinkState::kUp};
  LinkState terminal{LinkState::kUp};
};

/*
  Live state of one worker. Three independent lanes; every combination
  of lane values is legal (injecting while focus locked means the lock
  arrived mid-flow).

  Never persisted. Rebuilt from the event stream and reset on restart.
*/
struct PaneStateVector {
  Activity     activity{Activity::kIdle};
  Gates        gates{};
  Connectivity connectivity{};
};

constexpr std::string_view ActivityName(Activity activity) {
  switch (activity) {
    case Activity::kIdle:
      return "idle";
    case Activity::kInjecting:
      return "injecting";
    case Activity::kResizing:
      return "resizing";
    case Activity::kRecovering:
      return "recovering";
    case Activity::kError:
      return "error";
  }
  return "idle";
}

constexpr std::string_view CompactionStateName(CompactionState state) {
  switch (state) {
    case CompactionState::kNone:
      return "none";
    case CompactionState::kSuspected:
      return "suspected";
    case CompactionState::kConfirmed:
      return "confirmed";
    case CompactionState::kCooldown:
      return "cooldown";
  }
  return "none";
}

constexpr std::string_view LinkStateName(LinkState state) {
  return state == LinkState::kUp ? "up" : "down";
}

} // namespace ledger::model
