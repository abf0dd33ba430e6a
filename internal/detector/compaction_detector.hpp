#pragma once

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/model/pane_state.hpp"
#include "ledger/kernel/v1/event.pb.h"

namespace ledger::detector {

inline constexpr int kDetectorVersion = 1;

struct DetectorOptions {
  double weight_lexical      = 0.25;
  double weight_structured   = 0.30;
  double weight_burst        = 0.25;
  double weight_no_causation = 0.15;

  double suspect_threshold = 0.35;
  double confirm_threshold = 0.60;
  // confirmed decays to cooldown below this
  double decay_threshold = 0.20;

  std::size_t min_signals = 2;

  int64_t suspect_sustain_ms      = 300;
  int64_t confirm_sustain_ms      = 800;
  int64_t decay_ms                = 500;
  int64_t cooldown_ms             = 1500;
  int64_t rapid_suspect_window_ms = 2000;
  std::size_t rapid_suspect_count = 3;
  int64_t max_confirmed_ms        = 30000;

  uint32_t burst_chunks       = 5;
  int64_t  causation_window_ms = 10000;
};

struct Signals {
  bool lexical         = false;
  bool structured      = false;
  bool burst_no_prompt = false;
  bool no_causation    = false;

  std::size_t              Count() const;
  std::vector<std::string> Names() const;
};

struct ChunkScore {
  double  confidence   = 0.0;
  Signals signals;
  bool    prompt_ready = false;
};

struct DetectorState {
  model::CompactionState state      = model::CompactionState::kNone;
  double                 confidence = 0.0;
  Signals                signals;

  std::optional<int64_t> sustained_since;
  std::optional<int64_t> decay_since;
  std::optional<int64_t> confirmed_at;
  std::optional<int64_t> cooldown_at;
  std::deque<int64_t>    suspect_hits;

  uint32_t               chunks_since_prompt = 0;
  std::optional<int64_t> last_chunk_ms;
  std::optional<int64_t> last_injection_ms;
};

struct DetectorSignal {
  enum class Kind : std::uint8_t {
    kChunk,
    kTick,
    kUserInjection,
  };

  Kind             kind = Kind::kTick;
  std::string_view text;
};

struct Transition {
  model::CompactionState from = model::CompactionState::kNone;
  model::CompactionState to   = model::CompactionState::kNone;
  std::string            reason;
  double                 confidence  = 0.0;
  Signals                signals;
  int64_t                duration_ms = 0; // time spent confirmed, on the way out
};

struct AdvanceResult {
  DetectorState             state;
  std::optional<Transition> transition;
};

// Lexical, structured and prompt-ready matching on one output chunk.
bool HasLexicalMarker(std::string_view text);
bool HasStructuredSummary(std::string_view text);
bool IsPromptReady(std::string_view text);

// Scores a chunk against the state it arrives in. Also counts the chunk
// toward the burst signal, so the returned state must be kept.
ChunkScore ScoreChunk(DetectorState& state, std::string_view text, int64_t now_ms, const DetectorOptions& options);

/*
  The detector state machine:

    none -> suspected -> confirmed -> cooldown -> none

  Pure: the next state depends only on the inputs. A transition needs the
  confidence held for its sustain window and at least min_signals
  distinct signals, so a lone marker never gets past suspected.
*/
AdvanceResult Advance(const DetectorState& state, int64_t now_ms, const DetectorSignal& signal,
                      const DetectorOptions& options = {});

struct Observation {
  std::vector<ledger::kernel::v1::Event> events;
  // set when the worker's compacting gate moved
  std::optional<model::CompactionState> gate;
};

/*
  Per-worker detector. Every transition becomes a cli.compaction.* event;
  one episode (suspected through cleared) shares a trace.
*/
class CompactionDetector {
 public:
  explicit CompactionDetector(DetectorOptions options = {});

  Observation ObserveChunk(const std::string& worker_id, std::string_view text, int64_t now_ms);
  void        ObserveInjection(const std::string& worker_id, int64_t now_ms);

  // timers only: cooldown expiry, max confirmed duration, silent decay
  std::vector<std::pair<std::string, Observation>> Tick(int64_t now_ms);

  model::CompactionState State(const std::string& worker_id) const;
  void                   Reset(const std::string& worker_id);

 private:
  struct Worker {
    DetectorState state;
    std::string   episode_trace;
    std::string   last_event_id;
  };

  Observation ApplyLocked(const std::string& worker_id, Worker& worker, AdvanceResult result, int64_t now_ms);

  DetectorOptions options_;

  mutable std::mutex                      mutex_;
  std::unordered_map<std::string, Worker> workers_;
};

} // namespace ledger::detector
