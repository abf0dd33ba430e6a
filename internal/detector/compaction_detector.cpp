#include "internal/detector/compaction_detector.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <utility>

#include "internal/model/event_builder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/ids.hpp"

namespace ledger::detector {

namespace v1 = ledger::kernel::v1;
using model::CompactionState;

namespace {

constexpr const char* kSource = "ledger.compaction";

const std::vector<std::regex>& LexicalPatterns() {
  static const std::vector<std::regex> patterns = [] {
    const auto flags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
    return std::vector<std::regex>{
        std::regex("compacting", flags),
        std::regex("summariz(e|ing) (the |your |this )?conversation", flags),
        std::regex("context window", flags),
        std::regex("truncat(e|ed|ing) (the |earlier |previous )?messages", flags),
        std::regex("conversation (is )?(too |very )?long", flags),
        std::regex("reducing context", flags),
    };
  }();
  return patterns;
}

std::vector<std::string_view> SplitLines(std::string_view text) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  while (start <= text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos) end = text.size();
    std::string_view line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    lines.push_back(line);
    start = end + 1;
  }
  return lines;
}

std::string_view TrimLeft(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  return s;
}

std::string_view TrimRight(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

bool IsSummaryHeading(std::string_view line) {
  std::size_t hashes = 0;
  while (hashes < line.size() && line[hashes] == '#') ++hashes;
  if (hashes == 0 || hashes > 3 || hashes == line.size()) return false;
  if (line[hashes] != ' ' && line[hashes] != '\t') return false;

  std::string_view rest = TrimLeft(line.substr(hashes));
  if (rest.size() < 7) return false;
  std::string word(rest.substr(0, 7));
  std::transform(word.begin(), word.end(), word.begin(), [](unsigned char c) { return std::tolower(c); });
  return word == "summary";
}

// "- " or "* " followed by at least ten characters
bool IsLongBullet(std::string_view line) {
  if (line.size() < 2 || (line[0] != '-' && line[0] != '*')) return false;
  if (line[1] != ' ' && line[1] != '\t') return false;
  return TrimLeft(line.substr(1)).size() >= 10;
}

Transition MakeTransition(const DetectorState& state, CompactionState from, std::string reason, int64_t now_ms) {
  Transition t;
  t.from       = from;
  t.to         = state.state;
  t.reason     = std::move(reason);
  t.confidence = state.confidence;
  t.signals    = state.signals;
  if (from == CompactionState::kConfirmed && state.confirmed_at) t.duration_ms = now_ms - *state.confirmed_at;
  return t;
}

void EnterCooldown(AdvanceResult& r, std::string reason, int64_t now_ms) {
  DetectorState& s = r.state;
  s.state          = CompactionState::kCooldown;
  s.cooldown_at    = now_ms;
  s.sustained_since.reset();
  s.decay_since.reset();
  r.transition = MakeTransition(s, CompactionState::kConfirmed, std::move(reason), now_ms);
  s.confirmed_at.reset();
}

void EnterConfirmed(AdvanceResult& r, CompactionState from, std::string reason, int64_t now_ms) {
  DetectorState& s = r.state;
  s.state          = CompactionState::kConfirmed;
  s.confirmed_at   = now_ms;
  s.cooldown_at.reset();
  s.sustained_since.reset();
  s.decay_since.reset();
  r.transition = MakeTransition(s, from, std::move(reason), now_ms);
}

void EnterNone(AdvanceResult& r, std::string reason, int64_t now_ms) {
  DetectorState&  s    = r.state;
  CompactionState from = s.state;
  s.state              = CompactionState::kNone;
  s.sustained_since.reset();
  s.decay_since.reset();
  s.cooldown_at.reset();
  s.suspect_hits.clear();
  s.chunks_since_prompt = 0;
  r.transition          = MakeTransition(s, from, std::move(reason), now_ms);
}

// burst and missing causation only describe context; promotion also needs content evidence
bool HasContentSignal(const Signals& signals) {
  return signals.lexical || signals.structured;
}

void StepChunk(AdvanceResult& r, int64_t now_ms, const DetectorOptions& o) {
  DetectorState& s          = r.state;
  const double   confidence = s.confidence;
  const bool     multi      = s.signals.Count() >= o.min_signals;

  switch (s.state) {
    case CompactionState::kNone: {
      if (confidence >= o.suspect_threshold && multi) {
        if (!s.sustained_since) s.sustained_since = now_ms;
        if (now_ms - *s.sustained_since >= o.suspect_sustain_ms) {
          s.state           = CompactionState::kSuspected;
          s.sustained_since = now_ms;
          s.suspect_hits.push_back(now_ms);
          r.transition = MakeTransition(s, CompactionState::kNone, "sustained_confidence", now_ms);
        }
      } else {
        s.sustained_since.reset();
      }
      break;
    }

    case CompactionState::kSuspected: {
      if (confidence >= o.suspect_threshold) {
        s.decay_since.reset();
        s.suspect_hits.push_back(now_ms);
      }
      while (!s.suspect_hits.empty() && now_ms - s.suspect_hits.front() >= o.rapid_suspect_window_ms) {
        s.suspect_hits.pop_front();
      }
      const bool rapid = s.suspect_hits.size() >= o.rapid_suspect_count;

      if (confidence >= o.confirm_threshold && multi && HasContentSignal(s.signals)) {
        if (!s.sustained_since) s.sustained_since = now_ms;
        if (now_ms - *s.sustained_since >= o.confirm_sustain_ms || rapid) {
          EnterConfirmed(r, CompactionState::kSuspected, rapid ? "rapid_suspect_hits" : "sustained_confidence",
                         now_ms);
        }
      } else if (rapid && multi && HasContentSignal(s.signals)) {
        EnterConfirmed(r, CompactionState::kSuspected, "rapid_suspect_hits", now_ms);
      } else if (confidence < o.suspect_threshold) {
        s.sustained_since.reset();
        if (!s.decay_since) s.decay_since = now_ms;
        if (now_ms - *s.decay_since >= o.decay_ms) EnterNone(r, "confidence_decay", now_ms);
      } else {
        s.sustained_since.reset();
      }
      break;
    }

    case CompactionState::kConfirmed: {
      if (s.confirmed_at && now_ms - *s.confirmed_at > o.max_confirmed_ms) {
        EnterCooldown(r, "max_duration_timeout", now_ms);
        break;
      }
      if (confidence < o.decay_threshold) {
        if (!s.decay_since) s.decay_since = now_ms;
        if (now_ms - *s.decay_since >= o.decay_ms) EnterCooldown(r, "confidence_decay", now_ms);
      } else {
        s.decay_since.reset();
      }
      break;
    }

    case CompactionState::kCooldown: {
      if (confidence >= o.suspect_threshold && multi && HasContentSignal(s.signals)) {
        EnterConfirmed(r, CompactionState::kCooldown, "renewed_evidence", now_ms);
      } else if (s.cooldown_at && now_ms - *s.cooldown_at >= o.cooldown_ms) {
        EnterNone(r, "cooldown_elapsed", now_ms);
      }
      break;
    }
  }
}

void StepTimers(AdvanceResult& r, int64_t now_ms, const DetectorOptions& o) {
  DetectorState& s = r.state;
  switch (s.state) {
    case CompactionState::kNone:
      break;
    case CompactionState::kSuspected:
      // silence counts as decayed confidence
      if (s.last_chunk_ms && now_ms - *s.last_chunk_ms >= o.decay_ms) {
        s.confidence = 0.0;
        s.signals    = Signals{};
        EnterNone(r, "confidence_decay", now_ms);
      }
      break;
    case CompactionState::kConfirmed:
      if (s.confirmed_at && now_ms - *s.confirmed_at > o.max_confirmed_ms) {
        EnterCooldown(r, "max_duration_timeout", now_ms);
      }
      break;
    case CompactionState::kCooldown:
      if (s.cooldown_at && now_ms - *s.cooldown_at >= o.cooldown_ms) EnterNone(r, "cooldown_elapsed", now_ms);
      break;
  }
}

std::string_view EventTypeFor(CompactionState to) {
  switch (to) {
    case CompactionState::kSuspected:
      return "cli.compaction.suspected";
    case CompactionState::kConfirmed:
      return "cli.compaction.started";
    case CompactionState::kCooldown:
      return "cli.compaction.ended";
    case CompactionState::kNone:
      return "cli.compaction.cleared";
  }
  return "cli.compaction.cleared";
}

} // namespace

std::size_t Signals::Count() const {
  return static_cast<std::size_t>(lexical) + static_cast<std::size_t>(structured) +
         static_cast<std::size_t>(burst_no_prompt) + static_cast<std::size_t>(no_causation);
}

std::vector<std::string> Signals::Names() const {
  std::vector<std::string> names;
  if (lexical) names.emplace_back("lexical");
  if (structured) names.emplace_back("structured");
  if (burst_no_prompt) names.emplace_back("burst_no_prompt");
  if (no_causation) names.emplace_back("no_causation");
  return names;
}

bool HasLexicalMarker(std::string_view text) {
  for (const auto& pattern : LexicalPatterns()) {
    if (std::regex_search(text.begin(), text.end(), pattern)) return true;
  }
  return false;
}

bool HasStructuredSummary(std::string_view text) {
  int bullets = 0;
  for (auto line : SplitLines(text)) {
    if (IsSummaryHeading(line)) return true;
    bullets = IsLongBullet(line) ? bullets + 1 : 0;
    if (bullets >= 3) return true;
  }
  return false;
}

// some line ends in a shell or REPL prompt character
bool IsPromptReady(std::string_view text) {
  for (auto line : SplitLines(text)) {
    line = TrimRight(line);
    if (!line.empty() && (line.back() == '$' || line.back() == '>')) return true;
  }
  return false;
}

ChunkScore ScoreChunk(DetectorState& state, std::string_view text, int64_t now_ms, const DetectorOptions& options) {
  ChunkScore score;

  if (HasLexicalMarker(text)) {
    score.signals.lexical = true;
    score.confidence += options.weight_lexical;
  }
  if (HasStructuredSummary(text)) {
    score.signals.structured = true;
    score.confidence += options.weight_structured;
  }

  ++state.chunks_since_prompt;
  score.prompt_ready = IsPromptReady(text);
  if (score.prompt_ready) {
    state.chunks_since_prompt = 0;
  } else if (state.chunks_since_prompt >= options.burst_chunks) {
    score.signals.burst_no_prompt = true;
    score.confidence += options.weight_burst;
  }

  if (!state.last_injection_ms || now_ms - *state.last_injection_ms > options.causation_window_ms) {
    score.signals.no_causation = true;
    score.confidence += options.weight_no_causation;
  }

  score.confidence = std::min(score.confidence, 1.0);
  return score;
}

AdvanceResult Advance(const DetectorState& state, int64_t now_ms, const DetectorSignal& signal,
                      const DetectorOptions& options) {
  AdvanceResult r{state, std::nullopt};
  DetectorState& s = r.state;

  switch (signal.kind) {
    case DetectorSignal::Kind::kUserInjection:
      s.last_injection_ms = now_ms;
      return r;

    case DetectorSignal::Kind::kTick:
      StepTimers(r, now_ms, options);
      return r;

    case DetectorSignal::Kind::kChunk:
      break;
  }

  // a prompt while confirmed is the end marker
  if (s.state == CompactionState::kConfirmed && IsPromptReady(signal.text)) {
    s.chunks_since_prompt = 0;
    s.last_chunk_ms       = now_ms;
    EnterCooldown(r, "prompt_ready", now_ms);
    return r;
  }

  ChunkScore score = ScoreChunk(s, signal.text, now_ms, options);
  s.confidence     = score.confidence;
  s.signals        = score.signals;
  s.last_chunk_ms  = now_ms;

  StepChunk(r, now_ms, options);
  return r;
}

CompactionDetector::CompactionDetector(DetectorOptions options) : options_(options) {
}

Observation CompactionDetector::ObserveChunk(const std::string& worker_id, std::string_view text, int64_t now_ms) {
  std::lock_guard lock(mutex_);
  Worker& worker = workers_[worker_id];
  return ApplyLocked(worker_id, worker,
                     Advance(worker.state, now_ms, DetectorSignal{DetectorSignal::Kind::kChunk, text}, options_),
                     now_ms);
}

void CompactionDetector::ObserveInjection(const std::string& worker_id, int64_t now_ms) {
  std::lock_guard lock(mutex_);
  Worker& worker = workers_[worker_id];
  worker.state   = Advance(worker.state, now_ms, DetectorSignal{DetectorSignal::Kind::kUserInjection, {}}, options_)
                     .state;
}

std::vector<std::pair<std::string, Observation>> CompactionDetector::Tick(int64_t now_ms) {
  std::lock_guard lock(mutex_);
  std::vector<std::pair<std::string, Observation>> out;
  for (auto& [worker_id, worker] : workers_) {
    if (worker.state.state == CompactionState::kNone) continue;
    auto observation = ApplyLocked(
        worker_id, worker, Advance(worker.state, now_ms, DetectorSignal{DetectorSignal::Kind::kTick, {}}, options_),
        now_ms);
    if (!observation.events.empty()) out.emplace_back(worker_id, std::move(observation));
  }
  return out;
}

CompactionState CompactionDetector::State(const std::string& worker_id) const {
  std::lock_guard lock(mutex_);
  auto it = workers_.find(worker_id);
  return it == workers_.end() ? CompactionState::kNone : it->second.state.state;
}

void CompactionDetector::Reset(const std::string& worker_id) {
  std::lock_guard lock(mutex_);
  workers_.erase(worker_id);
}

Observation CompactionDetector::ApplyLocked(const std::string& worker_id, Worker& worker, AdvanceResult result,
                                            int64_t now_ms) {
  worker.state = std::move(result.state);

  Observation observation;
  if (!result.transition) return observation;
  const Transition& t = *result.transition;

  if (t.from == CompactionState::kNone) {
    worker.episode_trace = util::NewId("trc");
    worker.last_event_id.clear();
  }

  model::EventBuilder builder(EventTypeFor(t.to), v1::STAGE_TERMINAL, kSource, now_ms);
  if (worker.last_event_id.empty()) {
    builder.Trace(worker.episode_trace);
  } else {
    builder.ParentId(worker.episode_trace, worker.last_event_id);
  }
  builder.Worker(worker_id)
      .Status(t.to == CompactionState::kNone ? v1::EVENT_STATUS_OK : v1::EVENT_STATUS_UNKNOWN)
      .Field("confidence", t.confidence)
      .Field("signals", t.signals.Names())
      .Field("detectorVersion", kDetectorVersion)
      .Field("from", model::CompactionStateName(t.from));

  if (t.to == CompactionState::kCooldown) {
    builder.Field("endReason", t.reason).Field("durationMs", t.duration_ms);
  } else {
    builder.Field("transitionReason", t.reason);
  }

  auto event           = builder.Build();
  worker.last_event_id = event.event_id();
  observation.events.push_back(std::move(event));
  observation.gate = t.to;

  if (t.to == CompactionState::kNone) {
    worker.episode_trace.clear();
    worker.last_event_id.clear();
  }

  LEDGER_LOG_DEBUG("compaction state changed", {observability::StringField("worker_id", worker_id),
                                                observability::StringField("from", model::CompactionStateName(t.from)),
                                                observability::StringField("to", model::CompactionStateName(t.to)),
                                                observability::StringField("reason", t.reason)});
  return observation;
}

} // namespace ledger::detector
