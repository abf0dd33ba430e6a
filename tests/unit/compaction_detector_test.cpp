#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "internal/detector/compaction_detector.hpp"
#include "internal/model/payload_fields.hpp"

namespace {

using namespace ledger::detector;
using ledger::kernel::v1::Event;
using ledger::model::CompactionState;
using ledger::model::NumberField;
using ledger::model::StringField;
using ledger::model::StringListField;

constexpr const char* kMarker  = "Compacting conversation...";
constexpr const char* kSummary = "## Summary of the conversation so far\nCompacting conversation...";

DetectorSignal Chunk(std::string_view text) {
  return DetectorSignal{DetectorSignal::Kind::kChunk, text};
}

DetectorSignal TickSignal() {
  return DetectorSignal{DetectorSignal::Kind::kTick, {}};
}

void TestMatchers() {
  assert(HasLexicalMarker("Compacting conversation..."));
  assert(HasLexicalMarker("the CONTEXT WINDOW is nearly full"));
  assert(HasLexicalMarker("Summarizing the conversation"));
  assert(!HasLexicalMarker("compiled 12 modules"));

  assert(HasStructuredSummary("intro\n## Summary\n- item"));
  assert(HasStructuredSummary("- first long bullet\n- second long bullet\n* third long bullet"));
  assert(!HasStructuredSummary("- first long bullet\n- second long bullet\nplain\n- third long bullet"));
  assert(!HasStructuredSummary("#### Summary"));
  assert(!HasStructuredSummary("- short\n- tiny\n- nope"));

  assert(IsPromptReady("done\nuser@host:~$ "));
  assert(IsPromptReady("> "));
  assert(!IsPromptReady("loading..."));
}

void TestScoreChunkWeights() {
  DetectorState state;
  auto          score = ScoreChunk(state, kSummary, 0, {});
  assert(score.signals.lexical);
  assert(score.signals.structured);
  assert(score.signals.no_causation);
  assert(!score.signals.burst_no_prompt);
  assert(score.confidence > 0.69 && score.confidence < 0.71);
  assert(state.chunks_since_prompt == 1);

  state.last_injection_ms = 0;
  score                   = ScoreChunk(state, "plain\n$ ", 100, {});
  assert(score.prompt_ready);
  assert(score.signals.Count() == 0);
  assert(state.chunks_since_prompt == 0);
}

void TestLoneMarkerNeverLeavesNone() {
  CompactionDetector detector;
  detector.ObserveInjection("1", 0);

  for (int64_t t = 0; t <= 800; t += 400) {
    auto observation = detector.ObserveChunk("1", kMarker, t);
    assert(observation.events.empty());
    assert(!observation.gate.has_value());
  }
  assert(detector.State("1") == CompactionState::kNone);
}

void TestSustainedConfidencePromotes() {
  DetectorState state;

  auto r = Advance(state, 0, Chunk(kSummary));
  assert(!r.transition.has_value());
  assert(r.state.sustained_since.value() == 0);

  r = Advance(r.state, 300, Chunk(kSummary));
  assert(r.transition.has_value());
  assert(r.transition->to == CompactionState::kSuspected);
  assert(r.transition->reason == "sustained_confidence");

  r = Advance(r.state, 1100, Chunk(kSummary));
  assert(r.transition.has_value());
  assert(r.transition->from == CompactionState::kSuspected);
  assert(r.transition->to == CompactionState::kConfirmed);
  assert(r.transition->reason == "sustained_confidence");
  assert(r.state.confirmed_at.value() == 1100);
}

void TestBurstWithoutContentStaysSuspected() {
  CompactionDetector detector;

  // burst plus missing causation reaches suspected, but nothing confirms without content
  for (int64_t t = 0; t < 3000; t += 100) {
    auto observation = detector.ObserveChunk("1", "building module", t);
    for (const auto& event : observation.events) assert(event.type() != "cli.compaction.started");
  }
  assert(detector.State("1") == CompactionState::kSuspected);
}

void TestEpisodeSharesTraceAndChains() {
  CompactionDetector detector;
  std::vector<Event> events;

  auto observe = [&](std::string_view text, int64_t t) {
    auto observation = detector.ObserveChunk("1", text, t);
    events.insert(events.end(), observation.events.begin(), observation.events.end());
    return observation;
  };

  assert(observe(kMarker, 0).events.empty());

  auto suspected = observe(kMarker, 300);
  assert(suspected.gate.value() == CompactionState::kSuspected);

  assert(observe(kSummary, 400).events.empty());

  auto started = observe(kSummary, 500);
  assert(started.gate.value() == CompactionState::kConfirmed);
  assert(detector.State("1") == CompactionState::kConfirmed);

  auto ended = observe("user@host:~$ ", 2000);
  assert(ended.gate.value() == CompactionState::kCooldown);

  assert(detector.Tick(3499).empty());
  auto ticked = detector.Tick(3500);
  assert(ticked.size() == 1);
  assert(ticked[0].first == "1");
  assert(ticked[0].second.gate.value() == CompactionState::kNone);
  events.insert(events.end(), ticked[0].second.events.begin(), ticked[0].second.events.end());

  assert(events.size() == 4);
  assert(events[0].type() == "cli.compaction.suspected");
  assert(events[1].type() == "cli.compaction.started");
  assert(events[2].type() == "cli.compaction.ended");
  assert(events[3].type() == "cli.compaction.cleared");

  assert(events[0].trace_id().rfind("trc_", 0) == 0);
  assert(events[0].parent_event_id().empty());
  for (std::size_t i = 1; i < events.size(); ++i) {
    assert(events[i].trace_id() == events[0].trace_id());
    assert(events[i].parent_event_id() == events[i - 1].event_id());
  }

  for (const auto& event : events) {
    assert(event.stage() == ledger::kernel::v1::STAGE_TERMINAL);
    assert(event.source() == "ledger.compaction");
    assert(event.worker_id() == "1");
    assert(NumberField(event.payload(), "detectorVersion").value() == kDetectorVersion);
  }

  assert(events[0].status() == ledger::kernel::v1::EVENT_STATUS_UNKNOWN);
  assert(events[3].status() == ledger::kernel::v1::EVENT_STATUS_OK);

  assert(StringField(events[1].payload(), "transitionReason").value() == "rapid_suspect_hits");
  assert(StringField(events[1].payload(), "from").value() == "suspected");
  assert(StringListField(events[1].payload(), "signals") ==
         (std::vector<std::string>{"lexical", "structured", "no_causation"}));

  assert(StringField(events[2].payload(), "endReason").value() == "prompt_ready");
  assert(NumberField(events[2].payload(), "durationMs").value() == 1500);
  assert(!StringField(events[2].payload(), "transitionReason").has_value());

  assert(StringField(events[3].payload(), "transitionReason").value() == "cooldown_elapsed");
  assert(detector.State("1") == CompactionState::kNone);

  // the next episode gets a fresh trace
  observe(kMarker, 10000);
  auto again = observe(kMarker, 10300);
  assert(again.events.size() == 1);
  assert(again.events[0].trace_id() != events[0].trace_id());
}

void TestSilentSuspectedDecays() {
  CompactionDetector detector;
  detector.ObserveChunk("1", kMarker, 0);
  detector.ObserveChunk("1", kMarker, 300);
  assert(detector.State("1") == CompactionState::kSuspected);

  assert(detector.Tick(799).empty());
  auto ticked = detector.Tick(800);
  assert(ticked.size() == 1);
  const auto& cleared = ticked[0].second.events.at(0);
  assert(cleared.type() == "cli.compaction.cleared");
  assert(StringField(cleared.payload(), "transitionReason").value() == "confidence_decay");
  assert(StringField(cleared.payload(), "from").value() == "suspected");
  assert(detector.State("1") == CompactionState::kNone);
}

void TestMaxConfirmedDuration() {
  DetectorState state;
  state.state        = CompactionState::kConfirmed;
  state.confirmed_at = 0;

  auto r = Advance(state, 30000, TickSignal());
  assert(!r.transition.has_value());

  r = Advance(state, 30001, TickSignal());
  assert(r.transition.has_value());
  assert(r.transition->to == CompactionState::kCooldown);
  assert(r.transition->reason == "max_duration_timeout");
  assert(r.transition->duration_ms == 30001);
  assert(!r.state.confirmed_at.has_value());
}

void TestCooldownRenewedEvidence() {
  DetectorState state;
  state.state       = CompactionState::kCooldown;
  state.cooldown_at = 0;

  auto r = Advance(state, 400, Chunk(kMarker));
  assert(r.transition.has_value());
  assert(r.transition->to == CompactionState::kConfirmed);
  assert(r.transition->reason == "renewed_evidence");
}

void TestResetForgetsWorker() {
  CompactionDetector detector;
  detector.ObserveChunk("1", kMarker, 0);
  detector.ObserveChunk("1", kMarker, 300);
  assert(detector.State("1") == CompactionState::kSuspected);

  detector.Reset("1");
  assert(detector.State("1") == CompactionState::kNone);
  assert(detector.Tick(5000).empty());
}

} // namespace

int main() {
  TestMatchers();
  TestScoreChunkWeights();
  TestLoneMarkerNeverLeavesNone();
  TestSustainedConfidencePromotes();
  TestBurstWithoutContentStaysSuspected();
  TestEpisodeSharesTraceAndChains();
  TestSilentSuspectedDecays();
  TestMaxConfirmedDuration();
  TestCooldownRenewedEvidence();
  TestResetForgetsWorker();
  std::cout << "ledger_unit_compaction_detector: pass\n";
  return 0;
}
