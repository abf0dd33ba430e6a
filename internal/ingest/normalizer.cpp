#include "internal/ingest/normalizer.hpp"

#include <cmath>
#include <google/protobuf/util/json_util.h>

#include "internal/model/event_builder.hpp"
#include "internal/model/payload_fields.hpp"
#include "internal/model/taxonomy.hpp"
#include "internal/util/ids.hpp"

namespace ledger::ingest {

using namespace ledger::kernel::v1;
using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

constexpr std::string_view kNormalizerSource = "ledger.normalizer";

// Reads a string field accepting a canonical and a legacy spelling.
// Both present and different is an unresolvable conflict.
std::string ReadAliased(const Struct& raw, std::string_view canonical, std::string_view legacy, bool* legacy_used,
                        std::vector<std::string>* errors) {
  auto primary = model::StringField(raw, canonical);
  auto alias   = legacy.empty() ? std::nullopt : model::StringField(raw, legacy);

  if (primary && alias && !primary->empty() && !alias->empty() && *primary != *alias) {
    errors->push_back("conflict: " + std::string(canonical) + " != " + std::string(legacy));
    return *primary;
  }
  if (primary && !primary->empty()) return *primary;
  if (alias && !alias->empty()) {
    if (legacy_used) *legacy_used = true;
    return *alias;
  }
  return {};
}

std::optional<double> ReadNumber(const Struct& raw, std::string_view canonical, std::string_view legacy) {
  if (auto value = model::NumberField(raw, canonical)) return value;
  if (!legacy.empty()) return model::NumberField(raw, legacy);
  return std::nullopt;
}

void ReadEvidenceRefs(const Struct& raw, Event* event) {
  const auto* refs = model::FindField(raw, "evidenceRefs");
  if (!refs || refs->kind_case() != Value::kListValue) return;

  for (const auto& item : refs->list_value().values()) {
    if (item.kind_case() != Value::kStructValue) continue;
    const auto& fields = item.struct_value();
    auto*       ref    = event->add_evidence_refs();
    ref->set_kind(model::StringField(fields, "kind").value_or(""));
    ref->set_path(model::StringField(fields, "path").value_or(""));
    ref->set_line(static_cast<int64_t>(model::NumberField(fields, "line").value_or(0)));
    ref->set_hash(model::StringField(fields, "hash").value_or(""));
    ref->set_note(model::StringField(fields, "note").value_or(""));
  }
}

// Required fields, taxonomy shape and alias mirrors on an Event that
// already carries typed fields.
void Validate(Event* event, const NormalizeOptions& options, std::vector<std::string>* errors) {
  if (!event->correlation_id().empty()) {
    if (event->trace_id().empty()) {
      event->set_trace_id(event->correlation_id());
    } else if (event->trace_id() != event->correlation_id()) {
      errors->push_back("conflict: traceId != correlationId");
    }
  }
  if (!event->causation_id().empty()) {
    if (event->parent_event_id().empty()) {
      event->set_parent_event_id(event->causation_id());
    } else if (event->parent_event_id() != event->causation_id()) {
      errors->push_back("conflict: parentEventId != causationId");
    }
  }

  if (event->event_id().empty()) errors->push_back("missing: eventId");
  if (event->trace_id().empty()) {
    if (options.origin) {
      event->set_trace_id(util::NewId("trc"));
    } else {
      errors->push_back("missing: traceId");
    }
  }
  if (event->type().empty()) {
    errors->push_back("missing: type");
  } else if (!model::IsDottedType(event->type())) {
    errors->push_back("invalid: type '" + event->type() + "' is not a dotted type");
  }
  if (event->stage() == STAGE_UNSPECIFIED) errors->push_back("missing: stage");
  if (event->source().empty()) errors->push_back("missing: source");
  if (event->timestamp_ms() <= 0) errors->push_back("missing: timestamp");
  if (!event->parent_event_id().empty() && event->parent_event_id() == event->event_id()) {
    errors->push_back("invalid: event is its own parent");
  }

  if (errors->empty() && event->span_id().empty()) {
    event->set_span_id(
        model::DeriveSpanId(event->trace_id(), event->stage(), event->source(), event->worker_id()));
    event->set_span_generated(true);
  }
}

bool IsSpinnerGlyph(unsigned char lead, unsigned char second) {
  // U+2800..U+28FF braille patterns, E2 A0..A3 xx
  return lead == 0xE2 && second >= 0xA0 && second <= 0xA3;
}

} // namespace

NormalizeResult Normalize(const Struct& raw, const NormalizeOptions& options) {
  NormalizeResult result;
  auto&           event = result.event;

  bool legacy_trace  = false;
  bool legacy_parent = false;

  event.set_event_id(ReadAliased(raw, "eventId", "", nullptr, &result.errors));
  event.set_trace_id(ReadAliased(raw, "traceId", "correlationId", &legacy_trace, &result.errors));
  event.set_parent_event_id(ReadAliased(raw, "parentEventId", "causationId", &legacy_parent, &result.errors));
  event.set_span_id(ReadAliased(raw, "spanId", "", nullptr, &result.errors));
  event.set_type(ReadAliased(raw, "type", "", nullptr, &result.errors));
  event.set_source(ReadAliased(raw, "source", "", nullptr, &result.errors));
  event.set_worker_id(ReadAliased(raw, "workerId", "paneId", nullptr, &result.errors));
  event.set_direction(ReadAliased(raw, "direction", "", nullptr, &result.errors));
  event.set_ack_of_event_id(ReadAliased(raw, "ackOfEventId", "", nullptr, &result.errors));
  event.set_retry_of_event_id(ReadAliased(raw, "retryOfEventId", "", nullptr, &result.errors));

  // legacy spellings stay on the event as mirrors
  if (auto correlation = model::StringField(raw, "correlationId")) event.set_correlation_id(*correlation);
  if (auto causation = model::StringField(raw, "causationId")) event.set_causation_id(*causation);

  if (auto stage_name = model::StringField(raw, "stage")) {
    if (auto stage = model::ParseStage(*stage_name)) {
      event.set_stage(*stage);
    } else {
      result.errors.push_back("invalid: stage '" + *stage_name + "'");
    }
  }

  if (auto status_name = model::StringField(raw, "status")) {
    if (auto status = model::ParseStatus(*status_name)) {
      event.set_status(*status);
    } else {
      result.errors.push_back("invalid: status '" + *status_name + "'");
    }
  } else {
    event.set_status(EVENT_STATUS_UNKNOWN);
  }

  if (auto ts = ReadNumber(raw, "timestamp", "ts")) {
    event.set_timestamp_ms(static_cast<int64_t>(std::llround(*ts)));
  }
  if (auto seq = ReadNumber(raw, "sequence", "seq")) {
    if (*seq < 0) {
      result.errors.push_back("invalid: sequence is negative");
    } else {
      event.set_sequence(static_cast<uint64_t>(std::llround(*seq)));
    }
  }

  if (const auto* payload = model::FindField(raw, "payload")) {
    if (payload->kind_case() == Value::kStructValue) {
      *event.mutable_payload() = payload->struct_value();
    } else if (payload->kind_case() != Value::kNullValue) {
      result.errors.push_back("invalid: payload must be an object");
    }
  }
  ReadEvidenceRefs(raw, &event);

  if (!result.errors.empty()) return result;

  // mirrors are already consistent; Validate re-checks and fills the rest
  Validate(&event, options, &result.errors);
  result.ok = result.errors.empty();
  return result;
}

NormalizeResult NormalizeJson(std::string_view json, const NormalizeOptions& options) {
  Struct raw;
  auto   status = google::protobuf::util::JsonStringToMessage(std::string(json), &raw);
  if (!status.ok()) {
    NormalizeResult result;
    result.errors.push_back("invalid: json: " + std::string(status.message()));
    return result;
  }
  return Normalize(raw, options);
}

NormalizeResult Normalize(Event event, const NormalizeOptions& options) {
  NormalizeResult result;
  Validate(&event, options, &result.errors);
  result.ok    = result.errors.empty();
  result.event = std::move(event);
  return result;
}

bool IsMeaningfulOutput(std::string_view data) {
  std::size_t i = 0;
  while (i < data.size()) {
    const auto c = static_cast<unsigned char>(data[i]);

    if (c == 0x1B) {
      // CSI: ESC [ params final(0x40..0x7E)
      if (i + 1 < data.size() && data[i + 1] == '[') {
        i += 2;
        while (i < data.size() && !(data[i] >= 0x40 && data[i] <= 0x7E)) ++i;
        ++i;
        continue;
      }
      // OSC: ESC ] ... terminated by BEL or ST
      if (i + 1 < data.size() && data[i + 1] == ']') {
        i += 2;
        while (i < data.size() && data[i] != '\x07' && !(data[i] == '\x1B' && i + 1 < data.size() && data[i + 1] == '\\')) {
          ++i;
        }
        i += (i < data.size() && data[i] == '\x1B') ? 2 : 1;
        continue;
      }
      i += 2;
      continue;
    }
    if (c < 0x20 || c == 0x7F || c == ' ') {
      ++i;
      continue;
    }
    if (c == '|' || c == '/' || c == '-' || c == '\\' || c == '.') {
      ++i;
      continue;
    }
    if (i + 2 < data.size() && IsSpinnerGlyph(c, static_cast<unsigned char>(data[i + 1]))) {
      i += 3;
      continue;
    }
    return true;
  }
  return false;
}

void ApplySampling(Event* event, const SamplingPolicy& policy) {
  if (policy.dev_mode) return;

  auto* fields = event->mutable_payload()->mutable_fields();

  if (model::ParseEventKind(event->type()) == model::EventKind::kOutputChunk) {
    Struct reduced;
    auto   data = model::StringField(event->payload(), "data");

    double byte_length = 0;
    bool   meaningful  = false;
    if (data) {
      byte_length = static_cast<double>(data->size());
      meaningful  = IsMeaningfulOutput(*data);
    } else {
      byte_length = model::NumberField(event->payload(), "byteLength").value_or(0);
      meaningful  = model::BoolField(event->payload(), "meaningful").value_or(false);
    }
    (*reduced.mutable_fields())["byteLength"].set_number_value(byte_length);
    (*reduced.mutable_fields())["meaningful"].set_bool_value(meaningful);
    *event->mutable_payload() = std::move(reduced);
    return;
  }

  for (const char* key : {"body", "message"}) {
    auto it = fields->find(key);
    if (it == fields->end() || it->second.kind_case() != Value::kStringValue) continue;

    const double length = static_cast<double>(it->second.string_value().size());
    Value        redacted;
    (*redacted.mutable_struct_value()->mutable_fields())["redacted"].set_bool_value(true);
    (*redacted.mutable_struct_value()->mutable_fields())["length"].set_number_value(length);
    it->second = std::move(redacted);
  }
}

Event BuildInvalidDiagnostic(const std::vector<std::string>& errors, std::string_view offending_event_id,
                             std::string_view offending_type, std::int64_t now_ms) {
  return model::EventBuilder(model::EventTypeName(model::EventKind::kEventInvalid), STAGE_SYSTEM, kNormalizerSource,
                             now_ms)
      .Status(EVENT_STATUS_FAILED)
      .Field("errors", errors)
      .Field("offendingEventId", offending_event_id)
      .Field("offendingType", offending_type)
      .Build();
}

} // namespace ledger::ingest
