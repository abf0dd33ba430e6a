#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "ledger/kernel/v1/event.pb.h"

namespace ledger::ingest {

/*
  Envelope normalizer.

  Turns producer records (loosely typed Struct/JSON, possibly with legacy
  field names) or partially filled Events into canonical Events. Never
  throws: failures come back as a list of errors so the caller can append
  an event.invalid diagnostic instead.
*/

struct NormalizeOptions {
  // true at first contact with an external request; only origins may mint a trace id
  bool origin{false};
};

struct NormalizeResult {
  bool                     ok{false};
  ledger::kernel::v1::Event event;
  std::vector<std::string> errors;
};

struct SamplingPolicy {
  bool dev_mode{false};
};

NormalizeResult Normalize(const google::protobuf::Struct& raw, const NormalizeOptions& options = {});
NormalizeResult NormalizeJson(std::string_view json, const NormalizeOptions& options = {});
NormalizeResult Normalize(ledger::kernel::v1::Event event, const NormalizeOptions& options = {});

// Reduces raw output chunks to metadata and redacts message bodies unless dev_mode.
void ApplySampling(ledger::kernel::v1::Event* event, const SamplingPolicy& policy);

// false for output that is only escape sequences, whitespace or spinner glyphs
bool IsMeaningfulOutput(std::string_view data);

// event.invalid diagnostic in a fresh trace; offending_event_id may be empty
ledger::kernel::v1::Event BuildInvalidDiagnostic(const std::vector<std::string>& errors,
                                                 std::string_view offending_event_id, std::string_view offending_type,
                                                 std::int64_t now_ms);

} // namespace ledger::ingest
