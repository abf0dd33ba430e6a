#pragma once

#include <cstdint>

#include "config/config.pb.h"

namespace ledger::config {

inline constexpr const char* kDefaultBindAddress = "0.0.0.0:50061";
inline constexpr const char* kDefaultSqlitePath  = "ledger.db";
inline constexpr const char* kDefaultLogLevel    = "info";
inline constexpr const char* kDefaultLogSink     = "stderr";

inline constexpr std::uint64_t kDefaultRetentionMs     = 7ull * 24 * 60 * 60 * 1000;
inline constexpr std::uint64_t kDefaultMaxRows         = 2'000'000;
inline constexpr std::uint64_t kDefaultPruneIntervalMs = 60'000;
inline constexpr std::uint64_t kDefaultBusyTimeoutMs   = 5'000;
inline constexpr std::uint64_t kDefaultSpanTimeoutMs   = 60'000;
inline constexpr std::uint64_t kDefaultIngestCapacity  = 10'000;
inline constexpr std::uint64_t kDefaultDeferTtlMs      = 30'000;

// Fills every unset field with its default. Explicit values are kept.
void ApplyDefaults(ledger::runtime::config::RuntimeConfig* config);

} // namespace ledger::config
