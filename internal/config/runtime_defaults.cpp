#include "runtime_defaults.hpp"

namespace ledger::config {

void ApplyDefaults(ledger::runtime::config::RuntimeConfig* config) {
  if (config->server().bind_address().empty()) {
    config->mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  auto* logging = config->mutable_logging();
  if (logging->level().empty()) logging->set_level(kDefaultLogLevel);
  if (logging->sink().empty()) logging->set_sink(kDefaultLogSink);

  auto* store = config->mutable_store();
  if (!store->has_enabled()) {
    store->set_enabled(true);
  }
  if (store->sqlite().path().empty()) {
    store->mutable_sqlite()->set_path(kDefaultSqlitePath);
  }
  if (store->retention_ms() == 0) store->set_retention_ms(kDefaultRetentionMs);
  if (store->max_rows() == 0) store->set_max_rows(kDefaultMaxRows);
  if (store->prune_interval_ms() == 0) store->set_prune_interval_ms(kDefaultPruneIntervalMs);
  if (store->busy_timeout_ms() == 0) store->set_busy_timeout_ms(kDefaultBusyTimeoutMs);
  if (store->span_timeout_ms() == 0) store->set_span_timeout_ms(kDefaultSpanTimeoutMs);

  if (config->ingest().queue_capacity() == 0) {
    config->mutable_ingest()->set_queue_capacity(kDefaultIngestCapacity);
  }
  if (config->contracts().defer_ttl_ms() == 0) {
    config->mutable_contracts()->set_defer_ttl_ms(kDefaultDeferTtlMs);
  }
}

} // namespace ledger::config
