#include "factory.hpp"

#include <memory>

#include "internal/config/runtime_defaults.hpp"
#include "internal/kernel/kernel.hpp"
#include "internal/observability/logging.hpp"
#include "internal/query/trace_query.hpp"
#include "internal/runtime/maintenance_worker.hpp"
#include "internal/service/bridge_service.hpp"
#include "internal/service/query_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/store/event_store.hpp"

namespace ledger::factory {

using namespace ledger;

namespace {

store::StoreOptions StoreOptionsFrom(const ledger::runtime::config::RuntimeConfig& config) {
  const auto& cfg = config.store();

  store::StoreOptions options;
  options.durable         = !cfg.has_enabled() || cfg.enabled();
  options.sqlite_path     = cfg.sqlite().path();
  options.busy_timeout_ms = static_cast<int>(cfg.busy_timeout_ms());
  options.retention_ms    = static_cast<int64_t>(cfg.retention_ms());
  options.max_rows        = cfg.max_rows();
  options.span_timeout_ms = static_cast<int64_t>(cfg.span_timeout_ms());
  return options;
}

kernel::KernelOptions KernelOptionsFrom(const ledger::runtime::config::RuntimeConfig& config) {
  kernel::KernelOptions options;
  options.ingest_capacity        = config.ingest().queue_capacity();
  options.sampling.dev_mode      = config.sampling().dev_mode();
  options.contracts.defer_ttl_ms = static_cast<int64_t>(config.contracts().defer_ttl_ms());
  return options;
}

} // namespace

void Application::Shutdown() {
  if (maintenance) maintenance->Stop();
  if (kernel) kernel->Stop();
}

/*
    Build full application dependency graph
*/
Application Build(const ledger::runtime::config::RuntimeConfig& input, util::MillisClock clock) {
  Application app;

  auto config = input;
  ledger::config::ApplyDefaults(&config);

  // ------------------------------------------------------------------
  // Ledger store (sqlite, or memory when disabled or unavailable)
  // ------------------------------------------------------------------
  app.store   = store::EventStore::Open(StoreOptionsFrom(config), clock);
  app.queries = std::make_shared<query::TraceQueryEngine>(app.store);

  // ------------------------------------------------------------------
  // Kernel: ingest queue, contracts, detector, bridge receiver
  // ------------------------------------------------------------------
  app.kernel = std::make_shared<kernel::Kernel>(app.store, KernelOptionsFrom(config), clock);
  app.kernel->Start();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.store   = app.store;
  ctx.queries = app.queries;
  ctx.kernel  = app.kernel;

  app.query_service  = std::make_shared<service::QueryService>(ctx);
  app.bridge_service = std::make_shared<service::BridgeService>(ctx);

  // ------------------------------------------------------------------
  // Maintenance: timers, retention, span sweep
  // ------------------------------------------------------------------
  runtime::MaintenanceOptions maintenance;
  maintenance.prune_interval_ms = static_cast<int64_t>(config.store().prune_interval_ms());
  app.maintenance = std::make_shared<runtime::MaintenanceWorker>(app.kernel, app.store, maintenance);
  app.maintenance->Start();

  auto status = app.store->Status();
  LEDGER_LOG_INFO("ledger ready", {observability::BoolField("durable", status.durable()),
                                   observability::StringField("degraded_reason", status.degraded_reason()),
                                   observability::IntField("rows", static_cast<int64_t>(status.row_count()))});
  return app;
}

} // namespace ledger::factory
