#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/util/time.hpp"

namespace ledger::kernel { class Kernel; }
namespace ledger::query { class TraceQueryEngine; }
namespace ledger::runtime { class MaintenanceWorker; }
namespace ledger::service {
class BridgeService;
class QueryService;
}
namespace ledger::store { class EventStore; }

namespace ledger::factory {

/*
  Application

  Owns all long-lived components used by the daemon.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<store::EventStore>       store;
  std::shared_ptr<query::TraceQueryEngine> queries;
  std::shared_ptr<kernel::Kernel>          kernel;

  std::shared_ptr<service::QueryService>  query_service;
  std::shared_ptr<service::BridgeService> bridge_service;

  std::shared_ptr<runtime::MaintenanceWorker> maintenance;

  // stops background workers and drains the ingest queue into the store
  void Shutdown();
};

/*
  Build

  Constructs the entire backend from runtime config and starts its
  background workers.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete storage types.
*/
Application Build(const ledger::runtime::config::RuntimeConfig& config,
                  util::MillisClock clock = util::SystemMillisClock());

} // namespace ledger::factory
