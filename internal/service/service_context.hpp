#pragma once

#include <memory>

namespace ledger::kernel { class Kernel; }
namespace ledger::query { class TraceQueryEngine; }
namespace ledger::store { class EventStore; }

namespace ledger::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<ledger::store::EventStore> store;
  std::shared_ptr<ledger::query::TraceQueryEngine> queries;
  std::shared_ptr<ledger::kernel::Kernel> kernel;
};

}
