#include "query_service.hpp"

#include <chrono>
#include <string_view>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/query/trace_query.hpp"
#include "internal/store/event_store.hpp"
#include "internal/util/errors.hpp"

namespace ledger::service {

using namespace ledger::kernel::v1;
using namespace ledger::kernel::services::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view trace_id, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    LEDGER_LOG_DEBUG("RPC served",
                     {observability::StringField("route", route),
                      observability::IntField("latency_ms", std::chrono::duration_cast<std::chrono::milliseconds>(
                                                                std::chrono::steady_clock::now() - started_at)
                                                                .count())});
    return result;
  } catch (const std::exception& ex) {
    LEDGER_LOG_ERROR("RPC failed", {observability::StringField("route", route),
                                    observability::StringField("error", ex.what()),
                                    observability::StringField("trace_id", trace_id)});
    throw;
  }
}

} // namespace

QueryService::QueryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

TraceReconstruction QueryService::QueryTrace(const QueryTraceRequest& req) {
  return ObserveRpc("QueryTrace", req.trace_id(), [&] {
    if (req.trace_id().empty()) throw util::InvalidArgument("trace_id is required");
    return ctx_.queries->QueryTrace(req.trace_id(), req.limit());
  });
}

EventList QueryService::QueryEvents(const EventFilter& req) {
  return ObserveRpc("QueryEvents", req.trace_id(), [&] { return ctx_.queries->QueryEvents(req); });
}

FailurePath QueryService::QueryFailurePath(const FailureQuery& req) {
  return ObserveRpc("QueryFailurePath", req.trace_id(), [&] { return ctx_.queries->QueryFailurePath(req); });
}

Journey QueryService::QueryJourney(const QueryJourneyRequest& req) {
  return ObserveRpc("QueryJourney", req.trace_id(), [&] {
    if (req.trace_id().empty()) throw util::InvalidArgument("trace_id is required");
    return ctx_.queries->QueryJourney(req.trace_id());
  });
}

StoreStatus QueryService::Status() {
  return ObserveRpc("Status", "", [&] { return ctx_.store->Status(); });
}

}
