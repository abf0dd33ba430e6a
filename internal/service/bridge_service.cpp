#include "bridge_service.hpp"

#include <utility>

#include "internal/kernel/kernel.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ledger::service {

using namespace ledger::kernel::v1;
using namespace ledger::kernel::services::v1;

BridgeService::BridgeService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

PublishResponse BridgeService::Publish(const BridgeEnvelope& req) {
  if (!ctx_.kernel) throw util::Unavailable("kernel is not running");
  auto result = ctx_.kernel->ReceiveEnvelope(req);

  PublishResponse resp;
  resp.set_accepted(result.accepted);
  resp.set_reason(result.reason);

  const int64_t now_ms = ctx_.store ? ctx_.store->NowMs() : 0;
  if (result.accepted) {
    ++accepted_;
    last_accepted_ms_ = now_ms;
    last_seq_         = req.bridge_seq();
  } else {
    ++rejected_;
    last_rejected_ms_ = now_ms;
    LEDGER_LOG_DEBUG("bridge envelope rejected", {observability::StringField("peer_id", req.peer_id()),
                                                  observability::StringField("reason", result.reason)});
  }
  return resp;
}

void BridgeService::PeerClosed(const std::string& peer_id, std::string_view reason) {
  if (!ctx_.kernel) return;
  ctx_.kernel->BridgeDisconnected(peer_id, reason);
}

BridgeDiagnostics BridgeService::Diagnostics() const {
  if (!ctx_.kernel) throw util::Unavailable("kernel is not running");
  BridgeDiagnostics d;
  d.set_forwarded_count(accepted_.load());
  d.set_dropped_count(rejected_.load() + ctx_.kernel->Queue()->DroppedCount());
  d.set_queue_depth(ctx_.kernel->Queue()->Depth());
  d.set_last_bridge_seq(last_seq_.load());
  d.set_last_forwarded_ms(last_accepted_ms_.load());
  d.set_last_dropped_ms(last_rejected_ms_.load());
  return d;
}

}
