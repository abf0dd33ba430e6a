#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "client/cpp/ledger_client.h"
#include "internal/bridge/bridge_sender.hpp"
#include "internal/model/event_builder.hpp"
#include "internal/util/time.hpp"

using namespace ledger::kernel::v1;
using namespace ledger::kernel::services::v1;

int main(int argc, char** argv) {
  // Allow overriding the service endpoint for remote or containerized runs.
  const std::string target = argc > 1 ? argv[1] : "localhost:50061";

  auto                         channel = ::grpc::CreateChannel(target, ::grpc::InsecureChannelCredentials());
  ledger::client::LedgerClient client(channel);

  ledger::bridge::SenderOptions options;
  options.peer_id   = "example-peer";
  options.direction = "peer->kernel";
  ledger::bridge::BridgeSender sender(std::make_shared<ledger::client::GrpcBridgeTransport>(channel), options);

  // A request, its transport hop and the verification, all in one trace.
  const int64_t now       = ledger::util::NowMs();
  auto          requested = ledger::model::EventBuilder("inject.requested", STAGE_INGRESS, "example", now)
                       .Worker("worker-1")
                       .Field("text", "echo hello")
                       .Build();
  auto sent = ledger::model::EventBuilder("inject.submit.sent", STAGE_TRANSPORT, "example", now + 5)
                  .Parent(requested)
                  .Worker("worker-1")
                  .Build();
  auto verified = ledger::model::EventBuilder("inject.verified", STAGE_VERIFY, "example", now + 40)
                      .Parent(sent)
                      .Worker("worker-1")
                      .Status(EVENT_STATUS_OK)
                      .Build();

  const std::string trace_id = requested.trace_id();
  sender.Enqueue(requested);
  sender.Enqueue(sent);
  sender.Enqueue(verified);
  if (sender.Flush() != 3) {
    std::cerr << "Flush did not deliver every envelope\n";
    return 1;
  }

  // Ingest is asynchronous; give the daemon a moment to persist.
  std::this_thread::sleep_for(std::chrono::milliseconds(200));

  QueryTraceRequest trace_request;
  trace_request.set_trace_id(trace_id);
  TraceReconstruction trace;
  auto                status = client.QueryTrace(trace_request, &trace);
  if (!status.ok()) {
    std::cerr << "QueryTrace failed: " << status.error_message() << '\n';
    return 1;
  }

  std::cout << "trace " << trace_id << " has " << trace.events_size() << " events\n";
  for (const auto& event : trace.events()) {
    std::cout << "  " << event.timestamp_ms() << ' ' << event.type() << '\n';
  }

  QueryJourneyRequest journey_request;
  journey_request.set_trace_id(trace_id);
  Journey journey;
  status = client.QueryJourney(journey_request, &journey);
  if (!status.ok()) {
    std::cerr << "QueryJourney failed: " << status.error_message() << '\n';
    return 1;
  }

  for (const auto& step : journey.steps()) {
    std::cout << "  " << step.name() << " mark=" << JourneyMark_Name(step.mark()) << '\n';
  }
  return 0;
}
