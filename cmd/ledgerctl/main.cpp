#include <grpcpp/grpcpp.h>

#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "client/cpp/ledger_client.h"
#include "internal/bridge/bridge_sender.hpp"
#include "internal/ingest/normalizer.hpp"
#include "internal/model/taxonomy.hpp"

using namespace ledger::kernel::v1;
using namespace ledger::kernel::services::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  ledgerctl <addr> trace <trace_id> [limit]\n"
            << "  ledgerctl <addr> events [stage=<name>] [type=<t>] [worker=<id>] [trace=<id>] [since=<ms>] [until=<ms>] "
               "[limit=<n>] [desc]\n"
            << "  ledgerctl <addr> failure <trace_id>\n"
            << "  ledgerctl <addr> failure-worker <worker_id>\n"
            << "  ledgerctl <addr> journey <trace_id>\n"
            << "  ledgerctl <addr> status\n"
            << "  ledgerctl <addr> diagnostics\n"
            << "  ledgerctl <addr> publish '<event json>' [peer_id]\n";
}

static void PrintJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(message, &out, options);
  if (!status.ok()) {
    std::cerr << "json encode failed: " << status.ToString() << "\n";
    return;
  }
  std::cout << out;
}

static int Fail(const ::grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

static std::optional<uint64_t> ParseU64(const std::string& value) {
  try {
    return std::stoull(value);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static bool ApplyFilterArg(const std::string& arg, EventFilter* filter) {
  if (arg == "desc") {
    filter->set_descending(true);
    return true;
  }
  const auto eq = arg.find('=');
  if (eq == std::string::npos) return false;
  const std::string key   = arg.substr(0, eq);
  const std::string value = arg.substr(eq + 1);

  if (key == "stage") {
    auto stage = ledger::model::ParseStage(value);
    if (!stage) return false;
    filter->set_stage(*stage);
    return true;
  }
  if (key == "type") {
    filter->set_type(value);
    return true;
  }
  if (key == "worker") {
    filter->set_worker_id(value);
    return true;
  }
  if (key == "trace") {
    filter->set_trace_id(value);
    return true;
  }
  auto number = ParseU64(value);
  if (!number) return false;
  if (key == "since") {
    filter->set_since_ms(static_cast<int64_t>(*number));
    return true;
  }
  if (key == "until") {
    filter->set_until_ms(static_cast<int64_t>(*number));
    return true;
  }
  if (key == "limit") {
    filter->set_limit(static_cast<uint32_t>(*number));
    return true;
  }
  return false;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = ::grpc::CreateChannel(addr, ::grpc::InsecureChannelCredentials());

  ledger::client::LedgerClient client(channel);

  // ------------------------------------------------------------

  if (cmd == "trace") {
    if (argc < 4) return 1;

    QueryTraceRequest req;
    req.set_trace_id(argv[3]);
    if (argc >= 5) {
      auto limit = ParseU64(argv[4]);
      if (!limit) {
        std::cerr << "invalid limit: " << argv[4] << "\n";
        return 1;
      }
      req.set_limit(static_cast<uint32_t>(*limit));
    }

    TraceReconstruction resp;
    auto                status = client.QueryTrace(req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "events") {
    EventFilter req;
    for (int i = 3; i < argc; ++i) {
      if (!ApplyFilterArg(argv[i], &req)) {
        std::cerr << "invalid filter: " << argv[i] << "\n";
        return 1;
      }
    }

    EventList resp;
    auto      status = client.QueryEvents(req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "failure" || cmd == "failure-worker") {
    if (argc < 4) return 1;

    FailureQuery req;
    if (cmd == "failure") {
      req.set_trace_id(argv[3]);
    } else {
      req.set_worker_id(argv[3]);
    }

    FailurePath resp;
    auto        status = client.QueryFailurePath(req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "journey") {
    if (argc < 4) return 1;

    QueryJourneyRequest req;
    req.set_trace_id(argv[3]);

    Journey resp;
    auto    status = client.QueryJourney(req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    StoreStatus resp;
    auto        status = client.Status(&resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "diagnostics") {
    BridgeDiagnostics resp;
    auto              status = client.Diagnostics(&resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "publish") {
    if (argc < 4) return 1;

    auto normalized = ledger::ingest::NormalizeJson(argv[3], {.origin = true});
    if (!normalized.ok) {
      for (const auto& error : normalized.errors) std::cerr << "invalid event: " << error << "\n";
      return 1;
    }

    ledger::bridge::SenderOptions options;
    options.peer_id   = argc >= 5 ? argv[4] : "ledgerctl";
    options.direction = "peer->kernel";

    auto transport = std::make_shared<ledger::client::GrpcBridgeTransport>(channel);
    ledger::bridge::BridgeSender sender(transport, options);

    const std::string event_id = normalized.event.event_id();
    const std::string trace_id = normalized.event.trace_id();
    sender.Enqueue(std::move(normalized.event));
    if (sender.Flush() == 0) {
      const auto& error = transport->last_error();
      std::cerr << "publish failed: " << (error.empty() ? "daemon unreachable" : error) << "\n";
      return 2;
    }

    std::cout << "event_id=" << event_id << "\n"
              << "trace_id=" << trace_id << "\n";
    return 0;
  }

  Usage();
  return 1;
}
