#include "grpc_services.hpp"

#include "bridge_server.hpp"
#include "query_server.hpp"

namespace ledger::grpc {

std::vector<std::unique_ptr<::grpc::Service>> BuildServices(const ledger::factory::Application& app) {
  std::vector<std::unique_ptr<::grpc::Service>> services;
  services.push_back(std::make_unique<QueryServer>(app.query_service));
  services.push_back(std::make_unique<BridgeServer>(app.bridge_service));
  return services;
}

} // namespace ledger::grpc
