#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "internal/factory.hpp"

namespace ledger::grpc {

// gRPC adapters over the application's services, for runtime::Server
std::vector<std::unique_ptr<::grpc::Service>> BuildServices(const ledger::factory::Application& app);

} // namespace ledger::grpc
