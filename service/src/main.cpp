#include <memory>
#include <grpcpp/grpcpp.h>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/health_check_service_interface.h>

#include "chipledger/config.hpp"
#include "chipledger/logging.hpp"
#include "chipledger/settlement_coordinator.hpp"
#include "chipledger/settlement_store.hpp"
#include "settlement_service.hpp"

int main() {
    auto config = chipledger::ServiceConfig::from_env();
    std::string server_address = config.server_address();

    grpc::EnableDefaultHealthCheckService(true);
    if (config.reflection) {
        grpc::reflection::InitProtoReflectionServerBuilderPlugin();
    }

    auto store = std::make_shared<chipledger::InMemorySettlementStore>();
    auto coordinator = std::make_shared<chipledger::SettlementCoordinator>(store, config.settle_wait);
    chipledger::SettlementServiceImpl service(coordinator);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        chipledger::log_error("settlement-service", "server_start_failed",
            {{"address", server_address}});
        return 1;
    }

    chipledger::log_info("settlement-service", "server_started",
        {{"address", server_address},
         {"settle_wait_ms", config.settle_wait.count()},
         {"reflection", config.reflection}});

    server->Wait();
    return 0;
}
