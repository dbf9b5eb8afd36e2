#pragma once

#include <chrono>
#include <string>

namespace chipledger {

constexpr int DEFAULT_PORT = 50601;
constexpr int DEFAULT_SETTLE_WAIT_MS = 5000;
constexpr long MAX_SETTLE_WAIT_MS = 10L * 60 * 1000;

/**
 * Service configuration.
 *
 * Production deployments configure the service through environment
 * variables so the same binary runs unchanged in every environment:
 *
 *   PORT                       gRPC listening port
 *   CHIPLEDGER_SETTLE_WAIT_MS  how long a concurrent Settle waits for an
 *                              in-progress computation (at most ten minutes)
 *   CHIPLEDGER_REFLECTION      "false" or "0" disables server reflection
 */
struct ServiceConfig {
    int port = DEFAULT_PORT;
    std::chrono::milliseconds settle_wait{DEFAULT_SETTLE_WAIT_MS};
    bool reflection = true;

    std::string server_address() const { return "0.0.0.0:" + std::to_string(port); }

    /**
     * Read configuration from the environment. Unparseable values keep
     * their defaults and are reported with a warning log.
     */
    static ServiceConfig from_env();
};

} // namespace chipledger
