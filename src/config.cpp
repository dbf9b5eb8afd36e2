#include "chipledger/config.hpp"
#include "chipledger/logging.hpp"
#include <cerrno>
#include <cstdlib>
#include <optional>

namespace chipledger {

namespace {

std::optional<long> read_positive(const char* name) {
    const char* raw = std::getenv(name);
    if (!raw || *raw == '\0') {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(raw, &end, 10);
    if (errno == ERANGE || *end != '\0' || value <= 0) {
        log_warn("config", "ignoring_invalid_value", {{"variable", name}, {"value", raw}});
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

ServiceConfig ServiceConfig::from_env() {
    ServiceConfig config;

    if (auto port = read_positive("PORT")) {
        if (*port <= 65535) {
            config.port = static_cast<int>(*port);
        } else {
            log_warn("config", "ignoring_invalid_value", {{"variable", "PORT"}, {"value", *port}});
        }
    }
    if (auto wait_ms = read_positive("CHIPLEDGER_SETTLE_WAIT_MS")) {
        if (*wait_ms <= MAX_SETTLE_WAIT_MS) {
            config.settle_wait = std::chrono::milliseconds(*wait_ms);
        } else {
            log_warn("config", "ignoring_invalid_value",
                     {{"variable", "CHIPLEDGER_SETTLE_WAIT_MS"}, {"value", *wait_ms}});
        }
    }

    const char* reflection = std::getenv("CHIPLEDGER_REFLECTION");
    if (reflection) {
        std::string value(reflection);
        config.reflection = !(value == "false" || value == "0");
    }

    return config;
}

} // namespace chipledger
