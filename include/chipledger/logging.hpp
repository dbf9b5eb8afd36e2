#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

namespace chipledger {

inline std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time_t, &utc);
    std::stringstream ss;
    ss << std::put_time(&utc, "%FT%TZ");
    return ss.str();
}

namespace detail {

inline std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

inline void write_log(const char* level, const std::string& domain,
                      const std::string& message, const nlohmann::json& fields) {
    nlohmann::json log_entry = {
        {"level", level},
        {"message", message},
        {"domain", domain},
        {"timestamp", now_iso8601()}
    };
    for (auto& [key, value] : fields.items()) {
        log_entry[key] = value;
    }
    auto line = log_entry.dump();
    std::lock_guard<std::mutex> lock(log_mutex());
    std::cout << line << std::endl;
}

}  // namespace detail

inline void log_info(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    detail::write_log("info", domain, message, fields);
}

inline void log_warn(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    detail::write_log("warn", domain, message, fields);
}

inline void log_error(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    detail::write_log("error", domain, message, fields);
}

}  // namespace chipledger
