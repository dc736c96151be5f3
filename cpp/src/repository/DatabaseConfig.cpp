#include "tradestats/repository/DatabaseConfig.hpp"

#include <stdexcept>

namespace tradestats::repository {

DatabaseConfig loadConfig(const boost::json::object& json) {
    DatabaseConfig cfg;
    if (auto it = json.if_contains("path")) {
        if (!it->is_string()) throw std::invalid_argument("database.path must be a string");
        cfg.path = std::string(it->as_string());
    }
    if (auto it = json.if_contains("busyTimeoutMs")) {
        if (!it->is_int64() || it->as_int64() < 0) {
            throw std::invalid_argument("database.busyTimeoutMs must be a non-negative integer");
        }
        cfg.busyTimeoutMs = static_cast<int>(it->as_int64());
    }
    return cfg;
}

std::string defaultDatabasePath(const char* home, const char* userProfile) {
    std::string base;
    if (home && *home) {
        base = home;
    } else if (userProfile && *userProfile) {
        base = userProfile;
    }
    return base + "/AppData/Local/dev.kenya.quantframe/quantframeV2.sqlite";
}

} // namespace tradestats::repository
