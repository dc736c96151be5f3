#pragma once

#include <boost/json.hpp>
#include <string>

namespace tradestats::repository {

struct DatabaseConfig {
    std::string path;
    int busyTimeoutMs{5000};
};

// Missing keys keep their default value. Throws std::invalid_argument on a mistyped key.
DatabaseConfig loadConfig(const boost::json::object& json);

std::string defaultDatabasePath(const char* home, const char* userProfile);

} // namespace tradestats::repository
