#pragma once

#include "tradestats/repository/DatabaseConfig.hpp"
#include "tradestats/util/Logging.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace tradestats::config {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct AppConfig {
    std::string host{"0.0.0.0"};
    std::uint16_t port{3000};
    unsigned int ioThreads{2};
    util::LogLevel logLevel{util::LogLevel::info};
    repository::DatabaseConfig database;
};

using EnvironmentLookup = std::function<std::optional<std::string>(const char*)>;

EnvironmentLookup processEnvironment();

// Defaults, then the JSON file named by TRADESTATS_CONFIG, then individual variables.
// Throws ConfigError on an unreadable file or a malformed value.
AppConfig loadAppConfig(const EnvironmentLookup& env);

} // namespace tradestats::config
