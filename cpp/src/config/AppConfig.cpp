#include "tradestats/config/AppConfig.hpp"
#include "tradestats/util/JsonUtil.hpp"

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <limits>
#include <thread>

namespace tradestats::config {
namespace {

unsigned long long parseUnsigned(const std::string& name, const std::string& text,
                                 unsigned long long min, unsigned long long max) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigError(name + " must be a non-negative integer, got '" + text + "'");
    }
    unsigned long long value = 0;
    try {
        value = std::stoull(text);
    } catch (const std::exception&) {
        throw ConfigError(name + " is out of range: '" + text + "'");
    }
    if (value < min || value > max) {
        throw ConfigError(name + " must be between " + std::to_string(min) + " and " +
                          std::to_string(max) + ", got " + text);
    }
    return value;
}

util::LogLevel parseLevel(const std::string& name, const std::string& text) {
    auto level = util::parseLogLevel(text);
    if (!level) {
        throw ConfigError(name + " is not a log level: '" + text + "'");
    }
    return *level;
}

void applyConfigFile(AppConfig& config, const std::string& path) {
    boost::json::value json;
    try {
        json = util::readJsonFile(path);
    } catch (const std::exception& ex) {
        throw ConfigError("Failed to read config file " + path + ": " + ex.what());
    }
    if (!json.is_object()) {
        throw ConfigError("Config file " + path + " must contain a JSON object");
    }

    const auto& obj = json.as_object();
    try {
        if (auto it = obj.if_contains("host")) config.host = std::string(it->as_string());
        if (auto it = obj.if_contains("port")) {
            config.port = static_cast<std::uint16_t>(
                parseUnsigned("port", std::to_string(it->as_int64()), 1, 65535));
        }
        if (auto it = obj.if_contains("ioThreads")) {
            config.ioThreads = static_cast<unsigned int>(
                parseUnsigned("ioThreads", std::to_string(it->as_int64()), 1, 256));
        }
        if (auto it = obj.if_contains("logLevel")) {
            config.logLevel = parseLevel("logLevel", std::string(it->as_string()));
        }
        if (auto it = obj.if_contains("database")) {
            auto loaded = repository::loadConfig(it->as_object());
            if (!loaded.path.empty()) config.database.path = loaded.path;
            config.database.busyTimeoutMs = loaded.busyTimeoutMs;
        }
    } catch (const ConfigError&) {
        throw;
    } catch (const std::exception& ex) {
        throw ConfigError("Invalid config file " + path + ": " + ex.what());
    }
}

} // namespace

EnvironmentLookup processEnvironment() {
    return [](const char* name) -> std::optional<std::string> {
        if (const char* value = std::getenv(name)) {
            return std::string{value};
        }
        return std::nullopt;
    };
}

AppConfig loadAppConfig(const EnvironmentLookup& env) {
    AppConfig config;
    config.ioThreads = std::max(2u, std::thread::hardware_concurrency());
    {
        auto home = env("HOME");
        auto profile = env("USERPROFILE");
        config.database.path = repository::defaultDatabasePath(home ? home->c_str() : nullptr,
                                                               profile ? profile->c_str() : nullptr);
    }

    if (auto path = env("TRADESTATS_CONFIG"); path && !path->empty()) {
        applyConfigFile(config, *path);
    }

    if (auto value = env("TRADESTATS_HOST"); value && !value->empty()) config.host = *value;
    if (auto value = env("PORT"); value && !value->empty()) {
        config.port = static_cast<std::uint16_t>(parseUnsigned("PORT", *value, 1, 65535));
    }
    if (auto value = env("QUANTFRAME_DB_PATH"); value && !value->empty()) {
        config.database.path = *value;
    }
    if (auto value = env("TRADESTATS_DB_BUSY_TIMEOUT_MS")) {
        config.database.busyTimeoutMs = static_cast<int>(parseUnsigned(
            "TRADESTATS_DB_BUSY_TIMEOUT_MS", *value, 0, std::numeric_limits<int>::max()));
    }
    if (auto value = env("TRADESTATS_IO_THREADS")) {
        config.ioThreads = static_cast<unsigned int>(parseUnsigned("TRADESTATS_IO_THREADS", *value, 1, 256));
    }
    if (auto value = env("TRADESTATS_LOG_LEVEL")) {
        config.logLevel = parseLevel("TRADESTATS_LOG_LEVEL", *value);
    }

    return config;
}

} // namespace tradestats::config
