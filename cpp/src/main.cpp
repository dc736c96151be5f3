#include "tradestats/config/AppConfig.hpp"
#include "tradestats/controller/StatisticsController.hpp"
#include "tradestats/repository/SqliteConnection.hpp"
#include "tradestats/repository/TransactionsRepository.hpp"
#include "tradestats/server/HttpServer.hpp"
#include "tradestats/server/Router.hpp"
#include "tradestats/service/StatisticsService.hpp"
#include "tradestats/util/Logging.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/system/system_error.hpp>

#include <csignal>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

int main(int /*argc*/, char** /*argv*/) {
    using namespace tradestats;
    util::initLogging(util::LogLevel::info);

    config::AppConfig appConfig;
    try {
        appConfig = config::loadAppConfig(config::processEnvironment());
    } catch (const config::ConfigError& ex) {
        util::log(util::LogLevel::error, std::string{"Invalid configuration: "} + ex.what());
        return 1;
    }
    util::initLogging(appConfig.logLevel);

    std::optional<repository::SqliteConnection> connection;
    try {
        connection.emplace(appConfig.database);
    } catch (const repository::DatabaseError& ex) {
        util::log(util::LogLevel::error, std::string{"Failed to open database: "} + ex.what());
        return 1;
    }
    util::log(util::LogLevel::info, "Connected to QuantFrame database at " + connection->path());

    repository::TransactionsRepository transactions{*connection};
    service::StatisticsService statisticsService{transactions};

    auto router = std::make_shared<server::Router>();
    controller::StatisticsController statisticsController{statisticsService};
    statisticsController.registerRoutes(*router);

    boost::asio::io_context io;
    auto server = std::make_shared<server::HttpServer>(io, router, appConfig.host, appConfig.port);
    try {
        server->start();
    } catch (const boost::system::system_error& ex) {
        util::log(util::LogLevel::error,
                  "Cannot listen on " + appConfig.host + ":" + std::to_string(appConfig.port) + ": " + ex.what());
        return 1;
    }

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&io, server](const boost::system::error_code& ec, int signal) {
        if (ec) {
            return;
        }
        util::log(util::LogLevel::info, "Received signal " + std::to_string(signal) + ", shutting down");
        server->stop();
        io.stop();
    });

    std::vector<std::thread> ioThreads;
    if (appConfig.ioThreads > 1) {
        ioThreads.reserve(appConfig.ioThreads - 1);
        for (unsigned int i = 0; i < appConfig.ioThreads - 1; ++i) {
            ioThreads.emplace_back([&io]() { io.run(); });
        }
    }

    util::log(util::LogLevel::info,
              "Analytics server listening on http://" + appConfig.host + ":" + std::to_string(server->port()));
    io.run();

    for (auto& thread : ioThreads) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    return 0;
}
