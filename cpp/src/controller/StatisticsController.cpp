#include "tradestats/controller/StatisticsController.hpp"
#include "tradestats/util/JsonResponse.hpp"
#include "tradestats/util/Logging.hpp"

#include <boost/beast/http.hpp>

#include <cmath>
#include <cstdint>
#include <exception>
#include <string>

namespace tradestats::controller {
namespace {

// Integral amounts are written as JSON integers, the rest as doubles.
boost::json::value numberValue(double value) {
    if (std::isfinite(value) && std::trunc(value) == value && std::fabs(value) < 9.0e15) {
        return static_cast<std::int64_t>(value);
    }
    return value;
}

template <typename Compute>
void respondWithStatistics(tradestats::server::RequestContext& ctx,
                           const std::string& keyField,
                           Compute&& compute) {
    try {
        util::sendJson(ctx, toJson(compute(), keyField));
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error,
                  "Computing " + keyField + " statistics failed: " + ex.what());
        util::sendError(ctx, boost::beast::http::status::internal_server_error, ex.what());
    }
}

} // namespace

boost::json::array toJson(const std::vector<model::GroupStatistics>& stats, const std::string& keyField) {
    boost::json::array payload;
    payload.reserve(stats.size());
    for (const auto& entry : stats) {
        boost::json::object item;
        item[keyField] = entry.key;
        item["profit"] = numberValue(entry.profit);
        item["revenue"] = numberValue(entry.revenue);
        item["expense"] = numberValue(entry.expense);
        item["number_of_trades"] = entry.numberOfTrades;
        item["purchases"] = entry.purchases;
        item["sales"] = entry.sales;
        item["profit_margin"] = numberValue(entry.profitMargin);
        payload.emplace_back(std::move(item));
    }
    return payload;
}

StatisticsController::StatisticsController(service::StatisticsService& statisticsService)
    : statisticsService_(statisticsService) {}

void StatisticsController::registerRoutes(tradestats::server::Router& router) {
    router.addRoute("GET", "/stats/users", [this](auto& ctx) { handleUsers(ctx); });
    router.addRoute("GET", "/stats/rivens", [this](auto& ctx) { handleRivens(ctx); });
}

void StatisticsController::handleUsers(tradestats::server::RequestContext& ctx) {
    respondWithStatistics(ctx, "user", [this]() { return statisticsService_.userStatistics(); });
}

void StatisticsController::handleRivens(tradestats::server::RequestContext& ctx) {
    respondWithStatistics(ctx, "riven", [this]() { return statisticsService_.rivenStatistics(); });
}

} // namespace tradestats::controller
