#pragma once

#include "tradestats/model/GroupStatistics.hpp"
#include "tradestats/server/Router.hpp"
#include "tradestats/service/StatisticsService.hpp"

#include <boost/json.hpp>

#include <string>
#include <vector>

namespace tradestats::controller {

// Serializes statistics with the grouping key stored under keyField.
boost::json::array toJson(const std::vector<model::GroupStatistics>& stats, const std::string& keyField);

class StatisticsController {
public:
    explicit StatisticsController(service::StatisticsService& statisticsService);

    void registerRoutes(tradestats::server::Router& router);

private:
    void handleUsers(tradestats::server::RequestContext& ctx);
    void handleRivens(tradestats::server::RequestContext& ctx);

    service::StatisticsService& statisticsService_;
};

} // namespace tradestats::controller
