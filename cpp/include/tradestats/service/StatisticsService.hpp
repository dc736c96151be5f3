#pragma once

#include "tradestats/model/GroupStatistics.hpp"
#include "tradestats/model/Transaction.hpp"
#include "tradestats/repository/TransactionSource.hpp"

#include <string>
#include <vector>

namespace tradestats::service {

inline constexpr const char* kUnknownActor = "Unknown";
inline constexpr const char* kUnknownSubject = "Unknown";

std::string actorKey(const model::Transaction& tx);
std::string subjectKey(const model::Transaction& tx);
bool isRiven(const model::Transaction& tx);

class StatisticsService {
public:
    explicit StatisticsService(repository::TransactionSource& transactions);

    // Every transaction grouped by in-game name.
    std::vector<model::GroupStatistics> userStatistics();

    // Riven transactions grouped by item name.
    std::vector<model::GroupStatistics> rivenStatistics();

private:
    repository::TransactionSource& transactions_;
};

} // namespace tradestats::service
