#include "tradestats/service/StatisticsService.hpp"
#include "tradestats/service/Aggregator.hpp"

namespace tradestats::service {

std::string actorKey(const model::Transaction& tx) {
    if (!tx.ingameName || tx.ingameName->empty()) {
        return kUnknownActor;
    }
    return *tx.ingameName;
}

std::string subjectKey(const model::Transaction& tx) {
    if (tx.itemName.empty()) {
        return kUnknownSubject;
    }
    return tx.itemName;
}

bool isRiven(const model::Transaction& tx) {
    return tx.itemType == model::kRivenItemType;
}

StatisticsService::StatisticsService(repository::TransactionSource& transactions)
    : transactions_(transactions) {}

std::vector<model::GroupStatistics> StatisticsService::userStatistics() {
    return aggregate(transactions_.fetchAll(), actorKey);
}

std::vector<model::GroupStatistics> StatisticsService::rivenStatistics() {
    return aggregate(transactions_.fetchAll(), subjectKey, isRiven);
}

} // namespace tradestats::service
