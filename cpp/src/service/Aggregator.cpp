#include "tradestats/service/Aggregator.hpp"

#include <algorithm>
#include <cstdint>
#include <map>

namespace tradestats::service {
namespace {

struct Accumulator {
    double revenue{};
    double expense{};
    std::int64_t trades{};
    std::int64_t purchases{};
    std::int64_t sales{};

    void add(const model::Transaction& tx) {
        ++trades;
        switch (tx.transactionType) {
        case model::TransactionType::sale:
            revenue += tx.price;
            sales += tx.quantity;
            break;
        case model::TransactionType::purchase:
            expense += tx.price;
            purchases += tx.quantity;
            break;
        case model::TransactionType::other:
            break;
        }
    }
};

model::GroupStatistics finish(const std::string& key, const Accumulator& acc) {
    model::GroupStatistics stats;
    stats.key = key;
    stats.revenue = acc.revenue;
    stats.expense = acc.expense;
    stats.profit = acc.revenue - acc.expense;
    stats.profitMargin = acc.revenue == 0.0 ? 0.0 : stats.profit / acc.revenue;
    stats.numberOfTrades = acc.trades;
    stats.purchases = acc.purchases;
    stats.sales = acc.sales;
    return stats;
}

} // namespace

std::vector<model::GroupStatistics> aggregate(const std::vector<model::Transaction>& records,
                                              const KeySelector& keyOf,
                                              const TransactionFilter& include) {
    // Ordered by key so the stable sort below leaves equal profits in key order.
    std::map<std::string, Accumulator> groups;
    for (const auto& tx : records) {
        if (include && !include(tx)) {
            continue;
        }
        groups[keyOf(tx)].add(tx);
    }

    std::vector<model::GroupStatistics> result;
    result.reserve(groups.size());
    for (const auto& [key, acc] : groups) {
        result.push_back(finish(key, acc));
    }

    std::stable_sort(result.begin(), result.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.profit > rhs.profit;
    });
    return result;
}

} // namespace tradestats::service
