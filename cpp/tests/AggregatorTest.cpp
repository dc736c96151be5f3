#include "tradestats/service/Aggregator.hpp"
#include "tradestats/service/StatisticsService.hpp"

#include "TestSupport.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <numeric>
#include <optional>
#include <string>
#include <vector>

using namespace tradestats;
using tradestats::test::makeTransaction;

namespace {

const model::GroupStatistics* findGroup(const std::vector<model::GroupStatistics>& stats,
                                        const std::string& key) {
    for (const auto& s : stats) {
        if (s.key == key) {
            return &s;
        }
    }
    return nullptr;
}

} // namespace

TEST(AggregatorTest, EmptyInputYieldsEmptyResult) {
    std::vector<model::Transaction> none;
    EXPECT_TRUE(service::aggregate(none, service::actorKey).empty());
    EXPECT_TRUE(service::aggregate(none, service::subjectKey, service::isRiven).empty());
}

TEST(AggregatorTest, ByActorMixedTrades) {
    std::vector<model::Transaction> records{
        makeTransaction("A", "sale", 100, 1),
        makeTransaction("A", "purchase", 40, 1),
        makeTransaction("B", "sale", 50, 2),
    };

    auto stats = service::aggregate(records, service::actorKey);
    ASSERT_EQ(stats.size(), 2u);

    EXPECT_EQ(stats[0].key, "A");
    EXPECT_DOUBLE_EQ(stats[0].revenue, 100.0);
    EXPECT_DOUBLE_EQ(stats[0].expense, 40.0);
    EXPECT_DOUBLE_EQ(stats[0].profit, 60.0);
    EXPECT_DOUBLE_EQ(stats[0].profitMargin, 0.6);
    EXPECT_EQ(stats[0].numberOfTrades, 2);
    EXPECT_EQ(stats[0].purchases, 1);
    EXPECT_EQ(stats[0].sales, 1);

    EXPECT_EQ(stats[1].key, "B");
    EXPECT_DOUBLE_EQ(stats[1].revenue, 50.0);
    EXPECT_DOUBLE_EQ(stats[1].expense, 0.0);
    EXPECT_DOUBLE_EQ(stats[1].profit, 50.0);
    EXPECT_DOUBLE_EQ(stats[1].profitMargin, 1.0);
    EXPECT_EQ(stats[1].numberOfTrades, 1);
    EXPECT_EQ(stats[1].purchases, 0);
    EXPECT_EQ(stats[1].sales, 2);
}

TEST(AggregatorTest, MarginIsZeroWhenRevenueIsZero) {
    std::vector<model::Transaction> records{
        makeTransaction("Buyer", "purchase", 75, 3),
        makeTransaction("Buyer", "purchase", 25, 1),
    };

    auto stats = service::aggregate(records, service::actorKey);
    ASSERT_EQ(stats.size(), 1u);
    EXPECT_EQ(stats[0].revenue, 0.0);
    EXPECT_EQ(stats[0].profit, -100.0);
    EXPECT_EQ(stats[0].profitMargin, 0.0);
    EXPECT_EQ(stats[0].purchases, 4);
}

TEST(AggregatorTest, OtherDirectionOnlyCountsAsTrade) {
    std::vector<model::Transaction> records{makeTransaction("C", "trade", 999, 7),
                                            makeTransaction("C", "sale", 10, 1)};

    auto stats = service::aggregate(records, service::actorKey);
    ASSERT_EQ(stats.size(), 1u);
    EXPECT_EQ(stats[0].numberOfTrades, 2);
    EXPECT_DOUBLE_EQ(stats[0].revenue, 10.0);
    EXPECT_DOUBLE_EQ(stats[0].expense, 0.0);
    EXPECT_EQ(stats[0].sales, 1);
    EXPECT_EQ(stats[0].purchases, 0);
}

TEST(AggregatorTest, MissingActorsCombineUnderUnknown) {
    std::vector<model::Transaction> records{
        makeTransaction(std::nullopt, "sale", 20, 1),
        makeTransaction(std::string{}, "sale", 30, 1),
        makeTransaction("Known", "sale", 5, 1),
    };

    auto stats = service::aggregate(records, service::actorKey);
    ASSERT_EQ(stats.size(), 2u);
    const auto* unknown = findGroup(stats, "Unknown");
    ASSERT_NE(unknown, nullptr);
    EXPECT_EQ(unknown->numberOfTrades, 2);
    EXPECT_DOUBLE_EQ(unknown->revenue, 50.0);
}

TEST(AggregatorTest, SortsByProfitDescendingWithKeyTieBreak) {
    std::vector<model::Transaction> records{
        makeTransaction("zeta", "sale", 10, 1),
        makeTransaction("alpha", "sale", 10, 1),
        makeTransaction("mid", "sale", 30, 1),
        makeTransaction("loss", "purchase", 5, 1),
        makeTransaction("beta", "sale", 10, 1),
    };

    auto stats = service::aggregate(records, service::actorKey);
    ASSERT_EQ(stats.size(), 5u);
    std::vector<std::string> keys;
    for (const auto& s : stats) {
        keys.push_back(s.key);
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"mid", "alpha", "beta", "zeta", "loss"}));

    for (std::size_t i = 1; i < stats.size(); ++i) {
        EXPECT_GE(stats[i - 1].profit, stats[i].profit);
    }
}

TEST(AggregatorTest, ConservationAndPartitionCompleteness) {
    std::vector<model::Transaction> records;
    const char* actors[] = {"A", "B", "C", "D"};
    for (int i = 0; i < 40; ++i) {
        const char* type = i % 3 == 0 ? "purchase" : i % 3 == 1 ? "sale" : "gift";
        records.push_back(makeTransaction(actors[i % 4], type, 1.25 * i, i % 5));
    }

    auto include = [](const model::Transaction& tx) { return tx.price > 10.0; };
    auto stats = service::aggregate(records, service::actorKey, include);

    auto filtered = std::count_if(records.begin(), records.end(), include);
    auto total = std::accumulate(stats.begin(), stats.end(), std::int64_t{0},
                                 [](std::int64_t sum, const auto& s) { return sum + s.numberOfTrades; });
    EXPECT_EQ(total, filtered);

    for (const auto& s : stats) {
        EXPECT_EQ(s.revenue - s.expense, s.profit);
    }
}

TEST(AggregatorTest, RivenReportIgnoresOtherCategoriesWithSameName) {
    std::vector<model::Transaction> records{
        makeTransaction("A", "sale", 500, 1, "riven", "Torid Crita-ata"),
        makeTransaction("B", "purchase", 200, 1, "riven", "Torid Crita-ata"),
        makeTransaction("C", "sale", 9000, 1, "item", "Torid Crita-ata"),
        makeTransaction("D", "sale", 40, 1, "item", "Nova Prime Set"),
    };

    auto stats = service::aggregate(records, service::subjectKey, service::isRiven);
    ASSERT_EQ(stats.size(), 1u);
    EXPECT_EQ(stats[0].key, "Torid Crita-ata");
    EXPECT_DOUBLE_EQ(stats[0].revenue, 500.0);
    EXPECT_DOUBLE_EQ(stats[0].expense, 200.0);
    EXPECT_EQ(stats[0].numberOfTrades, 2);
}

TEST(AggregatorTest, DoesNotMutateInput) {
    std::vector<model::Transaction> records{makeTransaction("A", "sale", 1, 1),
                                            makeTransaction(std::nullopt, "purchase", 2, 2)};
    const auto before = records;

    service::aggregate(records, service::actorKey);

    ASSERT_EQ(records.size(), before.size());
    for (std::size_t i = 0; i < records.size(); ++i) {
        EXPECT_EQ(records[i].ingameName, before[i].ingameName);
        EXPECT_EQ(records[i].price, before[i].price);
        EXPECT_EQ(records[i].quantity, before[i].quantity);
    }
}
