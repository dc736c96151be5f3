#include "tradestats/service/StatisticsService.hpp"

#include "TestSupport.hpp"

#include <gtest/gtest.h>

using namespace tradestats;
using tradestats::test::FakeTransactionSource;
using tradestats::test::makeTransaction;

namespace {

std::vector<model::Transaction> sampleHistory() {
    return {
        makeTransaction("Tenno", "sale", 120, 1, "riven", "Rubico Argi-visican"),
        makeTransaction("Tenno", "purchase", 30, 1, "riven", "Rubico Argi-visican"),
        makeTransaction("Tenno", "sale", 15, 3, "item", "Rubico Argi-visican"),
        makeTransaction(std::nullopt, "purchase", 60, 1, "riven", "Kronen Vexi-satis"),
        makeTransaction("Ordis", "sale", 200, 2, "item", "Mesa Prime Set"),
    };
}

} // namespace

TEST(StatisticsServiceTest, UserStatisticsGroupsEveryTransactionByActor) {
    FakeTransactionSource source{sampleHistory()};
    service::StatisticsService service{source};

    auto stats = service.userStatistics();
    ASSERT_EQ(stats.size(), 3u);

    EXPECT_EQ(stats[0].key, "Ordis");
    EXPECT_DOUBLE_EQ(stats[0].profit, 200.0);
    EXPECT_EQ(stats[0].sales, 2);

    EXPECT_EQ(stats[1].key, "Tenno");
    EXPECT_DOUBLE_EQ(stats[1].revenue, 135.0);
    EXPECT_DOUBLE_EQ(stats[1].expense, 30.0);
    EXPECT_DOUBLE_EQ(stats[1].profit, 105.0);
    EXPECT_EQ(stats[1].numberOfTrades, 3);
    EXPECT_EQ(stats[1].sales, 4);
    EXPECT_EQ(stats[1].purchases, 1);

    EXPECT_EQ(stats[2].key, service::kUnknownActor);
    EXPECT_DOUBLE_EQ(stats[2].profit, -60.0);
    EXPECT_DOUBLE_EQ(stats[2].profitMargin, 0.0);
}

TEST(StatisticsServiceTest, RivenStatisticsOnlyCountRivenTransactions) {
    FakeTransactionSource source{sampleHistory()};
    service::StatisticsService service{source};

    auto stats = service.rivenStatistics();
    ASSERT_EQ(stats.size(), 2u);

    EXPECT_EQ(stats[0].key, "Rubico Argi-visican");
    EXPECT_DOUBLE_EQ(stats[0].revenue, 120.0);
    EXPECT_DOUBLE_EQ(stats[0].expense, 30.0);
    EXPECT_DOUBLE_EQ(stats[0].profitMargin, 0.75);
    EXPECT_EQ(stats[0].numberOfTrades, 2);

    EXPECT_EQ(stats[1].key, "Kronen Vexi-satis");
    EXPECT_DOUBLE_EQ(stats[1].profit, -60.0);
}

TEST(StatisticsServiceTest, EachReportFetchesFreshData) {
    FakeTransactionSource source{sampleHistory()};
    service::StatisticsService service{source};

    service.userStatistics();
    service.rivenStatistics();
    service.userStatistics();
    EXPECT_EQ(source.fetchCount, 3);
}

TEST(StatisticsServiceTest, SourceFailurePropagates) {
    FakeTransactionSource source;
    source.failure = "disk I/O error";
    service::StatisticsService service{source};

    EXPECT_THROW(service.userStatistics(), repository::DatabaseError);
    EXPECT_THROW(service.rivenStatistics(), repository::DatabaseError);
}

TEST(StatisticsServiceTest, KeySelectors) {
    auto tx = makeTransaction(std::nullopt, "sale", 1, 1, "riven", "Soma Acri-tron");
    EXPECT_EQ(service::actorKey(tx), "Unknown");
    EXPECT_EQ(service::subjectKey(tx), "Soma Acri-tron");
    EXPECT_TRUE(service::isRiven(tx));

    tx.ingameName = "Teshin";
    tx.itemType = "Riven";
    EXPECT_EQ(service::actorKey(tx), "Teshin");
    EXPECT_FALSE(service::isRiven(tx));
}

TEST(StatisticsServiceTest, UnnamedRivensCombineUnderUnknown) {
    FakeTransactionSource source({
        makeTransaction("A", "sale", 80, 1, "riven", ""),
        makeTransaction("B", "purchase", 30, 1, "riven", ""),
        makeTransaction("C", "sale", 10, 1, "riven", "Soma Acri-tron"),
    });
    service::StatisticsService service{source};

    auto stats = service.rivenStatistics();
    ASSERT_EQ(stats.size(), 2u);
    EXPECT_EQ(stats[0].key, service::kUnknownSubject);
    EXPECT_DOUBLE_EQ(stats[0].profit, 50.0);
    EXPECT_EQ(stats[0].numberOfTrades, 2);
    EXPECT_EQ(stats[1].key, "Soma Acri-tron");
}
