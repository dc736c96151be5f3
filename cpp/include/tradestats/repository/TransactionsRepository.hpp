#pragma once

#include "tradestats/model/Transaction.hpp"
#include "tradestats/repository/SqliteConnection.hpp"
#include "tradestats/repository/TransactionSource.hpp"

#include <vector>

namespace tradestats::repository {

class TransactionsRepository : public TransactionSource {
public:
    explicit TransactionsRepository(SqliteConnection& connection);

    // Reads every row of the transactions table. Throws RowDecodeError on the first row
    // whose numeric columns cannot be decoded, DatabaseError on any storage failure.
    std::vector<model::Transaction> fetchAll() override;

private:
    SqliteConnection& connection_;
};

} // namespace tradestats::repository
