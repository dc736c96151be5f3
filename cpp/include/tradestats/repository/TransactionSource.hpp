#pragma once

#include "tradestats/model/Transaction.hpp"

#include <vector>

namespace tradestats::repository {

class TransactionSource {
public:
    virtual ~TransactionSource() = default;

    virtual std::vector<model::Transaction> fetchAll() = 0;
};

} // namespace tradestats::repository
