#pragma once

#include "tradestats/model/GroupStatistics.hpp"
#include "tradestats/model/Transaction.hpp"

#include <functional>
#include <string>
#include <vector>

namespace tradestats::service {

using KeySelector = std::function<std::string(const model::Transaction&)>;
using TransactionFilter = std::function<bool(const model::Transaction&)>;

// Groups the records accepted by include (all of them when include is empty) by keyOf and
// returns one entry per key, ordered by profit descending and then by key ascending.
std::vector<model::GroupStatistics> aggregate(const std::vector<model::Transaction>& records,
                                              const KeySelector& keyOf,
                                              const TransactionFilter& include = {});

} // namespace tradestats::service
