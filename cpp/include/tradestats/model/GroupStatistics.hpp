#pragma once

#include <cstdint>
#include <string>

namespace tradestats::model {

struct GroupStatistics {
    std::string key;
    double profit{};
    double revenue{};
    double expense{};
    std::int64_t numberOfTrades{};
    std::int64_t purchases{};
    std::int64_t sales{};
    double profitMargin{};
};

} // namespace tradestats::model
