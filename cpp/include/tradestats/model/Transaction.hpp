#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tradestats::model {

enum class TransactionType {
    sale,
    purchase,
    other
};

inline TransactionType parseTransactionType(std::string_view text) {
    if (text == "sale") return TransactionType::sale;
    if (text == "purchase") return TransactionType::purchase;
    return TransactionType::other;
}

inline constexpr std::string_view kRivenItemType = "riven";

struct Transaction {
    std::int64_t id{};
    std::optional<std::string> ingameName;
    std::string itemType;
    std::string itemName;
    TransactionType transactionType{TransactionType::other};
    std::string rawTransactionType;
    double price{};
    std::int64_t quantity{};
    std::optional<std::chrono::system_clock::time_point> createdAt;
};

} // namespace tradestats::model
