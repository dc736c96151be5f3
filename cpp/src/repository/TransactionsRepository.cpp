#include "tradestats/repository/TransactionsRepository.hpp"
#include "tradestats/util/Logging.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace tradestats::repository {
namespace {

constexpr const char* kSelectTransactions =
    "SELECT id, ingame_name, item_type, item_name, transaction_type, price, quantity, created_at "
    "FROM transactions";

enum Column : int {
    kId = 0,
    kIngameName,
    kItemType,
    kItemName,
    kTransactionType,
    kPrice,
    kQuantity,
    kCreatedAt
};

constexpr const char* kColumnNames[] = {
    "id",
    "ingame_name",
    "item_type",
    "item_name",
    "transaction_type",
    "price",
    "quantity",
    "created_at"};

[[noreturn]] void decodeFailure(int column, std::int64_t rowId, const std::string& detail) {
    throw RowDecodeError("Malformed transaction row " + std::to_string(rowId) + ": column " +
                         kColumnNames[column] + " " + detail);
}

std::string columnText(sqlite3_stmt* stmt, int column) {
    const auto* text = sqlite3_column_text(stmt, column);
    if (!text) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt, column)));
}

std::string trim(const std::string& input) {
    const auto begin = input.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(" \t\r\n");
    return input.substr(begin, end - begin + 1);
}

std::optional<std::string> readOptionalString(sqlite3_stmt* stmt, int column, std::int64_t rowId) {
    switch (sqlite3_column_type(stmt, column)) {
    case SQLITE_NULL:
        return std::nullopt;
    case SQLITE_BLOB:
        decodeFailure(column, rowId, "holds a blob, expected text");
    default:
        return columnText(stmt, column);
    }
}

std::string readString(sqlite3_stmt* stmt, int column, std::int64_t rowId) {
    return readOptionalString(stmt, column, rowId).value_or(std::string{});
}

double readNumber(sqlite3_stmt* stmt, int column, std::int64_t rowId) {
    switch (sqlite3_column_type(stmt, column)) {
    case SQLITE_NULL:
        return 0.0;
    case SQLITE_INTEGER:
        return static_cast<double>(sqlite3_column_int64(stmt, column));
    case SQLITE_FLOAT:
        return sqlite3_column_double(stmt, column);
    case SQLITE_TEXT: {
        auto text = trim(columnText(stmt, column));
        if (text.empty()) {
            decodeFailure(column, rowId, "is empty text, expected a number");
        }
        char* end = nullptr;
        double value = std::strtod(text.c_str(), &end);
        if (end != text.c_str() + text.size() || !std::isfinite(value)) {
            decodeFailure(column, rowId, "is not numeric: '" + text + "'");
        }
        return value;
    }
    default:
        decodeFailure(column, rowId, "holds a blob, expected a number");
    }
}

std::int64_t readInteger(sqlite3_stmt* stmt, int column, std::int64_t rowId) {
    if (sqlite3_column_type(stmt, column) == SQLITE_INTEGER) {
        return sqlite3_column_int64(stmt, column);
    }
    // 2^63 itself is out of range; INT64_MAX rounds up to it as a double.
    static const double kUpperBound = std::ldexp(1.0, 63);
    double value = readNumber(stmt, column, rowId);
    if (std::trunc(value) != value ||
        value < -kUpperBound ||
        value >= kUpperBound) {
        decodeFailure(column, rowId, "is not an integer");
    }
    return static_cast<std::int64_t>(value);
}

std::time_t toUtcTime(std::tm& tm) {
#ifdef _WIN32
    return _mkgmtime(&tm);
#else
    return timegm(&tm);
#endif
}

// Accepts "YYYY-MM-DD HH:MM:SS" and ISO 8601 ("YYYY-MM-DDTHH:MM:SS[.fff][Z]"), read as UTC.
std::optional<std::chrono::system_clock::time_point> parseTimestamp(std::string text) {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    if (text.back() == 'Z' || text.back() == 'z') {
        text.pop_back();
    }
    std::replace(text.begin(), text.end(), 'T', ' ');

    std::tm tm{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }

    std::chrono::milliseconds fraction{0};
    if (iss.peek() == '.') {
        iss.get();
        std::string digits;
        while (std::isdigit(iss.peek())) {
            digits.push_back(static_cast<char>(iss.get()));
        }
        digits.resize(3, '0');
        fraction = std::chrono::milliseconds(std::stoi(digits));
    }
    if (iss.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(toUtcTime(tm)) + fraction;
}

std::optional<std::chrono::system_clock::time_point> readTimestamp(sqlite3_stmt* stmt,
                                                                   int column,
                                                                   std::int64_t rowId) {
    switch (sqlite3_column_type(stmt, column)) {
    case SQLITE_NULL:
        return std::nullopt;
    case SQLITE_INTEGER:
        return std::chrono::system_clock::from_time_t(
            static_cast<std::time_t>(sqlite3_column_int64(stmt, column)));
    default: {
        auto text = columnText(stmt, column);
        auto parsed = parseTimestamp(text);
        if (!parsed) {
            util::log(util::LogLevel::warn,
                      "Unparsable created_at '" + text + "' on transaction " + std::to_string(rowId));
        }
        return parsed;
    }
    }
}

model::Transaction mapTransaction(sqlite3_stmt* stmt) {
    if (sqlite3_column_type(stmt, kId) != SQLITE_INTEGER) {
        throw RowDecodeError("Malformed transaction row: column id is not an integer");
    }

    model::Transaction tx{};
    tx.id = sqlite3_column_int64(stmt, kId);
    tx.ingameName = readOptionalString(stmt, kIngameName, tx.id);
    if (tx.ingameName && tx.ingameName->empty()) {
        tx.ingameName.reset();
    }
    tx.itemType = readString(stmt, kItemType, tx.id);
    tx.itemName = readString(stmt, kItemName, tx.id);
    tx.rawTransactionType = readString(stmt, kTransactionType, tx.id);
    tx.transactionType = model::parseTransactionType(tx.rawTransactionType);
    if (tx.transactionType == model::TransactionType::other) {
        util::log(util::LogLevel::debug, "Transaction " + std::to_string(tx.id) + " has type '" +
                                             tx.rawTransactionType + "', counted as a trade only");
    }
    tx.price = readNumber(stmt, kPrice, tx.id);
    tx.quantity = readInteger(stmt, kQuantity, tx.id);
    tx.createdAt = readTimestamp(stmt, kCreatedAt, tx.id);
    return tx;
}

} // namespace

TransactionsRepository::TransactionsRepository(SqliteConnection& connection)
    : connection_(connection) {}

std::vector<model::Transaction> TransactionsRepository::fetchAll() {
    std::vector<model::Transaction> transactions;
    try {
        auto stmt = connection_.prepare(kSelectTransactions);
        while (stmt.step()) {
            transactions.push_back(mapTransaction(stmt.get()));
        }
    } catch (const DatabaseError& err) {
        util::log(util::LogLevel::error, std::string{"Query transactions failed: "} + err.what());
        throw;
    }
    util::log(util::LogLevel::debug, "Fetched " + std::to_string(transactions.size()) + " transactions");
    return transactions;
}

} // namespace tradestats::repository
