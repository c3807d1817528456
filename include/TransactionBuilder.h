#pragma once

#include "ColumnDetector.h"
#include "Table.h"

#include <set>
#include <string>
#include <vector>

enum class GroupingStrategy { ORDER, CUSTOMER_DATE, CUSTOMER, DATE, ROW_GROUP };

struct Transaction {
    std::string id;
    std::set<std::string> items;
};

struct TransactionSet {
    std::vector<Transaction> transactions;
    std::string itemColumn;
    // Source column name, or a synthesized label for derived ids.
    std::string transactionColumn;
    GroupingStrategy strategy = GroupingStrategy::ROW_GROUP;
    size_t uniqueItems = 0;
    size_t itemRows = 0;
    size_t rowsWithoutId = 0;
};

namespace TransactionBuilder {

constexpr size_t kRowGroupSize = 5;
constexpr const char* kListDelimiters = ",|;";
constexpr const char* kCustomerDateLabel = "__customer_date__";
constexpr const char* kDateLabel = "__date__";
constexpr const char* kRowGroupLabel = "__rowgroup__";

std::string strategyName(GroupingStrategy strategy);

/**
 * @brief Splits an item-list cell on runs of ',', '|' and ';' into trimmed, non-empty tokens.
 */
std::vector<std::string> explodeItemList(const std::string& value);

// Grouping precedence: order, customer+date, customer, date, row groups of kRowGroupSize.
GroupingStrategy chooseStrategy(const DetectionResult& detection) noexcept;

/**
 * @brief Normalizes the table into one transaction per distinct transaction id.
 * @details Items are trimmed and blank/missing items dropped; rows with no derivable id are
 * dropped; repeated items within a transaction collapse. Transactions keep first-seen order.
 * @throws Basketry::NoItemColumnException when the detection has no usable item column.
 */
TransactionSet build(const Table& table, const DetectionResult& detection);

} // namespace TransactionBuilder
