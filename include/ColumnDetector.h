#pragma once

#include "Table.h"

#include <optional>
#include <string>
#include <vector>

enum class ColumnRole { ITEM, ORDER_ID, CUSTOMER, DATE, UNKNOWN };

struct DetectionResult {
    // In list mode this is the delimited item-list column.
    std::optional<size_t> itemColumn;
    std::optional<size_t> orderColumn;
    std::optional<size_t> customerColumn;
    std::optional<size_t> dateColumn;
    bool listMode = false;
    bool itemFromFallback = false;

    ColumnRole roleOf(size_t column) const noexcept;
};

namespace ColumnDetector {

enum class MatchMode { EXACT, SUBSTRING };

const std::vector<std::string>& synonyms(ColumnRole role);
const std::vector<std::string>& listFormatSynonyms();
std::string roleName(ColumnRole role);

/**
 * @brief Finds the first column whose normalized name matches a normalized synonym.
 * @details EXACT compares whole names; SUBSTRING accepts containment in either direction.
 * Columns flagged in `claimed` and columns whose normalized name is empty are skipped.
 */
std::optional<size_t> matchColumn(const std::vector<std::string>& normalizedColumns,
                                  const std::vector<std::string>& candidateSynonyms,
                                  const std::vector<uint8_t>& claimed,
                                  MatchMode mode);

/**
 * @brief Assigns semantic roles to table columns from their names.
 * @details Exact matches for every role are resolved before substring matches; a column holds at
 * most one of item/order/customer/date. A list-format column together with an order column switches
 * to list mode. Without a named item column the unclaimed string-like column with the most distinct
 * values is used.
 * @throws Basketry::EmptyInputException when the table has no rows.
 * @throws Basketry::NoItemColumnException when no item column can be determined.
 */
DetectionResult detect(const Table& table);

} // namespace ColumnDetector
