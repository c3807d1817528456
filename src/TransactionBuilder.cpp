#include "TransactionBuilder.h"

#include "BasketryExceptions.h"
#include "CommonUtils.h"
#include "DateUtils.h"

#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace TransactionBuilder {
namespace {
struct ItemRow {
    size_t sourceRow;
    std::string item;
};

const TableColumn* optionalColumn(const Table& table, const std::optional<size_t>& index) {
    if (!index) return nullptr;
    if (*index >= table.colCount()) {
        throw Basketry::DatasetException("Detected column index out of range: " + std::to_string(*index));
    }
    return &table.column(*index);
}

std::optional<std::string> presentValue(const TableColumn& col, size_t row) {
    if (col.missing[row]) return std::nullopt;
    return CommonUtils::trim(col.values[row]);
}

// Unparseable dates are kept verbatim so distinct raw values stay distinct.
std::optional<std::string> dayValue(const TableColumn& col, size_t row) {
    auto raw = presentValue(col, row);
    if (!raw) return std::nullopt;
    if (auto day = DateUtils::calendarDay(*raw)) return day;
    return raw;
}

std::vector<ItemRow> collectItemRows(const TableColumn& itemCol, bool listMode) {
    std::vector<ItemRow> rows;
    rows.reserve(itemCol.values.size());
    for (size_t r = 0; r < itemCol.values.size(); ++r) {
        if (itemCol.missing[r]) continue;
        if (listMode) {
            for (auto& token : explodeItemList(itemCol.values[r])) {
                rows.push_back({r, std::move(token)});
            }
            continue;
        }
        std::string item = CommonUtils::trim(itemCol.values[r]);
        if (item.empty()) continue;
        rows.push_back({r, std::move(item)});
    }
    return rows;
}
} // namespace

std::string strategyName(GroupingStrategy strategy) {
    switch (strategy) {
        case GroupingStrategy::ORDER: return "order";
        case GroupingStrategy::CUSTOMER_DATE: return "customer+date";
        case GroupingStrategy::CUSTOMER: return "customer";
        case GroupingStrategy::DATE: return "date";
        case GroupingStrategy::ROW_GROUP: return "fallback";
    }
    return "fallback";
}

std::vector<std::string> explodeItemList(const std::string& value) {
    return CommonUtils::splitOnAny(value, kListDelimiters);
}

GroupingStrategy chooseStrategy(const DetectionResult& detection) noexcept {
    if (detection.orderColumn) return GroupingStrategy::ORDER;
    if (detection.customerColumn && detection.dateColumn) return GroupingStrategy::CUSTOMER_DATE;
    if (detection.customerColumn) return GroupingStrategy::CUSTOMER;
    if (detection.dateColumn) return GroupingStrategy::DATE;
    return GroupingStrategy::ROW_GROUP;
}

TransactionSet build(const Table& table, const DetectionResult& detection) {
    if (!detection.itemColumn || *detection.itemColumn >= table.colCount()) {
        throw Basketry::NoItemColumnException("detection result carries no usable item column");
    }

    const TableColumn& itemCol = table.column(*detection.itemColumn);
    const TableColumn* orderCol = optionalColumn(table, detection.orderColumn);
    const TableColumn* customerCol = optionalColumn(table, detection.customerColumn);
    const TableColumn* dateCol = optionalColumn(table, detection.dateColumn);

    TransactionSet out;
    out.strategy = chooseStrategy(detection);
    out.itemColumn = itemCol.name;
    switch (out.strategy) {
        case GroupingStrategy::ORDER: out.transactionColumn = orderCol->name; break;
        case GroupingStrategy::CUSTOMER_DATE: out.transactionColumn = kCustomerDateLabel; break;
        case GroupingStrategy::CUSTOMER: out.transactionColumn = customerCol->name; break;
        case GroupingStrategy::DATE: out.transactionColumn = kDateLabel; break;
        case GroupingStrategy::ROW_GROUP: out.transactionColumn = kRowGroupLabel; break;
    }

    auto transactionId = [&](size_t row) -> std::optional<std::string> {
        switch (out.strategy) {
            case GroupingStrategy::ORDER:
                return presentValue(*orderCol, row);
            case GroupingStrategy::CUSTOMER_DATE:
                return presentValue(*customerCol, row).value_or("") + "|" + dayValue(*dateCol, row).value_or("");
            case GroupingStrategy::CUSTOMER:
                return presentValue(*customerCol, row);
            case GroupingStrategy::DATE:
                return dayValue(*dateCol, row);
            case GroupingStrategy::ROW_GROUP:
                return std::to_string(row / kRowGroupSize);
        }
        return std::nullopt;
    };

    const std::vector<ItemRow> itemRows = collectItemRows(itemCol, detection.listMode);
    out.itemRows = itemRows.size();

    std::unordered_map<std::string, size_t> slotById;
    std::unordered_set<std::string> distinctItems;
    for (const auto& row : itemRows) {
        std::optional<std::string> id = transactionId(row.sourceRow);
        if (!id || id->empty()) {
            ++out.rowsWithoutId;
            continue;
        }

        auto [it, inserted] = slotById.emplace(*id, out.transactions.size());
        if (inserted) {
            out.transactions.push_back(Transaction{*id, {}});
        }
        out.transactions[it->second].items.insert(row.item);
        distinctItems.insert(row.item);
    }

    out.uniqueItems = distinctItems.size();
    return out;
}

} // namespace TransactionBuilder
