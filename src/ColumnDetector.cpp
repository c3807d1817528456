#include "ColumnDetector.h"

#include "BasketryExceptions.h"
#include "CommonUtils.h"

#include <algorithm>
#include <array>

ColumnRole DetectionResult::roleOf(size_t column) const noexcept {
    if (itemColumn && *itemColumn == column) return ColumnRole::ITEM;
    if (orderColumn && *orderColumn == column) return ColumnRole::ORDER_ID;
    if (customerColumn && *customerColumn == column) return ColumnRole::CUSTOMER;
    if (dateColumn && *dateColumn == column) return ColumnRole::DATE;
    return ColumnRole::UNKNOWN;
}

namespace ColumnDetector {
namespace {
std::vector<std::string> normalizeAll(const std::vector<std::string>& names) {
    std::vector<std::string> out;
    out.reserve(names.size());
    for (const auto& n : names) out.push_back(CommonUtils::normalizeName(n));
    return out;
}

const std::vector<std::string>& normalizedSynonyms(ColumnRole role) {
    static const std::vector<std::string> item = normalizeAll(synonyms(ColumnRole::ITEM));
    static const std::vector<std::string> order = normalizeAll(synonyms(ColumnRole::ORDER_ID));
    static const std::vector<std::string> customer = normalizeAll(synonyms(ColumnRole::CUSTOMER));
    static const std::vector<std::string> date = normalizeAll(synonyms(ColumnRole::DATE));
    static const std::vector<std::string> none;
    switch (role) {
        case ColumnRole::ITEM: return item;
        case ColumnRole::ORDER_ID: return order;
        case ColumnRole::CUSTOMER: return customer;
        case ColumnRole::DATE: return date;
        case ColumnRole::UNKNOWN: break;
    }
    return none;
}

const std::vector<std::string>& normalizedListSynonyms() {
    static const std::vector<std::string> list = normalizeAll(listFormatSynonyms());
    return list;
}

std::optional<size_t> highestCardinalityStringColumn(const Table& table, const std::vector<uint8_t>& claimed) {
    std::optional<size_t> best;
    size_t bestCount = 0;
    for (size_t c = 0; c < table.colCount(); ++c) {
        if (claimed[c]) continue;
        if (!table.isStringLike(c)) continue;
        const size_t distinct = table.distinctCount(c);
        if (!best || distinct > bestCount) {
            best = c;
            bestCount = distinct;
        }
    }
    return best;
}
} // namespace

const std::vector<std::string>& synonyms(ColumnRole role) {
    static const std::vector<std::string> item = {
        "itemdescription", "item", "items", "product", "productname", "product_name", "sku", "description",
        "product title", "ชื่อสินค้า", "สินค้า", "ชื่อ", "รายการ", "รายการสินค้า", "tag", "tags", "label",
        "category", "categories"
    };
    static const std::vector<std::string> order = {
        "order_id", "orderid", "invoice", "invoiceno", "invoicenumber", "receipt", "billno", "transaction",
        "transaction_id", "basketid", "basket", "single_transaction", "เลขที่ใบเสร็จ", "เลขที่คำสั่งซื้อ", "order",
        "orderno", "order no", "idออเดอร์"
    };
    static const std::vector<std::string> customer = {
        "membernumber", "member", "customer", "customerid", "customer_id", "userid", "buyer", "user", "client",
        "account", "เบอร์", "เบอร์โทร", "phone", "โทรศัพท์", "email", "อีเมล"
    };
    static const std::vector<std::string> date = {
        "date", "datetime", "timestamp", "time", "created_at", "order_date", "invoicedate", "วันที่", "วันเวลา"
    };
    static const std::vector<std::string> none;
    switch (role) {
        case ColumnRole::ITEM: return item;
        case ColumnRole::ORDER_ID: return order;
        case ColumnRole::CUSTOMER: return customer;
        case ColumnRole::DATE: return date;
        case ColumnRole::UNKNOWN: break;
    }
    return none;
}

const std::vector<std::string>& listFormatSynonyms() {
    static const std::vector<std::string> list = {
        "items", "order_items", "รายการสินค้า", "products", "tags", "tag", "categories", "category"
    };
    return list;
}

std::string roleName(ColumnRole role) {
    switch (role) {
        case ColumnRole::ITEM: return "item";
        case ColumnRole::ORDER_ID: return "order";
        case ColumnRole::CUSTOMER: return "customer";
        case ColumnRole::DATE: return "date";
        case ColumnRole::UNKNOWN: break;
    }
    return "unknown";
}

std::optional<size_t> matchColumn(const std::vector<std::string>& normalizedColumns,
                                  const std::vector<std::string>& candidateSynonyms,
                                  const std::vector<uint8_t>& claimed,
                                  MatchMode mode) {
    for (size_t c = 0; c < normalizedColumns.size(); ++c) {
        if (c < claimed.size() && claimed[c]) continue;
        const std::string& name = normalizedColumns[c];
        if (name.empty()) continue;
        for (const auto& syn : candidateSynonyms) {
            if (syn.empty()) continue;
            if (mode == MatchMode::EXACT) {
                if (name == syn) return c;
            } else if (name.find(syn) != std::string::npos || syn.find(name) != std::string::npos) {
                return c;
            }
        }
    }
    return std::nullopt;
}

DetectionResult detect(const Table& table) {
    if (table.empty()) {
        throw Basketry::EmptyInputException("table has no rows");
    }

    std::vector<std::string> names;
    names.reserve(table.colCount());
    for (const auto& col : table.columns()) names.push_back(CommonUtils::normalizeName(col.name));

    static constexpr std::array<ColumnRole, 4> kRoleOrder = {
        ColumnRole::ITEM, ColumnRole::ORDER_ID, ColumnRole::CUSTOMER, ColumnRole::DATE
    };
    std::array<std::optional<size_t>, 4> resolved{};
    std::vector<uint8_t> claimed(table.colCount(), static_cast<uint8_t>(0));

    for (MatchMode mode : {MatchMode::EXACT, MatchMode::SUBSTRING}) {
        for (size_t r = 0; r < kRoleOrder.size(); ++r) {
            if (resolved[r]) continue;
            resolved[r] = matchColumn(names, normalizedSynonyms(kRoleOrder[r]), claimed, mode);
            if (resolved[r]) claimed[*resolved[r]] = static_cast<uint8_t>(1);
        }
    }

    DetectionResult result;
    result.orderColumn = resolved[1];
    result.customerColumn = resolved[2];
    result.dateColumn = resolved[3];

    // The list column may coincide with the named item column but not with a grouping column.
    std::vector<uint8_t> groupingClaimed(table.colCount(), static_cast<uint8_t>(0));
    for (const auto& col : {result.orderColumn, result.customerColumn, result.dateColumn}) {
        if (col) groupingClaimed[*col] = static_cast<uint8_t>(1);
    }
    std::optional<size_t> listColumn = matchColumn(names, normalizedListSynonyms(), groupingClaimed, MatchMode::EXACT);
    if (!listColumn) {
        listColumn = matchColumn(names, normalizedListSynonyms(), groupingClaimed, MatchMode::SUBSTRING);
    }

    if (listColumn && result.orderColumn) {
        result.itemColumn = listColumn;
        result.listMode = true;
        return result;
    }

    result.itemColumn = resolved[0];
    if (!result.itemColumn) {
        result.itemColumn = highestCardinalityStringColumn(table, claimed);
        result.itemFromFallback = result.itemColumn.has_value();
    }
    if (!result.itemColumn) {
        throw Basketry::NoItemColumnException("no column could be identified as the item column");
    }
    return result;
}

} // namespace ColumnDetector
