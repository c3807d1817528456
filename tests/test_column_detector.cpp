#include "BasketryExceptions.h"
#include "ColumnDetector.h"
#include "TestTables.h"

#include <gtest/gtest.h>

TEST(ColumnDetector, RetailInvoiceHeaders) {
    const Table table = TestTables::make({
        {"InvoiceNo", {"536365", "536365"}},
        {"Description", {"WHITE MUG", "RED MUG"}},
        {"CustomerID", {"17850", "17850"}},
        {"InvoiceDate", {"2010-12-01 08:26", "2010-12-01 08:26"}},
    });
    const DetectionResult d = ColumnDetector::detect(table);
    EXPECT_EQ(d.orderColumn, 0u);
    EXPECT_EQ(d.itemColumn, 1u);
    EXPECT_EQ(d.customerColumn, 2u);
    EXPECT_EQ(d.dateColumn, 3u);
    EXPECT_FALSE(d.listMode);
    EXPECT_FALSE(d.itemFromFallback);
    EXPECT_EQ(d.roleOf(2), ColumnRole::CUSTOMER);
}

TEST(ColumnDetector, ExactMatchWinsOverSubstring) {
    // "order_date" would substring-match the order synonyms; the exact date match claims it first.
    const Table table = TestTables::make({
        {"order_date", {"2024-01-01"}},
        {"item", {"milk"}},
        {"order_id", {"1"}},
    });
    const DetectionResult d = ColumnDetector::detect(table);
    EXPECT_EQ(d.dateColumn, 0u);
    EXPECT_EQ(d.itemColumn, 1u);
    EXPECT_EQ(d.orderColumn, 2u);
}

TEST(ColumnDetector, GroceryMemberHeaders) {
    const Table table = TestTables::make({
        {"Member_number", {"1808", "2552"}},
        {"Date", {"21-07-2015", "05-01-2015"}},
        {"itemDescription", {"tropical fruit", "whole milk"}},
    });
    const DetectionResult d = ColumnDetector::detect(table);
    EXPECT_EQ(d.customerColumn, 0u);
    EXPECT_EQ(d.dateColumn, 1u);
    EXPECT_EQ(d.itemColumn, 2u);
    EXPECT_FALSE(d.orderColumn.has_value());
}

TEST(ColumnDetector, ThaiHeaders) {
    const Table table = TestTables::make({
        {"เลขที่ใบเสร็จ", {"R1", "R1"}},
        {"ชื่อสินค้า", {"ข้าว", "น้ำ"}},
    });
    const DetectionResult d = ColumnDetector::detect(table);
    EXPECT_EQ(d.orderColumn, 0u);
    EXPECT_EQ(d.itemColumn, 1u);
}

TEST(ColumnDetector, ListFormatNeedsOrderColumn) {
    const Table listTable = TestTables::make({
        {"order_id", {"O1"}},
        {"items", {"milk, bread;eggs"}},
    });
    const DetectionResult list = ColumnDetector::detect(listTable);
    EXPECT_TRUE(list.listMode);
    EXPECT_EQ(list.itemColumn, 1u);
    EXPECT_EQ(list.orderColumn, 0u);

    const Table customerTable = TestTables::make({
        {"customer", {"c1"}},
        {"products", {"milk"}},
    });
    const DetectionResult longFormat = ColumnDetector::detect(customerTable);
    EXPECT_FALSE(longFormat.listMode);
    EXPECT_EQ(longFormat.itemColumn, 1u);
    EXPECT_EQ(longFormat.customerColumn, 0u);
}

TEST(ColumnDetector, FallsBackToHighestCardinalityStringColumn) {
    const Table table = TestTables::make({
        {"v1", {"1", "2", "3"}},
        {"v2", {"x", "y", "x"}},
        {"v3", {"p", "q", "r"}},
    });
    const DetectionResult d = ColumnDetector::detect(table);
    EXPECT_EQ(d.itemColumn, 2u);
    EXPECT_TRUE(d.itemFromFallback);
}

TEST(ColumnDetector, FallbackSkipsGroupingColumns) {
    const Table table = TestTables::make({
        {"customer", {"alice", "bob", "carol", "dave"}},
        {"v1", {"tea", "tea", "jam", "tea"}},
    });
    const DetectionResult d = ColumnDetector::detect(table);
    EXPECT_EQ(d.customerColumn, 0u);
    EXPECT_EQ(d.itemColumn, 1u);
    EXPECT_TRUE(d.itemFromFallback);
}

TEST(ColumnDetector, AllNumericTableHasNoItemColumn) {
    const Table table = TestTables::make({
        {"x1", {"1", "2"}},
        {"x2", {"3.5", "NA"}},
    });
    EXPECT_THROW(ColumnDetector::detect(table), Basketry::NoItemColumnException);
}

TEST(ColumnDetector, EmptyTableIsEmptyInput) {
    const Table table = TestTables::make({{"item", {}}});
    EXPECT_THROW(ColumnDetector::detect(table), Basketry::EmptyInputException);
}

TEST(ColumnDetector, MatchColumnSkipsClaimedAndEmptyNames) {
    const std::vector<std::string> names = {"", "orderid", "orderno"};
    const std::vector<std::string> syns = {"orderid", "orderno"};
    EXPECT_EQ(ColumnDetector::matchColumn(names, syns, {0, 0, 0}, ColumnDetector::MatchMode::EXACT), 1u);
    EXPECT_EQ(ColumnDetector::matchColumn(names, syns, {0, 1, 0}, ColumnDetector::MatchMode::EXACT), 2u);
    EXPECT_FALSE(ColumnDetector::matchColumn({""}, {"item"}, {0}, ColumnDetector::MatchMode::SUBSTRING).has_value());
    EXPECT_EQ(ColumnDetector::matchColumn({"productcode"}, {"product"}, {0}, ColumnDetector::MatchMode::SUBSTRING), 0u);
}
