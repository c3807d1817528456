#include "BasketAnalyzer.h"
#include "BasketryExceptions.h"
#include "TestTables.h"

#include <gtest/gtest.h>

namespace {
Table orderItemTable() {
    return TestTables::make({
        {"order_id", {"1", "1", "2", "2", "3", "4"}},
        {"item", {"A", "B", "A", "B", "C", "D"}},
    });
}
} // namespace

TEST(BasketAnalyzer, LongFormatOrdersProduceRules) {
    const BasketAnalyzer analyzer(AnalyzerOptions{0.25, 1.0, 0, false, {}});
    const AnalysisResult result = analyzer.analyze(orderItemTable());

    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.message, "Analysis complete");
    ASSERT_EQ(result.rules.size(), 2u);
    EXPECT_EQ(result.rules[0].antecedent.label(), "A");
    EXPECT_EQ(result.rules[0].consequent.label(), "B");
    EXPECT_DOUBLE_EQ(result.rules[0].lift, 2.0);

    const AnalysisMetadata& meta = result.metadata;
    EXPECT_EQ(meta.itemColumn, "item");
    EXPECT_EQ(meta.transactionColumn, "order_id");
    EXPECT_EQ(meta.strategy, GroupingStrategy::ORDER);
    EXPECT_EQ(meta.inputRows, 6u);
    EXPECT_EQ(meta.transactionCount, 4u);
    EXPECT_EQ(meta.uniqueItems, 4u);
    EXPECT_EQ(meta.totalRules, 2u);
    EXPECT_EQ(meta.totalItemsets, result.itemsets.size());
}

TEST(BasketAnalyzer, RepeatedRunsAreIdentical) {
    const Table table = TestTables::make({
        {"Member_number", {"1", "1", "2", "2", "3", "3", "3", "4"}},
        {"Date", {"01-01-2024", "01-01-2024", "02-01-2024", "02-01-2024", "03-01-2024", "03-01-2024",
                  "03-01-2024", "03-01-2024"}},
        {"itemDescription", {"milk", "rolls", "milk", "soda", "rolls", "milk", "yogurt", "soda"}},
    });
    const BasketAnalyzer analyzer(AnalyzerOptions{0.1, 0.0, 0, false, {}});
    const AnalysisResult first = analyzer.analyze(table);
    const AnalysisResult second = analyzer.analyze(table);

    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.metadata.strategy, GroupingStrategy::CUSTOMER_DATE);
    EXPECT_EQ(first.metadata.transactionColumn, "__customer_date__");
    ASSERT_EQ(first.rules.size(), second.rules.size());
    for (size_t i = 0; i < first.rules.size(); ++i) {
        EXPECT_EQ(first.rules[i].antecedent, second.rules[i].antecedent);
        EXPECT_EQ(first.rules[i].consequent, second.rules[i].consequent);
        EXPECT_DOUBLE_EQ(first.rules[i].lift, second.rules[i].lift);
    }
    ASSERT_EQ(first.itemsets.size(), second.itemsets.size());
    for (size_t i = 0; i < first.itemsets.size(); ++i) {
        EXPECT_EQ(first.itemsets[i].items, second.itemsets[i].items);
    }
}

TEST(BasketAnalyzer, ThresholdOverloadOverridesOptions) {
    const BasketAnalyzer analyzer;
    EXPECT_DOUBLE_EQ(analyzer.options().minSupport, 0.001);

    const AnalysisResult strict = analyzer.analyze(orderItemTable(), 0.5, 1.0);
    ASSERT_TRUE(strict.ok());
    EXPECT_DOUBLE_EQ(strict.metadata.minSupport, 0.5);
    for (const auto& fi : strict.itemsets) EXPECT_GE(fi.support, 0.5);
}

TEST(BasketAnalyzer, DateOnlyDatasetGroupsByDay) {
    const Table table = TestTables::make({
        {"timestamp", {"2024-05-01 08:00", "2024-05-01 19:30", "2024-05-02 08:00"}},
        {"product", {"coffee", "bagel", "coffee"}},
    });
    const AnalysisResult result = BasketAnalyzer(AnalyzerOptions{0.1, 0.0, 0, false, {}}).analyze(table);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.metadata.strategy, GroupingStrategy::DATE);
    EXPECT_EQ(result.metadata.transactionCount, 2u);
    EXPECT_EQ(result.metadata.dateColumn, "timestamp");
}

TEST(BasketAnalyzer, NumericOnlyTableThrowsNoItemColumn) {
    const Table table = TestTables::make({
        {"x1", {"1", "2", "3"}},
        {"x2", {"4", "5", "6"}},
    });
    EXPECT_THROW(BasketAnalyzer().analyze(table), Basketry::NoItemColumnException);
}

TEST(BasketAnalyzer, EmptyTableReportsEmptyInput) {
    const Table table = TestTables::make({{"order_id", {}}, {"item", {}}});
    const AnalysisResult result = BasketAnalyzer().analyze(table);
    EXPECT_EQ(result.status, AnalysisStatus::EMPTY_INPUT);
    EXPECT_TRUE(result.rules.empty());
    EXPECT_EQ(statusName(result.status), "empty_input");
}

TEST(BasketAnalyzer, NoTransactionsAfterCleaningIsSuccess) {
    const Table table = TestTables::make({
        {"order_id", {"", "null"}},
        {"item", {"bread", "milk"}},
    });
    const AnalysisResult result = BasketAnalyzer().analyze(table);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.message, "No transactions remained after cleaning");
    EXPECT_EQ(result.metadata.transactionCount, 0u);
    EXPECT_EQ(result.metadata.rowsWithoutId, 2u);
    EXPECT_TRUE(result.rules.empty());
}

TEST(BasketAnalyzer, InvalidThresholdsFail) {
    const AnalysisResult badSupport = BasketAnalyzer().analyze(orderItemTable(), 1.5, 1.0);
    EXPECT_EQ(badSupport.status, AnalysisStatus::FAILED);
    EXPECT_NE(badSupport.message.find("min_support"), std::string::npos);

    const AnalysisResult badLift = BasketAnalyzer().analyze(orderItemTable(), 0.1, -2.0);
    EXPECT_EQ(badLift.status, AnalysisStatus::FAILED);
    EXPECT_TRUE(badLift.itemsets.empty());
}

TEST(BasketAnalyzer, SelectedColumnsRestrictDetection) {
    const Table table = TestTables::make({
        {"order_id", {"1", "1", "2"}},
        {"customer", {"c1", "c1", "c2"}},
        {"item", {"A", "B", "A"}},
    });
    AnalyzerOptions options{0.1, 0.0, 0, false, {"customer", "item"}};
    const AnalysisResult result = BasketAnalyzer(options).analyze(table);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.metadata.strategy, GroupingStrategy::CUSTOMER);
    EXPECT_TRUE(result.metadata.orderColumn.empty());

    options.selectedColumns = {"item", "missing"};
    const AnalysisResult unknown = BasketAnalyzer(options).analyze(table);
    EXPECT_EQ(unknown.status, AnalysisStatus::FAILED);
    EXPECT_NE(unknown.message.find("missing"), std::string::npos);
}

TEST(BasketAnalyzer, ItemListCellsExplodeIntoOneBasket) {
    const Table table = TestTables::make({
        {"order_id", {"O1"}},
        {"items", {"milk, bread;eggs;milk"}},
    });
    const AnalysisResult result = BasketAnalyzer(AnalyzerOptions{0.5, 1.0, 0, false, {}}).analyze(table);

    ASSERT_TRUE(result.ok()) << result.message;
    const AnalysisMetadata& meta = result.metadata;
    EXPECT_TRUE(meta.listMode);
    EXPECT_EQ(meta.itemColumn, "items");
    EXPECT_EQ(meta.transactionColumn, "order_id");
    EXPECT_EQ(meta.strategy, GroupingStrategy::ORDER);
    EXPECT_EQ(meta.transactionCount, 1u);
    EXPECT_EQ(meta.uniqueItems, 3u);

    bool sawWholeBasket = false;
    for (const auto& fi : result.itemsets) {
        if (fi.items == Itemset{"bread", "eggs", "milk"}) {
            sawWholeBasket = true;
            EXPECT_DOUBLE_EQ(fi.support, 1.0);
        }
        EXPECT_LE(fi.items.size(), 3u);
    }
    EXPECT_TRUE(sawWholeBasket);
}
