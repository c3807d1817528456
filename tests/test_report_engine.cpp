#include "ReportEngine.h"
#include "BasketryExceptions.h"
#include "TerminalUI.h"
#include "TestTables.h"

#include <gtest/gtest.h>

#include <sstream>

TEST(ReportEngine, TablesEscapePipesAndHandleEmptyRows) {
    ReportEngine report;
    report.addTable("Things", {"Name"}, {{"a|b"}, {"line\nbreak"}});
    report.addTable("Nothing", {"Name"}, {});
    const std::string& body = report.body();
    EXPECT_NE(body.find("## Things\n| Name |\n| --- |\n| a\\|b |\n| line<br>break |\n"), std::string::npos);
    EXPECT_NE(body.find("## Nothing\n_No rows._"), std::string::npos);
}

TEST(ReportEngine, TallTablesCollapseIntoDetails) {
    std::vector<std::vector<std::string>> rows;
    for (int i = 0; i < 130; ++i) rows.push_back({std::to_string(i)});
    ReportEngine report;
    report.addTable("Tall", {"n"}, rows);
    const std::string& body = report.body();
    EXPECT_NE(body.find("120 of 130 rows"), std::string::npos);
    EXPECT_NE(body.find("<details>"), std::string::npos);
    EXPECT_NE(body.find("| 129 |"), std::string::npos);
}

TEST(ReportEngine, AnalysisReportSections) {
    const Table table = TestTables::make({
        {"order_id", {"1", "1", "2", "2", "3"}},
        {"item", {"tea", "jam", "tea", "jam", "bun"}},
    });
    const AnalysisResult result = BasketAnalyzer(AnalyzerOptions{0.2, 1.0, 0, false, {}}).analyze(table);
    const std::string body = buildAnalysisReport(result, "orders.csv").body();

    EXPECT_EQ(body.rfind("# Market Basket Analysis\n", 0), 0u);
    EXPECT_NE(body.find("Source: `orders.csv`"), std::string::npos);
    EXPECT_NE(body.find("## Summary"), std::string::npos);
    EXPECT_NE(body.find("| Grouping | order |"), std::string::npos);
    EXPECT_NE(body.find("## Association Rules"), std::string::npos);
    EXPECT_NE(body.find("| jam | tea |"), std::string::npos);
    EXPECT_NE(body.find("## Single Item Rules"), std::string::npos);
    EXPECT_NE(body.find("## Frequent Itemsets"), std::string::npos);
}

TEST(ReportEngine, FailedAnalysisReport) {
    AnalysisResult failed;
    failed.status = AnalysisStatus::EMPTY_INPUT;
    failed.message = "no rows";
    const std::string body = buildAnalysisReport(failed, "empty.csv").body();
    EXPECT_NE(body.find("**Analysis failed (empty_input):** no rows"), std::string::npos);
    EXPECT_EQ(body.find("## Summary"), std::string::npos);
}

TEST(ReportEngine, SaveToMissingDirectoryThrows) {
    ReportEngine report;
    report.addTitle("x");
    EXPECT_THROW(report.save("/nonexistent/basketry/report.md"), Basketry::IOException);
}

TEST(TerminalUI, RulesTableHonoursLimit) {
    std::vector<AssociationRule> rules;
    for (int i = 0; i < 3; ++i) {
        rules.push_back({Itemset{"item" + std::to_string(i)}, Itemset{"bread"}, 0.5, 1.0, 2.0});
    }
    std::ostringstream out;
    TerminalUI::printRulesTable(rules, 2, out);
    const std::string text = out.str();
    EXPECT_NE(text.find("item1"), std::string::npos);
    EXPECT_EQ(text.find("item2"), std::string::npos);
    EXPECT_NE(text.find("... 1 more rules"), std::string::npos);

    std::ostringstream empty;
    TerminalUI::printItemsetsTable({}, 0, empty);
    EXPECT_NE(empty.str().find("No itemsets met the support threshold."), std::string::npos);
}
