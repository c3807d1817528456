#include "ReportEngine.h"
#include "BasketryExceptions.h"
#include "ResultsExporter.h"

#include <fstream>

namespace {
std::string escapeMarkdownTableCell(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 8);
    for (char ch : value) {
        if (ch == '|') {
            escaped += "\\|";
        } else if (ch == '\n') {
            escaped += "<br>";
        } else if (ch != '\r') {
            escaped.push_back(ch);
        }
    }
    return escaped;
}

constexpr size_t kTallTableRowCap = 120;

void appendMarkdownTable(std::string& body,
                         const std::vector<std::string>& headers,
                         const std::vector<std::vector<std::string>>& rows) {
    body += "|";
    for (const auto& h : headers) {
        body += " " + escapeMarkdownTableCell(h) + " |";
    }
    body += "\n|";
    for (size_t i = 0; i < headers.size(); ++i) {
        body += " --- |";
    }
    body += "\n";

    for (const auto& row : rows) {
        body += "|";
        for (size_t i = 0; i < headers.size(); ++i) {
            body += " " + escapeMarkdownTableCell(i < row.size() ? row[i] : "") + " |";
        }
        body += "\n";
    }
    body += "\n";
}

std::string orDash(const std::string& value) {
    return value.empty() ? "-" : value;
}
} // namespace

void ReportEngine::addTitle(const std::string& title) {
    body_ += "# " + title + "\n\n";
}

void ReportEngine::addParagraph(const std::string& text) {
    body_ += text + "\n\n";
}

void ReportEngine::addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows) {
    body_ += "## " + title + "\n";
    if (headers.empty()) {
        body_ += "(no columns)\n\n";
        return;
    }
    if (rows.empty()) {
        body_ += "_No rows._\n\n";
        return;
    }

    const bool tallTable = rows.size() > kTallTableRowCap;
    if (tallTable) {
        body_ += "_Tall table preview shown (" + std::to_string(kTallTableRowCap) + " of " + std::to_string(rows.size()) + " rows)._\n\n";
    }

    const size_t previewCount = tallTable ? kTallTableRowCap : rows.size();
    const std::vector<std::vector<std::string>> previewRows(rows.begin(), rows.begin() + static_cast<long>(previewCount));
    appendMarkdownTable(body_, headers, previewRows);

    if (tallTable) {
        body_ += "<details>\n";
        body_ += "<summary>Show full table (" + std::to_string(rows.size()) + " rows)</summary>\n\n";
        appendMarkdownTable(body_, headers, rows);
        body_ += "</details>\n\n";
    }
}

void ReportEngine::save(const std::string& filePath) const {
    std::ofstream out(filePath, std::ios::binary);
    if (!out) throw Basketry::IOException("Failed to open report file: " + filePath);
    out << body_;
    if (!out) throw Basketry::IOException("Failed while writing report: " + filePath);
}

ReportEngine buildAnalysisReport(const AnalysisResult& result, const std::string& sourceLabel) {
    using ResultsExporter::formatCsvNumber;

    ReportEngine report;
    report.addTitle("Market Basket Analysis");
    report.addParagraph("Source: `" + sourceLabel + "`");

    if (!result.ok()) {
        report.addParagraph("**Analysis failed (" + statusName(result.status) + "):** " + result.message);
        return report;
    }

    const AnalysisMetadata& meta = result.metadata;
    report.addTable("Summary", {"Metric", "Value"}, {
        {"Input rows", std::to_string(meta.inputRows)},
        {"Transactions", std::to_string(meta.transactionCount)},
        {"Unique items", std::to_string(meta.uniqueItems)},
        {"Frequent itemsets", std::to_string(result.itemsets.size())},
        {"Association rules", std::to_string(result.rules.size())},
        {"Item column", orDash(meta.itemColumn) + (meta.listMode ? " (item list)" : "")},
        {"Transaction column", orDash(meta.transactionColumn)},
        {"Grouping", TransactionBuilder::strategyName(meta.strategy)},
        {"Order column", orDash(meta.orderColumn)},
        {"Customer column", orDash(meta.customerColumn)},
        {"Date column", orDash(meta.dateColumn)},
        {"Min support", formatCsvNumber(meta.minSupport)},
        {"Min lift", formatCsvNumber(meta.minLift)},
    });
    if (!result.message.empty() && meta.transactionCount == 0) {
        report.addParagraph("_" + result.message + "._");
    }

    std::vector<std::vector<std::string>> ruleRows;
    ruleRows.reserve(result.rules.size());
    for (const auto& rule : result.rules) {
        ruleRows.push_back({rule.antecedent.label(), rule.consequent.label(), formatCsvNumber(rule.support),
                            formatCsvNumber(rule.confidence), formatCsvNumber(rule.lift)});
    }
    report.addTable("Association Rules", {"Antecedents", "Consequents", "Support", "Confidence", "Lift"}, ruleRows);

    std::vector<std::vector<std::string>> singleRows;
    for (const auto& fi : ResultsExporter::topSingleItems(result.itemsets)) {
        singleRows.push_back({fi.items.label(), formatCsvNumber(fi.support)});
    }
    report.addTable("Single Item Rules", {"Item", "Support"}, singleRows);

    std::vector<std::vector<std::string>> itemsetRows;
    itemsetRows.reserve(result.itemsets.size());
    for (const auto& fi : result.itemsets) {
        itemsetRows.push_back({fi.items.label(), std::to_string(fi.items.size()), formatCsvNumber(fi.support)});
    }
    report.addTable("Frequent Itemsets", {"Itemset", "Length", "Support"}, itemsetRows);
    return report;
}
