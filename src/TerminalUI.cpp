#include "TerminalUI.h"
#include "ResultsExporter.h"

#include <algorithm>
#include <iomanip>

namespace {
const char* kRule = "============================================================================================================";

std::string clip(const std::string& value, size_t width) {
    if (value.size() <= width) return value;
    if (width <= 3) return value.substr(0, width);
    return value.substr(0, width - 3) + "...";
}
} // namespace

void TerminalUI::printLoadSummary(const std::string& source, const Table& table, const LoadReport& report, std::ostream& out) {
    out << "[Basketry] Loaded '" << source << "': " << table.rowCount() << " rows x " << table.colCount() << " columns"
        << " (delimiter '" << (report.delimiter == '\t' ? std::string("\\t") : std::string(1, report.delimiter)) << "')\n";
    if (report.malformedRows > 0) {
        out << "[Basketry Warning] Skipped " << report.malformedRows << " malformed rows\n";
    }
    if (report.paddedRows > 0 || report.truncatedRows > 0) {
        out << "[Basketry Warning] Padded " << report.paddedRows << " short rows, truncated "
            << report.truncatedRows << " long rows\n";
    }
}

void TerminalUI::printDetectionSummary(const AnalysisMetadata& meta, std::ostream& out) {
    auto show = [](const std::string& v) { return v.empty() ? std::string("-") : v; };
    out << "\n============================================= COLUMN DETECTION =============================================\n";
    out << std::left
        << std::setw(22) << "Item column" << show(meta.itemColumn)
        << (meta.listMode ? " (item list)" : "") << (meta.itemFromFallback ? " (cardinality fallback)" : "") << "\n"
        << std::setw(22) << "Order column" << show(meta.orderColumn) << "\n"
        << std::setw(22) << "Customer column" << show(meta.customerColumn) << "\n"
        << std::setw(22) << "Date column" << show(meta.dateColumn) << "\n"
        << std::setw(22) << "Grouping" << TransactionBuilder::strategyName(meta.strategy)
        << " (" << meta.transactionColumn << ")\n"
        << std::setw(22) << "Transactions" << meta.transactionCount << "\n"
        << std::setw(22) << "Unique items" << meta.uniqueItems << "\n";
    out << kRule << "\n";
}

void TerminalUI::printRulesTable(const std::vector<AssociationRule>& rules, size_t limit, std::ostream& out) {
    const size_t shown = limit == 0 ? rules.size() : std::min(limit, rules.size());
    out << "\n============================================ ASSOCIATION RULES =============================================\n";
    if (rules.empty()) {
        out << "        -> No rules met the support and lift thresholds.\n";
        out << kRule << "\n";
        return;
    }
    out << std::left
        << std::setw(34) << "Antecedents"
        << std::setw(34) << "Consequents"
        << std::right
        << std::setw(12) << "Support"
        << std::setw(12) << "Confidence"
        << std::setw(12) << "Lift" << "\n";
    out << std::string(104, '-') << "\n";
    for (size_t i = 0; i < shown; ++i) {
        const auto& r = rules[i];
        out << std::left
            << std::setw(34) << clip(r.antecedent.label(), 32)
            << std::setw(34) << clip(r.consequent.label(), 32)
            << std::right
            << std::setw(12) << ResultsExporter::formatCsvNumber(r.support)
            << std::setw(12) << ResultsExporter::formatCsvNumber(r.confidence)
            << std::setw(12) << ResultsExporter::formatCsvNumber(r.lift) << "\n";
    }
    if (shown < rules.size()) {
        out << "        ... " << (rules.size() - shown) << " more rules\n";
    }
    out << kRule << "\n";
}

void TerminalUI::printItemsetsTable(const std::vector<FrequentItemset>& itemsets, size_t limit, std::ostream& out) {
    const size_t shown = limit == 0 ? itemsets.size() : std::min(limit, itemsets.size());
    out << "\n============================================ FREQUENT ITEMSETS =============================================\n";
    if (itemsets.empty()) {
        out << "        -> No itemsets met the support threshold.\n";
        out << kRule << "\n";
        return;
    }
    out << std::left << std::setw(68) << "Itemset"
        << std::right << std::setw(12) << "Length" << std::setw(12) << "Support" << "\n";
    out << std::string(92, '-') << "\n";
    for (size_t i = 0; i < shown; ++i) {
        const auto& fi = itemsets[i];
        out << std::left << std::setw(68) << clip(fi.items.label(), 66)
            << std::right << std::setw(12) << fi.items.size()
            << std::setw(12) << ResultsExporter::formatCsvNumber(fi.support) << "\n";
    }
    if (shown < itemsets.size()) {
        out << "        ... " << (itemsets.size() - shown) << " more itemsets\n";
    }
    out << kRule << "\n";
}
