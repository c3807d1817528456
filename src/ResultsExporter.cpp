#include "ResultsExporter.h"
#include "BasketryExceptions.h"
#include "CSVUtils.h"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace ResultsExporter {
namespace {
constexpr const char* kUtf8Bom = "\xEF\xBB\xBF";

double roundDigits(double value) {
    const double scale = std::pow(10.0, kRoundDigits);
    return std::round(value * scale) / scale;
}

std::string formatRounded(double value) {
    std::ostringstream out;
    out << std::setprecision(15) << roundDigits(value);
    return out.str();
}

std::string jsonStringOrNull(const std::string& value) {
    if (value.empty()) return "null";
    return "\"" + escapeJsonString(value) + "\"";
}

std::ofstream openOutput(const std::string& path) {
    std::ofstream out(path, std::ios::binary);
    if (!out) throw Basketry::IOException("Failed to open output file: " + path);
    return out;
}

void writeRuleRow(std::ostringstream& out, const AssociationRule& rule) {
    out << "{\"Antecedents\":\"" << escapeJsonString(rule.antecedent.label()) << "\","
        << "\"Consequents\":\"" << escapeJsonString(rule.consequent.label()) << "\","
        << "\"Support\":" << formatJsonNumber(rule.support) << ","
        << "\"Confidence\":" << formatJsonNumber(rule.confidence) << ","
        << "\"Lift\":" << formatJsonNumber(rule.lift) << "}";
}

void writeMeta(std::ostringstream& out, const AnalysisMetadata& meta) {
    out << "\"meta\":{"
        << "\"detectedItemCol\":" << jsonStringOrNull(meta.itemColumn) << ","
        << "\"detectedTransCol\":" << jsonStringOrNull(meta.transactionColumn) << ","
        << "\"nTransactions\":" << meta.transactionCount << ","
        << "\"nUniqueItems\":" << meta.uniqueItems << ","
        << "\"heuristics\":{"
        << "\"strategy\":\"" << TransactionBuilder::strategyName(meta.strategy) << "\","
        << "\"listMode\":" << (meta.listMode ? "true" : "false") << ","
        << "\"itemFromFallback\":" << (meta.itemFromFallback ? "true" : "false") << ","
        << "\"orderColumn\":" << jsonStringOrNull(meta.orderColumn) << ","
        << "\"customerColumn\":" << jsonStringOrNull(meta.customerColumn) << ","
        << "\"dateColumn\":" << jsonStringOrNull(meta.dateColumn) << ","
        << "\"inputRows\":" << meta.inputRows << ","
        << "\"rowsWithoutId\":" << meta.rowsWithoutId
        << "},"
        << "\"minSupport\":" << formatJsonNumber(meta.minSupport) << ","
        << "\"minLift\":" << formatJsonNumber(meta.minLift) << ","
        << "\"maxItemsetSize\":" << meta.maxItemsetSize
        << "}";
}
} // namespace

std::string escapeJsonString(const std::string& input) {
    std::string escaped;
    escaped.reserve(input.size());
    for (char ch : input) {
        switch (ch) {
            case '"': escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\b': escaped += "\\b"; break;
            case '\f': escaped += "\\f"; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(static_cast<unsigned char>(ch)));
                    escaped += buf;
                } else {
                    escaped += ch;
                }
                break;
        }
    }
    return escaped;
}

std::string formatJsonNumber(double value) {
    if (!std::isfinite(value)) return "null";
    return formatRounded(value);
}

std::string formatCsvNumber(double value) {
    if (std::isnan(value)) return "";
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";
    return formatRounded(value);
}

std::vector<FrequentItemset> topSingleItems(const std::vector<FrequentItemset>& itemsets, size_t limit) {
    std::vector<FrequentItemset> out;
    for (const auto& fi : itemsets) {
        if (out.size() >= limit) break;
        if (fi.items.size() == 1) out.push_back(fi);
    }
    return out;
}

void writeRulesCsv(std::ostream& out, const std::vector<AssociationRule>& rules) {
    out << kUtf8Bom << "Antecedents,Consequents,Support,Confidence,Lift\n";
    for (const auto& rule : rules) {
        out << CSVUtils::escapeField(rule.antecedent.label()) << ","
            << CSVUtils::escapeField(rule.consequent.label()) << ","
            << formatCsvNumber(rule.support) << ","
            << formatCsvNumber(rule.confidence) << ","
            << formatCsvNumber(rule.lift) << "\n";
    }
}

void writeItemsetsCsv(std::ostream& out, const std::vector<FrequentItemset>& itemsets) {
    out << kUtf8Bom << "Itemset,Length,Support\n";
    for (const auto& fi : itemsets) {
        out << CSVUtils::escapeField(fi.items.label()) << ","
            << fi.items.size() << ","
            << formatCsvNumber(fi.support) << "\n";
    }
}

void writeRulesCsv(const std::string& path, const std::vector<AssociationRule>& rules) {
    std::ofstream out = openOutput(path);
    writeRulesCsv(out, rules);
    if (!out) throw Basketry::IOException("Failed while writing: " + path);
}

void writeItemsetsCsv(const std::string& path, const std::vector<FrequentItemset>& itemsets) {
    std::ofstream out = openOutput(path);
    writeItemsetsCsv(out, itemsets);
    if (!out) throw Basketry::IOException("Failed while writing: " + path);
}

std::string toJson(const AnalysisResult& result) {
    std::ostringstream out;
    if (!result.ok()) {
        out << "{\"success\":false,"
            << "\"error\":\"" << escapeJsonString(result.message) << "\","
            << "\"status\":\"" << statusName(result.status) << "\","
            << "\"type\":\"basket\"}";
        return out.str();
    }

    const AnalysisMetadata& meta = result.metadata;
    out << "{\"success\":true,\"type\":\"basket\",";
    writeMeta(out, meta);
    out << ",\"analysis\":{\"method\":\"apriori\",\"engine\":\"cpp\",\"library\":\"basketry\"},"
        << "\"totalRules\":" << result.rules.size() << ","
        << "\"totalTransactions\":" << meta.transactionCount << ","
        << "\"totalItems\":" << meta.uniqueItems << ","
        << "\"totalFrequentItemsets\":" << result.itemsets.size() << ",";

    out << "\"rulesTable\":[";
    for (size_t i = 0; i < result.rules.size(); ++i) {
        if (i > 0) out << ",";
        writeRuleRow(out, result.rules[i]);
    }
    out << "],";

    // Single items carry only support; the rule columns stay blank.
    out << "\"singleRulesTable\":[";
    const auto singles = topSingleItems(result.itemsets);
    for (size_t i = 0; i < singles.size(); ++i) {
        if (i > 0) out << ",";
        out << "{\"Antecedents\":\"" << escapeJsonString(singles[i].items.label()) << "\","
            << "\"Consequents\":\"\","
            << "\"Support\":" << formatJsonNumber(singles[i].support) << ","
            << "\"Confidence\":\"\",\"Lift\":\"\"}";
    }
    out << "],";

    out << "\"frequentItemsetsTable\":[";
    for (size_t i = 0; i < result.itemsets.size(); ++i) {
        if (i > 0) out << ",";
        const auto& fi = result.itemsets[i];
        out << "{\"Itemset\":\"" << escapeJsonString(fi.items.label()) << "\","
            << "\"Length\":" << fi.items.size() << ","
            << "\"Support\":" << formatJsonNumber(fi.support) << "}";
    }
    out << "]}";
    return out.str();
}

std::string errorJson(const std::string& error) {
    std::ostringstream out;
    out << "{\"success\":false,\"error\":\"" << escapeJsonString(error) << "\",\"type\":\"basket\"}";
    return out.str();
}

void writeJson(const std::string& path, const AnalysisResult& result) {
    std::ofstream out = openOutput(path);
    out << toJson(result) << "\n";
    if (!out) throw Basketry::IOException("Failed while writing: " + path);
}

} // namespace ResultsExporter
