#pragma once

#include "BasketAnalyzer.h"

#include <ostream>
#include <string>
#include <vector>

namespace ResultsExporter {

constexpr size_t kSingleItemLimit = 20;
constexpr int kRoundDigits = 6;

std::string escapeJsonString(const std::string& input);

// Rounded to kRoundDigits; non-finite values become null.
std::string formatJsonNumber(double value);

// Rounded to kRoundDigits; infinity is written as inf.
std::string formatCsvNumber(double value);

// The first `limit` length-1 itemsets of a flattened (support-ordered) list.
std::vector<FrequentItemset> topSingleItems(const std::vector<FrequentItemset>& itemsets,
                                            size_t limit = kSingleItemLimit);

/**
 * @brief Writes Antecedents,Consequents,Support,Confidence,Lift rows.
 * @details A UTF-8 BOM precedes the header so spreadsheet tools detect the encoding.
 */
void writeRulesCsv(std::ostream& out, const std::vector<AssociationRule>& rules);
void writeItemsetsCsv(std::ostream& out, const std::vector<FrequentItemset>& itemsets);

/**
 * @throws Basketry::IOException when the file cannot be written.
 */
void writeRulesCsv(const std::string& path, const std::vector<AssociationRule>& rules);
void writeItemsetsCsv(const std::string& path, const std::vector<FrequentItemset>& itemsets);

/**
 * @brief Serializes an analysis into the basket JSON document.
 * @details Success: success, type, meta, analysis, totals, rulesTable, singleRulesTable,
 * frequentItemsetsTable. Failure: success=false, error, status, type.
 */
std::string toJson(const AnalysisResult& result);
std::string errorJson(const std::string& error);

void writeJson(const std::string& path, const AnalysisResult& result);

} // namespace ResultsExporter
