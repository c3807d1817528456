#pragma once
#include "BasketAnalyzer.h"
#include "Table.h"

#include <iostream>
#include <vector>
#include <string>

class TerminalUI {
public:
    static void printLoadSummary(const std::string& source, const Table& table, const LoadReport& report, std::ostream& out = std::cout);
    static void printDetectionSummary(const AnalysisMetadata& meta, std::ostream& out = std::cout);

    // At most `limit` rows each; 0 prints everything.
    static void printRulesTable(const std::vector<AssociationRule>& rules, size_t limit, std::ostream& out = std::cout);
    static void printItemsetsTable(const std::vector<FrequentItemset>& itemsets, size_t limit, std::ostream& out = std::cout);
};
