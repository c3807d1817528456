#pragma once

#include "AprioriMiner.h"
#include "RuleGenerator.h"
#include "Table.h"
#include "TransactionBuilder.h"

#include <string>
#include <vector>

enum class AnalysisStatus { SUCCESS, EMPTY_INPUT, FAILED };

struct AnalysisMetadata {
    std::string itemColumn;
    std::string transactionColumn;
    GroupingStrategy strategy = GroupingStrategy::ROW_GROUP;
    // Empty when the role was not detected.
    std::string orderColumn;
    std::string customerColumn;
    std::string dateColumn;
    bool listMode = false;
    bool itemFromFallback = false;

    size_t inputRows = 0;
    size_t transactionCount = 0;
    size_t uniqueItems = 0;
    size_t rowsWithoutId = 0;

    double minSupport = 0.0;
    double minLift = 0.0;
    size_t maxItemsetSize = 0;

    size_t totalRules = 0;
    size_t totalItemsets = 0;
};

struct AnalysisResult {
    AnalysisStatus status = AnalysisStatus::FAILED;
    std::string message;
    std::vector<AssociationRule> rules;
    std::vector<FrequentItemset> itemsets;
    AnalysisMetadata metadata;

    bool ok() const noexcept { return status == AnalysisStatus::SUCCESS; }
};

struct AnalyzerOptions {
    double minSupport = 0.001;
    double minLift = 1.0;
    size_t maxItemsetSize = 0;
    bool verbose = false;
    // When non-empty the table is reduced to these columns before detection.
    std::vector<std::string> selectedColumns;
};

std::string statusName(AnalysisStatus status);

class BasketAnalyzer {
public:
    explicit BasketAnalyzer(AnalyzerOptions options = {});

    /**
     * @brief Detects columns, builds transactions, mines itemsets and derives rules.
     * @post On failure no rules or itemsets are returned and status/message explain why.
     * @throws Basketry::NoItemColumnException when no item column can be determined.
     */
    AnalysisResult analyze(const Table& table) const;
    AnalysisResult analyze(const Table& table, double minSupport, double minLift) const;

    const AnalyzerOptions& options() const noexcept { return options_; }

private:
    AnalysisResult run(const Table& table, const AnalyzerOptions& options) const;

    AnalyzerOptions options_;
};
