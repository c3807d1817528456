#include "BasketAnalyzer.h"
#include "BasketryExceptions.h"
#include "ColumnDetector.h"

#include <iostream>
#include <utility>

namespace {
std::string columnName(const Table& table, const std::optional<size_t>& index) {
    return index ? table.column(*index).name : std::string();
}

AnalysisResult failure(AnalysisResult result, AnalysisStatus status, std::string message) {
    result.status = status;
    result.message = std::move(message);
    result.rules.clear();
    result.itemsets.clear();
    result.metadata.totalRules = 0;
    result.metadata.totalItemsets = 0;
    return result;
}
} // namespace

std::string statusName(AnalysisStatus status) {
    switch (status) {
        case AnalysisStatus::SUCCESS: return "success";
        case AnalysisStatus::EMPTY_INPUT: return "empty_input";
        case AnalysisStatus::FAILED: return "failed";
    }
    return "failed";
}

BasketAnalyzer::BasketAnalyzer(AnalyzerOptions options) : options_(std::move(options)) {}

AnalysisResult BasketAnalyzer::analyze(const Table& table) const {
    return run(table, options_);
}

AnalysisResult BasketAnalyzer::analyze(const Table& table, double minSupport, double minLift) const {
    AnalyzerOptions options = options_;
    options.minSupport = minSupport;
    options.minLift = minLift;
    return run(table, options);
}

AnalysisResult BasketAnalyzer::run(const Table& input, const AnalyzerOptions& options) const {
    AnalysisResult result;
    AnalysisMetadata& meta = result.metadata;
    meta.inputRows = input.rowCount();
    meta.minSupport = options.minSupport;
    meta.minLift = options.minLift;
    meta.maxItemsetSize = options.maxItemsetSize;

    try {
        if (!(options.minSupport >= 0.0 && options.minSupport <= 1.0)) {
            throw Basketry::ConfigurationException("min_support must be within [0, 1]");
        }
        if (!(options.minLift >= 0.0)) {
            throw Basketry::ConfigurationException("min_lift must be >= 0");
        }

        Table selected;
        const Table* table = &input;
        if (!options.selectedColumns.empty()) {
            selected = input.selectColumns(options.selectedColumns);
            table = &selected;
        }

        const DetectionResult detection = ColumnDetector::detect(*table);
        meta.itemColumn = columnName(*table, detection.itemColumn);
        meta.orderColumn = columnName(*table, detection.orderColumn);
        meta.customerColumn = columnName(*table, detection.customerColumn);
        meta.dateColumn = columnName(*table, detection.dateColumn);
        meta.listMode = detection.listMode;
        meta.itemFromFallback = detection.itemFromFallback;
        if (options.verbose) {
            std::cout << "[Basketry] Item column: '" << meta.itemColumn << "'"
                      << (detection.listMode ? " (item list)" : "")
                      << (detection.itemFromFallback ? " (cardinality fallback)" : "") << "\n";
        }

        const TransactionSet transactions = TransactionBuilder::build(*table, detection);
        meta.transactionColumn = transactions.transactionColumn;
        meta.strategy = transactions.strategy;
        meta.transactionCount = transactions.transactions.size();
        meta.uniqueItems = transactions.uniqueItems;
        meta.rowsWithoutId = transactions.rowsWithoutId;
        if (options.verbose) {
            std::cout << "[Basketry] Grouping by " << TransactionBuilder::strategyName(transactions.strategy)
                      << " ('" << meta.transactionColumn << "'): " << meta.transactionCount
                      << " transactions, " << meta.uniqueItems << " distinct items\n";
        }

        if (transactions.transactions.empty()) {
            result.status = AnalysisStatus::SUCCESS;
            result.message = "No transactions remained after cleaning";
            return result;
        }

        const FrequentItemsets frequent =
            AprioriMiner::mine(transactions.transactions, options.minSupport, options.maxItemsetSize);
        result.rules = RuleGenerator::generate(frequent, options.minLift);
        result.itemsets = frequent.flatten();
        meta.totalRules = result.rules.size();
        meta.totalItemsets = result.itemsets.size();
        if (options.verbose) {
            std::cout << "[Basketry] Mined " << meta.totalItemsets << " frequent itemsets and "
                      << meta.totalRules << " rules\n";
        }

        result.status = AnalysisStatus::SUCCESS;
        result.message = "Analysis complete";
        return result;
    } catch (const Basketry::NoItemColumnException&) {
        throw;
    } catch (const Basketry::EmptyInputException& e) {
        return failure(std::move(result), AnalysisStatus::EMPTY_INPUT, e.what());
    } catch (const std::exception& e) {
        return failure(std::move(result), AnalysisStatus::FAILED, e.what());
    }
}
