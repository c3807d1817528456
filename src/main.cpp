#include "AnalyzerConfig.h"
#include "BasketAnalyzer.h"
#include "BasketryExceptions.h"
#include "ReportEngine.h"
#include "ResultsExporter.h"
#include "Table.h"
#include "TerminalUI.h"
#ifdef BASKETRY_WITH_SERVICE
#include "BasketService.h"
#endif

#include <filesystem>
#include <iostream>
#include <string>

namespace {
int runService(const AnalyzerConfig& config) {
#ifdef BASKETRY_WITH_SERVICE
    RequestMonitor monitor;
    BasketService service(monitor);
    BasketService::Config serviceConfig;
    serviceConfig.host = config.host;
    serviceConfig.port = config.port;
    serviceConfig.threadCount = config.threads;
    serviceConfig.maxBodyBytes = config.maxBodyBytes;
    serviceConfig.analyzer = config.analyzerOptions();
    return service.start(serviceConfig);
#else
    (void)config;
    std::cerr << "[Basketry Error] This build has no HTTP service (cpp-httplib was not found at configure time)\n";
    return 1;
#endif
}

void ensureOutputDir(const AnalyzerConfig& config) {
    if (config.outputDir.empty()) return;
    std::error_code ec;
    std::filesystem::create_directories(config.outputDir, ec);
    if (ec) {
        throw Basketry::IOException("Could not create output directory '" + config.outputDir + "': " + ec.message());
    }
}

void writeOutputs(const AnalyzerConfig& config, const AnalysisResult& result) {
    ensureOutputDir(config);
    if (!config.rulesCsv.empty()) {
        const std::string path = config.resolveOutputPath(config.rulesCsv);
        ResultsExporter::writeRulesCsv(path, result.rules);
        std::cout << "[Basketry] Rules written to " << path << "\n";
    }
    if (!config.itemsetsCsv.empty()) {
        const std::string path = config.resolveOutputPath(config.itemsetsCsv);
        ResultsExporter::writeItemsetsCsv(path, result.itemsets);
        std::cout << "[Basketry] Frequent itemsets written to " << path << "\n";
    }
    if (!config.jsonOutput.empty()) {
        const std::string path = config.resolveOutputPath(config.jsonOutput);
        ResultsExporter::writeJson(path, result);
        std::cout << "[Basketry] JSON document written to " << path << "\n";
    }
    if (!config.reportFile.empty()) {
        const std::string path = config.resolveOutputPath(config.reportFile);
        buildAnalysisReport(result, config.datasetPath).save(path);
        std::cout << "[Basketry] Report written to " << path << "\n";
    }
}
} // namespace

int main(int argc, char* argv[]) {
    AnalyzerConfig config;
    try {
        config = AnalyzerConfig::fromArgs(argc, argv);
    } catch (const Basketry::BasketryException& e) {
        std::cerr << "[Basketry Error] " << e.what() << "\n";
        return 1;
    }

    if (config.showHelp) {
        std::cout << AnalyzerConfig::usage() << "\n";
        return 0;
    }
    if (config.serve) {
        return runService(config);
    }

    Table table;
    try {
        LoadReport loadReport;
        table = TableLoader::fromFile(config.datasetPath, config.delimiter, &loadReport);
        TerminalUI::printLoadSummary(config.datasetPath, table, loadReport);
    } catch (const Basketry::BasketryException& e) {
        std::cerr << "[Basketry Error] " << e.what() << "\n";
        return 1;
    }

    AnalysisResult result;
    try {
        result = BasketAnalyzer(config.analyzerOptions()).analyze(table);
    } catch (const Basketry::NoItemColumnException& e) {
        std::cerr << "[Basketry Error] " << e.what() << "\n";
        return 1;
    }

    if (!result.ok()) {
        std::cerr << "[Basketry Error] Analysis " << statusName(result.status) << ": " << result.message << "\n";
        return 1;
    }

    TerminalUI::printDetectionSummary(result.metadata);
    if (result.metadata.transactionCount == 0) {
        std::cout << "[Basketry Warning] " << result.message << "\n";
    }
    TerminalUI::printRulesTable(result.rules, config.topRules);
    TerminalUI::printItemsetsTable(result.itemsets, config.topRules);

    try {
        writeOutputs(config, result);
    } catch (const Basketry::BasketryException& e) {
        std::cerr << "[Basketry Error] " << e.what() << "\n";
        return 1;
    }

    std::cout << "[Basketry] " << result.metadata.totalRules << " rules from " << result.metadata.transactionCount
              << " transactions (" << result.metadata.uniqueItems << " items)\n";
    return 0;
}
