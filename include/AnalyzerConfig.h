#pragma once
#include "BasketAnalyzer.h"

#include <cstddef>
#include <string>
#include <vector>

struct AnalyzerConfig {
    std::string datasetPath;
    // '\0' sniffs the delimiter from the header line.
    char delimiter = '\0';
    std::vector<std::string> selectedColumns;

    double minSupport = 0.001;
    double minLift = 1.0;
    size_t maxItemsetSize = 0; // 0 => unlimited

    std::string outputDir;
    std::string rulesCsv;
    std::string itemsetsCsv;
    std::string jsonOutput;
    std::string reportFile;
    size_t topRules = 20;
    bool verbose = false;

    bool serve = false;
    std::string host = "0.0.0.0";
    int port = 5000;
    size_t threads = 8;
    size_t maxBodyBytes = 500u * 1024u * 1024u;

    bool showHelp = false;

    static std::string usage();
    static AnalyzerConfig fromArgs(int argc, char* argv[]);
    static AnalyzerConfig fromFile(const std::string& configPath, const AnalyzerConfig& base);

    /**
     * @brief Joins `file` onto outputDir unless it is absolute or outputDir is unset.
     */
    std::string resolveOutputPath(const std::string& file) const;
    AnalyzerOptions analyzerOptions() const;

    /**
     * @throws Basketry::ConfigurationException on the first invalid setting.
     */
    void validate() const;
};
