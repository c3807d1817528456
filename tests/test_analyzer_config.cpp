#include "AnalyzerConfig.h"
#include "BasketryExceptions.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>

namespace {
AnalyzerConfig parseArgs(std::vector<std::string> args) {
    args.insert(args.begin(), "basketry");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);
    return AnalyzerConfig::fromArgs(static_cast<int>(args.size()), argv.data());
}

class TempConfigFile {
public:
    explicit TempConfigFile(const std::string& contents)
        : path_(std::filesystem::temp_directory_path() /
                ("basketry_config_" + std::to_string(reinterpret_cast<std::uintptr_t>(this)) + ".yaml")) {
        std::ofstream out(path_);
        out << contents;
    }
    ~TempConfigFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};
} // namespace

TEST(AnalyzerConfig, DefaultsWithPositionalDataset) {
    const AnalyzerConfig config = parseArgs({"groceries.csv"});
    EXPECT_EQ(config.datasetPath, "groceries.csv");
    EXPECT_DOUBLE_EQ(config.minSupport, 0.001);
    EXPECT_DOUBLE_EQ(config.minLift, 1.0);
    EXPECT_EQ(config.maxItemsetSize, 0u);
    EXPECT_EQ(config.delimiter, '\0');
    EXPECT_EQ(config.topRules, 20u);
    EXPECT_FALSE(config.serve);
}

TEST(AnalyzerConfig, FlagsOverrideDefaults) {
    const AnalyzerConfig config = parseArgs({"data.csv", "--min-support", "0.05", "--min-lift", "1.5",
                                             "--max-itemset-size", "3", "--delimiter", "tab",
                                             "--columns", "order_id, item", "--output-dir", "out",
                                             "--rules-csv", "rules.csv", "--verbose"});
    EXPECT_DOUBLE_EQ(config.minSupport, 0.05);
    EXPECT_DOUBLE_EQ(config.minLift, 1.5);
    EXPECT_EQ(config.maxItemsetSize, 3u);
    EXPECT_EQ(config.delimiter, '\t');
    ASSERT_EQ(config.selectedColumns.size(), 2u);
    EXPECT_EQ(config.selectedColumns[1], "item");
    EXPECT_TRUE(config.verbose);
    EXPECT_EQ(config.resolveOutputPath(config.rulesCsv), (std::filesystem::path("out") / "rules.csv").string());
    EXPECT_EQ(config.resolveOutputPath("/tmp/abs.csv"), "/tmp/abs.csv");

    const AnalyzerOptions options = config.analyzerOptions();
    EXPECT_DOUBLE_EQ(options.minSupport, 0.05);
    EXPECT_EQ(options.selectedColumns, config.selectedColumns);
}

TEST(AnalyzerConfig, HelpShortCircuits) {
    EXPECT_TRUE(parseArgs({"--help"}).showHelp);
    EXPECT_TRUE(parseArgs({"data.csv", "-h", "--min-support", "7"}).showHelp);
}

TEST(AnalyzerConfig, ServeDoesNotNeedDataset) {
    const AnalyzerConfig config = parseArgs({"--serve", "--port", "8080", "--threads", "2"});
    EXPECT_TRUE(config.serve);
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.threads, 2u);
}

TEST(AnalyzerConfig, RejectsInvalidArguments) {
    char program[] = "basketry";
    char* bare[] = {program, nullptr};
    EXPECT_THROW(AnalyzerConfig::fromArgs(1, bare), Basketry::ConfigurationException);

    EXPECT_THROW(parseArgs({"--verbose"}), Basketry::ConfigurationException);
    EXPECT_THROW(parseArgs({"data.csv", "--min-support", "1.5"}), Basketry::ConfigurationException);
    EXPECT_THROW(parseArgs({"data.csv", "--min-support", "abc"}), Basketry::ConfigurationException);
    EXPECT_THROW(parseArgs({"data.csv", "--min-lift", "-1"}), Basketry::ConfigurationException);
    EXPECT_THROW(parseArgs({"data.csv", "--port", "70000"}), Basketry::ConfigurationException);
    EXPECT_THROW(parseArgs({"data.csv", "--threads", "0"}), Basketry::ConfigurationException);
    EXPECT_THROW(parseArgs({"data.csv", "--delimiter", "\""}), Basketry::ConfigurationException);
    EXPECT_THROW(parseArgs({"data.csv", "--unknown-flag", "1"}), Basketry::ConfigurationException);
    EXPECT_THROW(parseArgs({"data.csv", "other.csv"}), Basketry::ConfigurationException);
    EXPECT_THROW(parseArgs({"data.csv", "--top"}), Basketry::ConfigurationException);
}

TEST(AnalyzerConfig, LoadsLooseYamlAndJson) {
    const TempConfigFile yaml(
        "# basket settings\n"
        "dataset: \"orders.csv\"\n"
        "min-support: 0.02\n"
        "MIN_LIFT: 1.2\n"
        "columns: order_id, item\n"
        "delimiter: ;\n");
    const AnalyzerConfig fromYaml = AnalyzerConfig::fromFile(yaml.path(), AnalyzerConfig{});
    EXPECT_EQ(fromYaml.datasetPath, "orders.csv");
    EXPECT_DOUBLE_EQ(fromYaml.minSupport, 0.02);
    EXPECT_DOUBLE_EQ(fromYaml.minLift, 1.2);
    EXPECT_EQ(fromYaml.selectedColumns, (std::vector<std::string>{"order_id", "item"}));
    EXPECT_EQ(fromYaml.delimiter, ';');

    const TempConfigFile json("{\n  \"min_support\": \"0.3\",\n  \"verbose\": \"yes\"\n}\n");
    const AnalyzerConfig fromJson = AnalyzerConfig::fromFile(json.path(), AnalyzerConfig{});
    EXPECT_DOUBLE_EQ(fromJson.minSupport, 0.3);
    EXPECT_TRUE(fromJson.verbose);
}

TEST(AnalyzerConfig, CommandLineWinsOverConfigFile) {
    const TempConfigFile file("dataset: from_file.csv\nmin_support: 0.2\nmin_lift: 2\n");
    const AnalyzerConfig config = parseArgs({"cli.csv", "--config", file.path(), "--min-lift", "3"});
    EXPECT_EQ(config.datasetPath, "cli.csv");
    EXPECT_DOUBLE_EQ(config.minSupport, 0.2);
    EXPECT_DOUBLE_EQ(config.minLift, 3.0);
}

TEST(AnalyzerConfig, ConfigFileErrorsNameTheLine) {
    const TempConfigFile file("min_support: 0.1\nbogus_key: 1\n");
    try {
        AnalyzerConfig::fromFile(file.path(), AnalyzerConfig{});
        FAIL() << "expected ConfigurationException";
    } catch (const Basketry::ConfigurationException& e) {
        EXPECT_NE(std::string(e.what()).find("line 2"), std::string::npos);
    }
    EXPECT_THROW(AnalyzerConfig::fromFile("/nonexistent/basketry.yaml", AnalyzerConfig{}),
                 Basketry::ConfigurationException);
}

TEST(AnalyzerConfig, ValidateChecksServiceSettings) {
    AnalyzerConfig config;
    config.serve = true;
    EXPECT_NO_THROW(config.validate());
    config.host = "  ";
    EXPECT_THROW(config.validate(), Basketry::ConfigurationException);

    AnalyzerConfig columns;
    columns.datasetPath = "x.csv";
    columns.selectedColumns = {"item", " "};
    EXPECT_THROW(columns.validate(), Basketry::ConfigurationException);
}
