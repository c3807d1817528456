#include "AnalyzerConfig.h"
#include "BasketryExceptions.h"
#include "CommonUtils.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <limits>
#include <unordered_map>
#include <utility>

namespace {
std::vector<std::string> splitCSV(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == ',') {
            std::string t = CommonUtils::trim(cur);
            if (!t.empty()) out.push_back(t);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    std::string t = CommonUtils::trim(cur);
    if (!t.empty()) out.push_back(t);
    return out;
}

template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Basketry::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Basketry::BasketryException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Basketry::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    bool escaped = false;
    for (char c : line) {
        if (escaped) {
            out.push_back(c);
            escaped = false;
            continue;
        }
        if (c == '\\') {
            out.push_back(c);
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) {
            continue;
        }
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    bool escaped = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) {
            return i;
        }
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(std::string key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw Basketry::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

size_t parseSizeStrict(const std::string& value, const std::string& key, size_t minValue) {
    if (!value.empty() && value.front() == '-') {
        throw Basketry::ConfigurationException("Invalid unsigned integer for " + key + ": " + value);
    }
    unsigned long long parsed = parseNumericStrict<unsigned long long>(
        value,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return std::stoull(v, pos); });
    if (parsed > static_cast<unsigned long long>(std::numeric_limits<size_t>::max())) {
        throw Basketry::ConfigurationException("Value for " + key + " exceeds size range");
    }
    if (parsed < minValue) {
        throw Basketry::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return static_cast<size_t>(parsed);
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    double parsed = parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (!(parsed >= minValue)) {
        throw Basketry::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Basketry::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

char parseDelimiter(const std::string& raw, const std::string& key) {
    const std::string lowered = CommonUtils::toLower(raw);
    if (lowered == "auto") return '\0';
    if (lowered == "tab" || raw == "\\t") return '\t';
    if (raw.size() != 1) throw Basketry::ConfigurationException(key + " expects a single character, 'tab' or 'auto'");
    if (raw[0] == '"' || raw[0] == '\n' || raw[0] == '\r') {
        throw Basketry::ConfigurationException(key + " cannot be a quote or line break");
    }
    return raw[0];
}

void assignKeyValue(AnalyzerConfig& config, const std::string& key, const std::string& value) {
    if (key == "delimiter") {
        config.delimiter = parseDelimiter(value, "delimiter");
        return;
    }
    if (key == "columns") {
        config.selectedColumns = splitCSV(value);
        return;
    }
    if (key == "port") {
        config.port = parseIntStrict(value, key, 1);
        return;
    }

    struct SizeRule {
        size_t AnalyzerConfig::*member;
        size_t minValue;
    };
    struct DoubleRule {
        double AnalyzerConfig::*member;
        double minValue;
    };

    static const std::unordered_map<std::string, std::string AnalyzerConfig::*> stringFields = {
        {"dataset", &AnalyzerConfig::datasetPath},
        {"output_dir", &AnalyzerConfig::outputDir},
        {"rules_csv", &AnalyzerConfig::rulesCsv},
        {"itemsets_csv", &AnalyzerConfig::itemsetsCsv},
        {"json", &AnalyzerConfig::jsonOutput},
        {"report", &AnalyzerConfig::reportFile},
        {"host", &AnalyzerConfig::host}
    };
    static const std::unordered_map<std::string, bool AnalyzerConfig::*> boolFields = {
        {"verbose", &AnalyzerConfig::verbose},
        {"serve", &AnalyzerConfig::serve}
    };
    static const std::unordered_map<std::string, DoubleRule> doubleFields = {
        {"min_support", {&AnalyzerConfig::minSupport, 0.0}},
        {"min_lift", {&AnalyzerConfig::minLift, 0.0}}
    };
    static const std::unordered_map<std::string, SizeRule> sizeFields = {
        {"max_itemset_size", {&AnalyzerConfig::maxItemsetSize, 0}},
        {"top", {&AnalyzerConfig::topRules, 0}},
        {"threads", {&AnalyzerConfig::threads, 1}},
        {"max_body_bytes", {&AnalyzerConfig::maxBodyBytes, 1}}
    };

    if (const auto it = stringFields.find(key); it != stringFields.end()) {
        config.*(it->second) = value;
        return;
    }
    if (const auto it = boolFields.find(key); it != boolFields.end()) {
        config.*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (const auto it = doubleFields.find(key); it != doubleFields.end()) {
        config.*(it->second.member) = parseDoubleStrict(value, key, it->second.minValue);
        return;
    }
    if (const auto it = sizeFields.find(key); it != sizeFields.end()) {
        config.*(it->second.member) = parseSizeStrict(value, key, it->second.minValue);
        return;
    }
    throw Basketry::ConfigurationException("Unknown configuration key: " + key);
}
} // namespace

std::string AnalyzerConfig::usage() {
    return "Usage: basketry <transactions.csv> [--config path] [--min-support 0..1] [--min-lift >=0] "
           "[--max-itemset-size N] [--delimiter auto|tab|C] [--columns a,b,c] [--output-dir dir] "
           "[--rules-csv file] [--itemsets-csv file] [--json file] [--report file.md] [--top N] [--verbose]\n"
           "       basketry --serve [--host H] [--port P] [--threads N] [--min-support 0..1] [--min-lift >=0]";
}

AnalyzerConfig AnalyzerConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2) {
        throw Basketry::ConfigurationException(usage());
    }

    AnalyzerConfig config;
    std::string configPath;
    // Values given on the command line win over the config file.
    std::vector<std::pair<std::string, std::string>> overrides;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
            return config;
        }
        if (arg == "--verbose") {
            overrides.emplace_back("verbose", "true");
        } else if (arg == "--serve") {
            overrides.emplace_back("serve", "true");
        } else if (arg == "--config") {
            if (i + 1 >= argc) throw Basketry::ConfigurationException("--config expects a value");
            configPath = argv[++i];
        } else if (arg.rfind("--", 0) == 0) {
            if (i + 1 >= argc) throw Basketry::ConfigurationException(arg + " expects a value");
            std::string key = normalizeConfigKey(arg.substr(2));
            if (key == "json_output") key = "json";
            overrides.emplace_back(key, argv[++i]);
        } else if (config.datasetPath.empty()) {
            config.datasetPath = arg;
        } else {
            throw Basketry::ConfigurationException("Unexpected argument: " + arg);
        }
    }

    if (!configPath.empty()) {
        const std::string positional = config.datasetPath;
        config = fromFile(configPath, config);
        if (!positional.empty()) config.datasetPath = positional;
    }

    for (const auto& [key, value] : overrides) {
        try {
            assignKeyValue(config, key, value);
        } catch (const Basketry::BasketryException& ex) {
            throw Basketry::ConfigurationException("--" + key + ": " + ex.what());
        }
    }

    config.validate();
    return config;
}

AnalyzerConfig AnalyzerConfig::fromFile(const std::string& configPath, const AnalyzerConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Basketry::ConfigurationException("Could not open config file: " + configPath);

    AnalyzerConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Loose YAML (key: value) and loose JSON ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            assignKeyValue(config, key, value);
        } catch (const Basketry::BasketryException& ex) {
            throw Basketry::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    return config;
}

std::string AnalyzerConfig::resolveOutputPath(const std::string& file) const {
    if (file.empty() || outputDir.empty()) return file;
    const std::filesystem::path p(file);
    if (p.is_absolute()) return file;
    return (std::filesystem::path(outputDir) / p).string();
}

AnalyzerOptions AnalyzerConfig::analyzerOptions() const {
    AnalyzerOptions options;
    options.minSupport = minSupport;
    options.minLift = minLift;
    options.maxItemsetSize = maxItemsetSize;
    options.verbose = verbose;
    options.selectedColumns = selectedColumns;
    return options;
}

void AnalyzerConfig::validate() const {
    if (!serve && datasetPath.empty()) {
        throw Basketry::ConfigurationException("dataset path is required");
    }
    if (!(minSupport >= 0.0 && minSupport <= 1.0)) {
        throw Basketry::ConfigurationException("min_support must be within [0,1]");
    }
    if (!(minLift >= 0.0)) {
        throw Basketry::ConfigurationException("min_lift must be >= 0");
    }
    if (port < 1 || port > 65535) {
        throw Basketry::ConfigurationException("port must be within [1,65535]");
    }
    if (threads < 1) {
        throw Basketry::ConfigurationException("threads must be >= 1");
    }
    if (maxBodyBytes < 1) {
        throw Basketry::ConfigurationException("max_body_bytes must be >= 1");
    }
    if (serve && CommonUtils::trim(host).empty()) {
        throw Basketry::ConfigurationException("host cannot be empty when serving");
    }
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r') {
        throw Basketry::ConfigurationException("delimiter cannot be a quote or line break");
    }
    for (const auto& column : selectedColumns) {
        if (CommonUtils::trim(column).empty()) {
            throw Basketry::ConfigurationException("columns cannot contain empty names");
        }
    }
}
