#include "BasketService.h"

#include "BasketryExceptions.h"
#include "CommonUtils.h"
#include "ResultsExporter.h"
#include "Table.h"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <utility>

namespace {
long long toLatencyMicros(double latencyMs) {
    if (!std::isfinite(latencyMs) || latencyMs <= 0.0) return 0;
    return static_cast<long long>(std::llround(latencyMs * 1000.0));
}

std::string utcTimestamp() {
    const std::time_t now = std::time(nullptr);
    std::tm tmUtc{};
    gmtime_r(&now, &tmUtc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tmUtc);
    return std::string(buf);
}

double parseThreshold(const std::string& value, const std::string& key) {
    try {
        size_t pos = 0;
        const double parsed = std::stod(value, &pos);
        if (pos != value.size()) throw Basketry::ConfigurationException("Invalid number for " + key + ": " + value);
        return parsed;
    } catch (const Basketry::BasketryException&) {
        throw;
    } catch (const std::exception&) {
        throw Basketry::ConfigurationException("Invalid number for " + key + ": " + value);
    }
}

char parseDelimiterParam(const std::string& raw) {
    const std::string lowered = CommonUtils::toLower(raw);
    if (raw.empty() || lowered == "auto") return TableLoader::kAutoDelimiter;
    if (lowered == "tab" || raw == "\\t") return '\t';
    if (raw.size() != 1) throw Basketry::ConfigurationException("delimiter expects a single character, 'tab' or 'auto'");
    return raw[0];
}

AnalyzerOptions optionsFromParams(const std::map<std::string, std::string>& params, const AnalyzerOptions& defaults) {
    AnalyzerOptions options = defaults;
    if (auto it = params.find("min_support"); it != params.end()) {
        options.minSupport = parseThreshold(it->second, "min_support");
    }
    if (auto it = params.find("min_lift"); it != params.end()) {
        options.minLift = parseThreshold(it->second, "min_lift");
    }
    if (!(options.minSupport >= 0.0 && options.minSupport <= 1.0)) {
        throw Basketry::ConfigurationException("min_support must be within [0,1]");
    }
    if (!(options.minLift >= 0.0)) {
        throw Basketry::ConfigurationException("min_lift must be >= 0");
    }
    if (auto it = params.find("columns"); it != params.end()) {
        options.selectedColumns = CommonUtils::splitOnAny(it->second, ",");
    }
    options.verbose = false;
    return options;
}

ServiceReply reply(int status, std::string body, size_t rules = 0) {
    ServiceReply out;
    out.status = status;
    out.body = std::move(body);
    out.rules = rules;
    return out;
}
} // namespace

void RequestMonitor::countEndpoint(const std::string& endpoint) {
    totalRequests.fetch_add(1, std::memory_order_relaxed);
    if (endpoint == "/api/analyze") {
        analyzeRequests.fetch_add(1, std::memory_order_relaxed);
    } else if (endpoint == "/api/health") {
        healthRequests.fetch_add(1, std::memory_order_relaxed);
    }
}

void RequestMonitor::recordSuccess(const std::string& endpoint, double latencyMs, size_t rules) {
    countEndpoint(endpoint);
    totalRules.fetch_add(static_cast<uint64_t>(rules), std::memory_order_relaxed);
    totalLatencyMicros.fetch_add(static_cast<uint64_t>(std::max<long long>(0, toLatencyMicros(latencyMs))),
                                 std::memory_order_relaxed);
}

void RequestMonitor::recordError(const std::string& endpoint, double latencyMs) {
    countEndpoint(endpoint);
    errorRequests.fetch_add(1, std::memory_order_relaxed);
    totalLatencyMicros.fetch_add(static_cast<uint64_t>(std::max<long long>(0, toLatencyMicros(latencyMs))),
                                 std::memory_order_relaxed);
}

MonitoringSnapshot RequestMonitor::snapshot() const {
    MonitoringSnapshot out;
    out.totalRequests = totalRequests.load(std::memory_order_relaxed);
    out.analyzeRequests = analyzeRequests.load(std::memory_order_relaxed);
    out.healthRequests = healthRequests.load(std::memory_order_relaxed);
    out.errorRequests = errorRequests.load(std::memory_order_relaxed);
    out.totalRules = totalRules.load(std::memory_order_relaxed);

    const uint64_t latencyMicros = totalLatencyMicros.load(std::memory_order_relaxed);
    if (out.totalRequests > 0) {
        out.averageLatencyMs = static_cast<double>(latencyMicros) / static_cast<double>(out.totalRequests) / 1000.0;
    }
    return out;
}

namespace BasketHandlers {

std::string healthJson() {
    return "{\"status\":\"healthy\",\"timestamp\":\"" + utcTimestamp() +
           "\",\"message\":\"Basket analysis service is running\"}";
}

ServiceReply analyze(const std::string& csvBody,
                     const std::map<std::string, std::string>& params,
                     const AnalyzerOptions& defaults) {
    AnalyzerOptions options;
    Table table;
    try {
        options = optionsFromParams(params, defaults);
        const auto delimiterParam = params.find("delimiter");
        const char delimiter = delimiterParam == params.end() ? TableLoader::kAutoDelimiter
                                                              : parseDelimiterParam(delimiterParam->second);
        if (CommonUtils::trim(csvBody).empty()) {
            throw Basketry::DatasetException("Request body must contain CSV text");
        }
        table = TableLoader::fromString(csvBody, delimiter);
        for (const auto& name : options.selectedColumns) {
            if (table.findColumnIndex(name) < 0) {
                throw Basketry::ConfigurationException("Selected column not found: " + name);
            }
        }
    } catch (const std::exception& e) {
        return reply(400, ResultsExporter::errorJson(e.what()));
    }

    try {
        const AnalysisResult result = BasketAnalyzer(options).analyze(table);
        switch (result.status) {
            case AnalysisStatus::SUCCESS:
                return reply(200, ResultsExporter::toJson(result), result.rules.size());
            case AnalysisStatus::EMPTY_INPUT:
                return reply(400, ResultsExporter::toJson(result));
            case AnalysisStatus::FAILED:
                break;
        }
        return reply(500, ResultsExporter::toJson(result));
    } catch (const Basketry::NoItemColumnException& e) {
        return reply(422, ResultsExporter::errorJson(e.what()));
    } catch (const std::exception& e) {
        return reply(500, ResultsExporter::errorJson(e.what()));
    }
}

} // namespace BasketHandlers
