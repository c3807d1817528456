#pragma once

#include "BasketAnalyzer.h"

#include <atomic>
#include <cstdint>
#include <map>
#include <string>

struct MonitoringSnapshot {
    uint64_t totalRequests = 0;
    uint64_t analyzeRequests = 0;
    uint64_t healthRequests = 0;
    uint64_t errorRequests = 0;
    uint64_t totalRules = 0;
    double averageLatencyMs = 0.0;
};

class RequestMonitor {
public:
    void recordSuccess(const std::string& endpoint, double latencyMs, size_t rules);
    void recordError(const std::string& endpoint, double latencyMs);
    MonitoringSnapshot snapshot() const;

private:
    void countEndpoint(const std::string& endpoint);

    std::atomic<uint64_t> totalRequests{0};
    std::atomic<uint64_t> analyzeRequests{0};
    std::atomic<uint64_t> healthRequests{0};
    std::atomic<uint64_t> errorRequests{0};
    std::atomic<uint64_t> totalRules{0};
    std::atomic<uint64_t> totalLatencyMicros{0};
};

struct ServiceReply {
    int status = 500;
    std::string body;
    size_t rules = 0;
};

namespace BasketHandlers {

std::string healthJson();

/**
 * @brief Runs one analysis over a CSV request body.
 * @details Query parameters: min_support, min_lift, delimiter (auto|tab|C), columns (a,b,c).
 * Replies 200 with the basket document, 400 for bad parameters or unreadable CSV, 422 when no
 * item column exists and 500 when the analysis fails.
 */
ServiceReply analyze(const std::string& csvBody,
                     const std::map<std::string, std::string>& params,
                     const AnalyzerOptions& defaults);

} // namespace BasketHandlers

class BasketService {
public:
    struct Config {
        std::string host = "0.0.0.0";
        int port = 5000;
        size_t threadCount = 8;
        size_t maxBodyBytes = 500u * 1024u * 1024u;
        AnalyzerOptions analyzer;
    };

    explicit BasketService(RequestMonitor& monitor);
    int start(const Config& config);

private:
    RequestMonitor& monitor;
};
