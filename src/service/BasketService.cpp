#include "BasketService.h"

#include "ResultsExporter.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <sstream>

#include <httplib.h>

namespace {
using Clock = std::chrono::steady_clock;

void setJsonResponse(httplib::Response& response, int status, const std::string& payload) {
    response.status = status;
    response.set_content(payload, "application/json");
}

double elapsedMs(Clock::time_point started) {
    return std::chrono::duration<double, std::milli>(Clock::now() - started).count();
}

void logMonitoringLine(const std::string& endpoint, int status, double latencyMs, const MonitoringSnapshot& snapshot) {
    std::ostringstream line;
    line << "[BasketryService][Monitor] endpoint=" << endpoint
         << " status=" << status
         << " total_requests=" << snapshot.totalRequests
         << " errors=" << snapshot.errorRequests
         << " latency_ms=" << latencyMs
         << " avg_latency_ms=" << snapshot.averageLatencyMs
         << " rules=" << snapshot.totalRules;
    std::cout << line.str() << "\n";
}

std::map<std::string, std::string> queryParams(const httplib::Request& request) {
    std::map<std::string, std::string> out;
    for (const auto& [key, value] : request.params) {
        out.emplace(key, value);
    }
    return out;
}
} // namespace

BasketService::BasketService(RequestMonitor& monitorRef) : monitor(monitorRef) {}

int BasketService::start(const Config& config) {
    httplib::Server server;
    server.new_task_queue = [threadCount = std::max<size_t>(1, config.threadCount)] {
        return new httplib::ThreadPool(static_cast<int>(threadCount));
    };
    server.set_payload_max_length(config.maxBodyBytes);

    server.Get("/api/health", [this](const httplib::Request&, httplib::Response& response) {
        const auto started = Clock::now();
        setJsonResponse(response, 200, BasketHandlers::healthJson());
        const double latencyMs = elapsedMs(started);
        monitor.recordSuccess("/api/health", latencyMs, 0);
        logMonitoringLine("/api/health", 200, latencyMs, monitor.snapshot());
    });

    const AnalyzerOptions defaults = config.analyzer;
    server.Post("/api/analyze", [this, defaults](const httplib::Request& request, httplib::Response& response) {
        const auto started = Clock::now();
        ServiceReply reply;
        try {
            reply = BasketHandlers::analyze(request.body, queryParams(request), defaults);
        } catch (const std::exception& e) {
            reply.status = 500;
            reply.body = ResultsExporter::errorJson(e.what());
        }

        setJsonResponse(response, reply.status, reply.body);
        const double latencyMs = elapsedMs(started);
        if (reply.status == 200) {
            monitor.recordSuccess("/api/analyze", latencyMs, reply.rules);
        } else {
            monitor.recordError("/api/analyze", latencyMs);
        }
        logMonitoringLine("/api/analyze", reply.status, latencyMs, monitor.snapshot());
    });

    std::cout << "[BasketryService] host=" << config.host
              << " port=" << config.port
              << " threads=" << std::max<size_t>(1, config.threadCount)
              << " min_support=" << config.analyzer.minSupport
              << " min_lift=" << config.analyzer.minLift
              << " max_body_bytes=" << config.maxBodyBytes
              << "\n";

    if (!server.listen(config.host.c_str(), config.port)) {
        std::cerr << "[BasketryService] failed_to_bind host=" << config.host << " port=" << config.port << "\n";
        return 1;
    }

    return 0;
}
