/**
 * @file metrics_server.cpp
 * @brief /metrics endpoint on a cpp-httplib server thread
 */

#include <metrics/metrics_server.hpp>
#include <utils/logger.hpp>
#include <httplib.h>

namespace Driftwatch {

MetricsServer::MetricsServer(const MetricsRegistry& registry)
    : registry_(registry), server_(std::make_unique<httplib::Server>()) {
    server_->Get("/metrics", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(registry_.render(), MetricsRegistry::kContentType);
    });
}

MetricsServer::~MetricsServer() {
    stop();
}

bool MetricsServer::start(const std::string& host, int port) {
    if (running()) return true;

    bool bound = false;
    if (port == 0) {
        port = server_->bind_to_any_port(host);
        bound = port > 0;
    } else {
        bound = server_->bind_to_port(host, port);
    }
    if (!bound) {
        Logger::warn("metrics", "Cannot bind metrics endpoint to " + host + ":" + std::to_string(port) +
                                "; continuing without it");
        return false;
    }
    port_ = port;

    thread_ = std::thread([this]() { server_->listen_after_bind(); });
    Logger::info("metrics", "Serving /metrics on " + host + ":" + std::to_string(port));
    return true;
}

void MetricsServer::stop() {
    if (!thread_.joinable()) return;
    server_->stop();
    thread_.join();
}

} // namespace Driftwatch
