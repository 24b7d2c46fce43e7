/**
 * @file metrics_server.hpp
 * @brief Pull-based HTTP endpoint serving a MetricsRegistry at /metrics
 */

#pragma once

#include <metrics/metrics_registry.hpp>
#include <export.hpp>
#include <memory>
#include <string>
#include <thread>

namespace httplib {
class Server;
}

namespace Driftwatch {

class DRIFTWATCH_API MetricsServer {
public:
    explicit MetricsServer(const MetricsRegistry& registry);
    ~MetricsServer();

    MetricsServer(const MetricsServer&) = delete;
    MetricsServer& operator=(const MetricsServer&) = delete;

    /**
     * @brief Bind and start serving on a background thread.
     * @param port 0 binds an ephemeral port, see port()
     * @return false (after logging a warning) if the port cannot be bound
     */
    bool start(const std::string& host, int port);

    /**
     * @brief Stop listening and join the serving thread. Not async-signal-safe.
     */
    void stop();

    bool running() const { return thread_.joinable(); }
    int port() const { return port_; }

private:
    const MetricsRegistry& registry_;
    std::unique_ptr<httplib::Server> server_;
    std::thread thread_;
    int port_ = 0;
};

} // namespace Driftwatch
