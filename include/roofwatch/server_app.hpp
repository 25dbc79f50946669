#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "httplib.h"

#include "alpaca_device.hpp"
#include "config.hpp"
#include "discovery_responder.hpp"
#include "frame_source.hpp"
#include "inference_engine.hpp"
#include "monitor_loop.hpp"
#include "status_logger.hpp"
#include "status_store.hpp"

namespace roofwatch {

struct MonitorStatus {
    bool running{false};
    double uptime_sec{0.0};
    int pid{0};
    std::string model_path;
    std::string backend;
    bool model_ready{false};
    MonitorStats stats{};
};

std::string generate_unique_id();

class ServerApp {
public:
    explicit ServerApp(const AppConfig& cfg);
    ~ServerApp();

    // Loads the model, binds the HTTP port and starts serving. Monitoring
    // starts too unless autostart is off. False if the port cannot be bound.
    bool start();
    void stop();

    bool running() const { return http_running_; }
    int http_port() const { return http_port_; }
    int discovery_port() const { return discovery_.port(); }

    const StatusStore& store() const { return store_; }
    MonitorLoop& monitor() { return loop_; }

private:
    void run_http();
    void setup_routes();

    // A given model path is always loaded, the current one included. An empty
    // path retries the configured model only if it is not loaded. False if a
    // given model fails to load; the previous one stays attached.
    bool start_monitor(const std::string& model_path, std::string& error);
    void stop_monitor();
    MonitorStatus status() const;
    std::string status_json() const;

    AppConfig cfg_;
    FrameSource source_;
    StatusStore store_;
    StatusLogger logger_;
    MonitorLoop loop_;

    mutable std::mutex monitor_mu_;
    std::shared_ptr<InferenceEngine> engine_;
    double monitor_started_{0.0};

    std::unique_ptr<SafetyMonitorDevice> device_;
    DiscoveryResponder discovery_;

    std::atomic<bool> http_running_{false};
    int http_port_{0};
    std::thread http_thread_;
    std::unique_ptr<httplib::Server> http_srv_;
};

}  // namespace roofwatch
