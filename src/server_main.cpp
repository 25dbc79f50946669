#include <csignal>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "roofwatch/config.hpp"
#include "roofwatch/log.hpp"
#include "roofwatch/server_app.hpp"

using namespace std::chrono_literals;

namespace {
volatile std::sig_atomic_t g_stop = 0;

void on_signal(int) {
    g_stop = 1;
}
}  // namespace

int main(int argc, char** argv) {
    roofwatch::AppConfig cfg;
    try {
        cfg = roofwatch::parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ERROR] " << e.what() << "\n"
                  << "Run with --help for usage.\n";
        return 2;
    }

    roofwatch::set_log_level(cfg.verbose ? roofwatch::LogLevel::DEBUG : roofwatch::LogLevel::INFO);
    if (!cfg.diag_log.empty() && !roofwatch::set_log_file(cfg.diag_log)) {
        roofwatch::log_warn("Cannot open diagnostic log " + cfg.diag_log);
    }

    roofwatch::log_info("Starting roofwatch (roof monitor + Alpaca SafetyMonitor)");
    roofwatch::log_info("       frames: " + cfg.monitor_dir);
    roofwatch::log_info("       model : " + cfg.model_path);
    roofwatch::log_info("       status: " + cfg.status_file);
    roofwatch::log_info(std::string("       ORT   : ") +
                        (cfg.use_ort ? "enabled" : "disabled (OpenCV fallback)"));

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    roofwatch::ServerApp app(cfg);
    if (!app.start()) return 1;
    roofwatch::log_info("Press Ctrl+C to exit");

    while (!g_stop && app.running()) {
        std::this_thread::sleep_for(200ms);
    }

    app.stop();
    roofwatch::log_info("Stopped roofwatch");
    return 0;
}
