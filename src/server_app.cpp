#include "roofwatch/server_app.hpp"

#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <optional>
#include <random>
#include <sstream>
#include <utility>

#include <opencv2/core.hpp>

#include "roofwatch/alpaca_protocol.hpp"
#include "roofwatch/log.hpp"

namespace roofwatch {

namespace {

double now_seconds() {
    return static_cast<double>(cv::getTickCount()) / cv::getTickFrequency();
}

std::optional<SunGuard> sun_guard(const AppConfig& cfg) {
    if (!cfg.sun_guard) return std::nullopt;
    SunGuardOptions opts;
    opts.latitude = cfg.latitude;
    opts.longitude = cfg.longitude;
    opts.max_altitude_deg = cfg.sun_max_altitude;
    return SunGuard(opts);
}

MonitorOptions monitor_options(const AppConfig& cfg) {
    MonitorOptions opts;
    opts.interval = std::chrono::seconds(cfg.interval_sec);
    opts.log_unchanged = cfg.log_unchanged;
    opts.sun_guard = sun_guard(cfg);
    opts.secondary_status_file = cfg.secondary_status_file;
    return opts;
}

}  // namespace

// Random version 4 UUID.
std::string generate_unique_id() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<std::uint64_t> dist;
    std::uint64_t hi = dist(gen);
    std::uint64_t lo = dist(gen);
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

ServerApp::ServerApp(const AppConfig& cfg)
    : cfg_(cfg),
      source_(cfg.monitor_dir, cfg.extensions),
      logger_(cfg.status_file, cfg.log_utc),
      loop_(source_, store_, logger_, monitor_options(cfg)) {
    if (cfg_.unique_id.empty()) cfg_.unique_id = generate_unique_id();
}

ServerApp::~ServerApp() {
    stop();
}

bool ServerApp::start() {
    if (http_running_) return true;

    {
        std::lock_guard<std::mutex> lock(monitor_mu_);
        engine_ = std::make_shared<InferenceEngine>(cfg_.model_path, cfg_.img_size, cfg_.threshold, cfg_.use_ort);
        if (engine_->ready()) {
            log_info("Model " + cfg_.model_path + " loaded (" + engine_->backend_name() + ")");
        } else {
            log_error("Model " + cfg_.model_path + " is not usable, polls will fail until one is loaded");
        }
        loop_.attach_classifier(engine_);
    }

    http_srv_ = std::make_unique<httplib::Server>();
    if (cfg_.port == 0) {
        http_port_ = http_srv_->bind_to_any_port(cfg_.bind_address);
    } else {
        http_port_ = http_srv_->bind_to_port(cfg_.bind_address, cfg_.port) ? cfg_.port : -1;
    }
    if (http_port_ <= 0) {
        log_error("Could not bind HTTP server to " + cfg_.bind_address + ":" + std::to_string(cfg_.port));
        http_srv_.reset();
        http_port_ = 0;
        return false;
    }

    DeviceInfo info;
    info.device_number = cfg_.device_number;
    info.http_port = http_port_;
    info.unique_id = cfg_.unique_id;
    info.location = cfg_.location;
    device_ = std::make_unique<SafetyMonitorDevice>(info, store_, cfg_.safe_label,
                                                    std::chrono::seconds(cfg_.stale_after_sec));
    device_->set_diagnostics([this] { return loop_.stats(); });
    device_->set_sun_guard(sun_guard(cfg_));
    setup_routes();

    http_running_ = true;
    http_thread_ = std::thread(&ServerApp::run_http, this);
    if (cfg_.sun_guard) {
        char buf[96];
        std::snprintf(buf, sizeof(buf), "Sun guard on: lat %.4f, lon %.4f, OPEN blocked at or above %.1f deg",
                      cfg_.latitude, cfg_.longitude, cfg_.sun_max_altitude);
        log_info(buf);
    }
    log_info("Alpaca SafetyMonitor on http://" + cfg_.bind_address + ":" + std::to_string(http_port_) +
             "/api/v1/safetymonitor/" + std::to_string(cfg_.device_number));

    if (cfg_.discovery_enabled) discovery_.start(cfg_.discovery_port, http_port_);

    if (cfg_.autostart) {
        std::string error;
        start_monitor("", error);
    }
    return true;
}

void ServerApp::stop() {
    stop_monitor();
    discovery_.stop();
    if (http_srv_) http_srv_->stop();
    if (http_thread_.joinable()) http_thread_.join();
    http_running_ = false;
}

void ServerApp::run_http() {
    if (!http_srv_->listen_after_bind()) {
        log_error("HTTP server stopped unexpectedly");
    }
    http_running_ = false;
}

void ServerApp::setup_routes() {
    http_srv_->Post("/monitor/start", [this](const httplib::Request& req, httplib::Response& res) {
        const std::string model = find_param(req.params, "model").value_or("");
        std::string error;
        if (!start_monitor(model, error)) {
            res.status = 400;
            res.set_content(error, "text/plain");
            return;
        }
        res.set_content(status_json(), "application/json");
    });

    http_srv_->Post("/monitor/stop", [this](const httplib::Request&, httplib::Response& res) {
        stop_monitor();
        res.set_content(status_json(), "application/json");
    });

    http_srv_->Get("/monitor/status", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(status_json(), "application/json");
    });

    // Device routes end with catch-alls, so they go last.
    device_->register_routes(*http_srv_);
}

bool ServerApp::start_monitor(const std::string& model_path, std::string& error) {
    std::lock_guard<std::mutex> lock(monitor_mu_);
    // An explicit model is always (re)loaded, even from the current path, so a
    // file replaced in place is picked up. Without one, only a model that
    // never loaded is retried.
    const bool explicit_model = !model_path.empty();
    if (explicit_model || !engine_ || !engine_->ready()) {
        const std::string path = explicit_model ? model_path : cfg_.model_path;
        auto engine = std::make_shared<InferenceEngine>(path, cfg_.img_size, cfg_.threshold, cfg_.use_ort);
        if (engine->ready()) {
            engine_ = std::move(engine);
            cfg_.model_path = path;
            loop_.attach_classifier(engine_);
            log_info("Loaded model " + path + " (" + engine_->backend_name() + ")");
        } else if (explicit_model) {
            error = "Could not load model " + path;
            log_warn(error + ", keeping " + cfg_.model_path);
            return false;
        } else {
            log_warn("Model " + path + " is still not usable, polls will fail");
        }
    }
    if (!loop_.running()) {
        loop_.start();
        monitor_started_ = now_seconds();
    }
    return true;
}

void ServerApp::stop_monitor() {
    std::lock_guard<std::mutex> lock(monitor_mu_);
    loop_.stop();
}

MonitorStatus ServerApp::status() const {
    MonitorStatus st;
    std::lock_guard<std::mutex> lock(monitor_mu_);
    st.running = loop_.running();
    if (st.running) st.uptime_sec = now_seconds() - monitor_started_;
    st.pid = static_cast<int>(::getpid());
    st.model_path = cfg_.model_path;
    if (engine_) {
        st.backend = engine_->backend_name();
        st.model_ready = engine_->ready();
    }
    st.stats = loop_.stats();
    return st;
}

std::string ServerApp::status_json() const {
    MonitorStatus st = status();
    auto snap = store_.snapshot();
    std::ostringstream oss;
    oss << "{\"running\":" << json_bool(st.running)
        << ",\"uptime_sec\":" << st.uptime_sec
        << ",\"pid\":" << st.pid
        << ",\"state\":" << json_string(loop_state_to_string(st.stats.state))
        << ",\"last_outcome\":" << json_string(poll_outcome_to_string(st.stats.last_outcome))
        << ",\"last_error\":" << json_string(st.stats.last_error)
        << ",\"last_frame\":" << json_string(st.stats.last_frame)
        << ",\"polls\":" << st.stats.polls
        << ",\"successes\":" << st.stats.successes
        << ",\"skipped\":" << st.stats.skipped
        << ",\"failures\":" << st.stats.failures
        << ",\"dropped\":" << st.stats.dropped
        << ",\"log_write_failures\":" << st.stats.log_write_failures
        << ",\"roof_status\":" << json_string(label_to_string(snap->label))
        << ",\"args\":{"
        << "\"MONITOR_DIR\":" << json_string(cfg_.monitor_dir)
        << ",\"STATUS_FILE\":" << json_string(cfg_.status_file)
        << ",\"ROOF_MODEL\":" << json_string(st.model_path)
        << ",\"MODEL_BACKEND\":" << json_string(st.backend)
        << ",\"MODEL_READY\":" << json_bool(st.model_ready)
        << ",\"IMG_SIZE\":" << cfg_.img_size
        << ",\"ROOF_THRESHOLD\":" << cfg_.threshold
        << ",\"POLL_INTERVAL\":" << cfg_.interval_sec
        << ",\"SUN_GUARD\":" << json_bool(cfg_.sun_guard)
        << ",\"SUN_MAX_ALTITUDE\":" << cfg_.sun_max_altitude
        << ",\"SECONDARY_STATUS_FILE\":" << json_string(cfg_.secondary_status_file)
        << "}}";
    return oss.str();
}

}  // namespace roofwatch
