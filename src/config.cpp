#include "roofwatch/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace roofwatch {

static bool arg_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static int to_int(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw std::invalid_argument(key + ": expected an integer, got '" + value + "'");
    }
}

static double to_double(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        double v = std::stod(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw std::invalid_argument(key + ": expected a number, got '" + value + "'");
    }
}

static bool to_bool(const std::string& key, const std::string& value) {
    std::string v = lower(value);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw std::invalid_argument(key + ": expected a boolean, got '" + value + "'");
}

static RoofLabel to_safe_label(const std::string& value) {
    std::string v = lower(value);
    if (v == "open") return RoofLabel::OPEN;
    if (v == "closed") return RoofLabel::CLOSED;
    throw std::invalid_argument("safe-when: expected 'open' or 'closed', got '" + value + "'");
}

static void validate(const AppConfig& cfg) {
    if (cfg.monitor_dir.empty()) throw std::invalid_argument("monitor-dir must not be empty");
    if (cfg.extensions.empty()) throw std::invalid_argument("extensions must not be empty");
    if (cfg.interval_sec <= 0) throw std::invalid_argument("interval must be positive");
    if (cfg.threshold < 0.0 || cfg.threshold > 1.0) throw std::invalid_argument("threshold must be within [0, 1]");
    if (cfg.img_size <= 0) throw std::invalid_argument("img must be positive");
    if (cfg.stale_after_sec < 0) throw std::invalid_argument("stale-after must not be negative");
    if (cfg.port < 0 || cfg.port > 65535) throw std::invalid_argument("port out of range");
    if (cfg.discovery_port < 0 || cfg.discovery_port > 65535) throw std::invalid_argument("discovery-port out of range");
    if (cfg.device_number < 0) throw std::invalid_argument("device-number must not be negative");
    if (cfg.latitude < -90.0 || cfg.latitude > 90.0) throw std::invalid_argument("latitude must be within [-90, 90]");
    if (cfg.longitude < -180.0 || cfg.longitude > 180.0) throw std::invalid_argument("longitude must be within [-180, 180]");
    if (cfg.sun_max_altitude < -90.0 || cfg.sun_max_altitude > 90.0)
        throw std::invalid_argument("sun-max-altitude must be within [-90, 90]");
}

static void print_usage() {
    std::cout << "Usage: roofwatch [--monitor-dir <dir>] [--extensions png,jpg] [--status-file <path>]\n"
              << "                 [--model <file>] [--img <size>] [--threshold <p>] [--interval <sec>]\n"
              << "                 [--safe-when open|closed] [--log-unchanged] [--utc] [--stale-after <sec>]\n"
              << "                 [--sun-guard] [--latitude <deg>] [--longitude <deg>]\n"
              << "                 [--sun-max-altitude <deg>] [--secondary-status <path>]\n"
              << "                 [--bind <addr>] [--port <int>] [--device-number <int>]\n"
              << "                 [--discovery-port <int>] [--no-discovery] [--unique-id <id>]\n"
              << "                 [--location <text>] [--diag-log <path>] [--verbose]\n"
              << "                 [--no-autostart] [--use-ort|--no-ort]\n";
}

std::vector<std::string> parse_extensions(const std::string& list) {
    std::vector<std::string> out;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(std::remove_if(item.begin(), item.end(),
                                  [](unsigned char c) { return std::isspace(c); }),
                   item.end());
        if (item.empty()) continue;
        if (item.front() != '.') item.insert(item.begin(), '.');
        out.push_back(lower(item));
    }
    return out;
}

AppConfig parse_args(int argc, char** argv) {
    AppConfig cfg;

    if (const char* v = std::getenv("MONITOR_DIR")) cfg.monitor_dir = v;
    if (const char* v = std::getenv("FRAME_EXTENSIONS")) cfg.extensions = parse_extensions(v);
    if (const char* v = std::getenv("STATUS_FILE")) cfg.status_file = v;
    if (const char* v = std::getenv("ROOF_MODEL")) cfg.model_path = v;
    if (const char* v = std::getenv("IMG_SIZE")) cfg.img_size = to_int("IMG_SIZE", v);
    if (const char* v = std::getenv("ROOF_THRESHOLD")) cfg.threshold = to_double("ROOF_THRESHOLD", v);
    if (const char* v = std::getenv("POLL_INTERVAL")) cfg.interval_sec = to_int("POLL_INTERVAL", v);
    if (const char* v = std::getenv("SAFE_WHEN")) cfg.safe_label = to_safe_label(v);
    if (const char* v = std::getenv("STALE_AFTER")) cfg.stale_after_sec = to_int("STALE_AFTER", v);
    if (const char* v = std::getenv("SUN_GUARD")) cfg.sun_guard = to_bool("SUN_GUARD", v);
    if (const char* v = std::getenv("OBSERVATORY_LAT")) cfg.latitude = to_double("OBSERVATORY_LAT", v);
    if (const char* v = std::getenv("OBSERVATORY_LON")) cfg.longitude = to_double("OBSERVATORY_LON", v);
    if (const char* v = std::getenv("SUN_MAX_ALTITUDE")) cfg.sun_max_altitude = to_double("SUN_MAX_ALTITUDE", v);
    if (const char* v = std::getenv("SECONDARY_STATUS_FILE")) cfg.secondary_status_file = v;
    if (const char* v = std::getenv("ALPACA_BIND")) cfg.bind_address = v;
    if (const char* v = std::getenv("ALPACA_PORT")) cfg.port = to_int("ALPACA_PORT", v);
    if (const char* v = std::getenv("ALPACA_DEVICE")) cfg.device_number = to_int("ALPACA_DEVICE", v);
    if (const char* v = std::getenv("ALPACA_DISCOVERY_PORT")) cfg.discovery_port = to_int("ALPACA_DISCOVERY_PORT", v);
    if (const char* v = std::getenv("ALPACA_UNIQUE_ID")) cfg.unique_id = v;
    if (const char* v = std::getenv("OBSERVATORY_LOCATION")) cfg.location = v;
    if (const char* v = std::getenv("DIAG_LOG")) cfg.diag_log = v;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&](int offset = 1) -> const char* {
            if (i + offset < argc) return argv[i + offset];
            return nullptr;
        };

        if (arg_eq(arg, "--monitor-dir") && next()) {
            cfg.monitor_dir = next();
            i++;
        } else if (arg_eq(arg, "--extensions") && next()) {
            cfg.extensions = parse_extensions(next());
            i++;
        } else if (arg_eq(arg, "--status-file") && next()) {
            cfg.status_file = next();
            i++;
        } else if (arg_eq(arg, "--model") && next()) {
            cfg.model_path = next();
            i++;
        } else if (arg_eq(arg, "--img") && next()) {
            cfg.img_size = to_int("--img", next());
            i++;
        } else if (arg_eq(arg, "--threshold") && next()) {
            cfg.threshold = to_double("--threshold", next());
            i++;
        } else if (arg_eq(arg, "--interval") && next()) {
            cfg.interval_sec = to_int("--interval", next());
            i++;
        } else if (arg_eq(arg, "--safe-when") && next()) {
            cfg.safe_label = to_safe_label(next());
            i++;
        } else if (arg_eq(arg, "--log-unchanged")) {
            cfg.log_unchanged = true;
        } else if (arg_eq(arg, "--utc")) {
            cfg.log_utc = true;
        } else if (arg_eq(arg, "--stale-after") && next()) {
            cfg.stale_after_sec = to_int("--stale-after", next());
            i++;
        } else if (arg_eq(arg, "--sun-guard")) {
            cfg.sun_guard = true;
        } else if (arg_eq(arg, "--latitude") && next()) {
            cfg.latitude = to_double("--latitude", next());
            i++;
        } else if (arg_eq(arg, "--longitude") && next()) {
            cfg.longitude = to_double("--longitude", next());
            i++;
        } else if (arg_eq(arg, "--sun-max-altitude") && next()) {
            cfg.sun_max_altitude = to_double("--sun-max-altitude", next());
            i++;
        } else if (arg_eq(arg, "--secondary-status") && next()) {
            cfg.secondary_status_file = next();
            i++;
        } else if (arg_eq(arg, "--bind") && next()) {
            cfg.bind_address = next();
            i++;
        } else if (arg_eq(arg, "--port") && next()) {
            cfg.port = to_int("--port", next());
            i++;
        } else if (arg_eq(arg, "--device-number") && next()) {
            cfg.device_number = to_int("--device-number", next());
            i++;
        } else if (arg_eq(arg, "--discovery-port") && next()) {
            cfg.discovery_port = to_int("--discovery-port", next());
            i++;
        } else if (arg_eq(arg, "--no-discovery")) {
            cfg.discovery_enabled = false;
        } else if (arg_eq(arg, "--unique-id") && next()) {
            cfg.unique_id = next();
            i++;
        } else if (arg_eq(arg, "--location") && next()) {
            cfg.location = next();
            i++;
        } else if (arg_eq(arg, "--diag-log") && next()) {
            cfg.diag_log = next();
            i++;
        } else if (arg_eq(arg, "--verbose")) {
            cfg.verbose = true;
        } else if (arg_eq(arg, "--no-autostart")) {
            cfg.autostart = false;
        } else if (arg_eq(arg, "--use-ort")) {
            cfg.use_ort = true;
        } else if (arg_eq(arg, "--no-ort")) {
            cfg.use_ort = false;
        } else if (arg_eq(arg, "--help")) {
            print_usage();
            std::exit(0);
        } else {
            throw std::invalid_argument(std::string("unknown or incomplete option: ") + arg);
        }
    }

    validate(cfg);
    return cfg;
}

}  // namespace roofwatch
