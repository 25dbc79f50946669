#include "roofwatch/alpaca_device.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>
#include <cmath>
#include <stdexcept>
#include <utility>

#include "roofwatch/alpaca_protocol.hpp"
#include "roofwatch/log.hpp"

namespace roofwatch {

namespace {

constexpr int kInterfaceVersion = 1;

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string fixed3(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", v);
    return buf;
}

std::string html_escape(const std::string& s) {
    std::string out;
    for (char c : s) {
        switch (c) {
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '&': out += "&amp;"; break;
            case '"': out += "&quot;"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

}  // namespace

SafetyMonitorDevice::SafetyMonitorDevice(DeviceInfo info,
                                         const StatusStore& store,
                                         RoofLabel safe_label,
                                         std::chrono::seconds stale_after)
    : info_(std::move(info)), store_(store), safe_label_(safe_label), stale_after_(stale_after) {}

void SafetyMonitorDevice::set_diagnostics(std::function<MonitorStats()> provider) {
    diagnostics_ = std::move(provider);
}

void SafetyMonitorDevice::reply(const httplib::Request& req, httplib::Response& res,
                                const std::string* value_json, int error_number,
                                const std::string& error_message) {
    const std::uint32_t client_tx = parse_transaction_id(req.params);
    const std::uint32_t server_tx = ++server_transaction_;
    res.set_content(make_envelope(value_json, client_tx, server_tx, error_number, error_message),
                    "application/json");
}

void SafetyMonitorDevice::bad_request(httplib::Response& res, const std::string& message) {
    res.status = 400;
    res.set_content(message, "text/plain");
}

void SafetyMonitorDevice::register_routes(httplib::Server& srv) {
    srv.Get("/management/apiversions", [this](const httplib::Request& req, httplib::Response& res) {
        const std::string value = "[1]";
        reply(req, res, &value);
    });

    srv.Get("/management/v1/description", [this](const httplib::Request& req, httplib::Response& res) {
        std::ostringstream oss;
        oss << "{\"ServerName\":" << json_string(info_.server_name)
            << ",\"Manufacturer\":" << json_string(info_.manufacturer)
            << ",\"ManufacturerVersion\":" << json_string(info_.driver_version)
            << ",\"Location\":" << json_string(info_.location) << "}";
        const std::string value = oss.str();
        reply(req, res, &value);
    });

    srv.Get("/management/v1/configureddevices", [this](const httplib::Request& req, httplib::Response& res) {
        std::ostringstream oss;
        oss << "[{\"DeviceName\":" << json_string(info_.name)
            << ",\"DeviceType\":\"SafetyMonitor\""
            << ",\"DeviceNumber\":" << info_.device_number
            << ",\"UniqueID\":" << json_string(info_.unique_id) << "}]";
        const std::string value = oss.str();
        reply(req, res, &value);
    });

    auto setup = [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(setup_page(), "text/html");
    };
    srv.Get("/setup", setup);
    srv.Get(R"(/setup/v1/safetymonitor/(\d+)/setup)", setup);

    const std::string device_route = R"(/api/v1/safetymonitor/(\d+)/([A-Za-z]+))";
    auto device_handler = [this](bool is_put) {
        return [this, is_put](const httplib::Request& req, httplib::Response& res) {
            try {
                int number = -1;
                try {
                    number = std::stoi(req.matches[1].str());
                } catch (const std::out_of_range&) {
                    // reported as an unknown device below
                }
                const std::string method = lower(req.matches[2].str());
                if (number != info_.device_number) {
                    bad_request(res, "Safety monitor device number " + req.matches[1].str() + " does not exist");
                    return;
                }
                if (is_put) {
                    handle_put(method, req, res);
                } else {
                    handle_get(method, req, res);
                }
            } catch (const std::exception& e) {
                log_error(std::string("Device request failed: ") + e.what());
                res.status = 500;
                reply(req, res, nullptr, alpaca_error::kUnspecifiedError, e.what());
            }
        };
    };
    srv.Get(device_route, device_handler(false));
    srv.Put(device_route, device_handler(true));

    auto unknown_device = [this](const httplib::Request& req, httplib::Response& res) {
        log_warn("Unknown device endpoint: " + req.method + " " + req.path);
        bad_request(res, "Unknown device endpoint: " + req.path);
    };
    srv.Get(R"(/api/.*)", unknown_device);
    srv.Put(R"(/api/.*)", unknown_device);
    srv.Post(R"(/api/.*)", unknown_device);

    auto unknown = [](const httplib::Request& req, httplib::Response& res) {
        log_warn("Unknown endpoint: " + req.method + " " + req.path);
        res.status = 404;
        res.set_content("Unknown endpoint: " + req.path, "text/plain");
    };
    srv.Get(R"(/.*)", unknown);
    srv.Put(R"(/.*)", unknown);
    srv.Post(R"(/.*)", unknown);
}

void SafetyMonitorDevice::handle_get(const std::string& method, const httplib::Request& req,
                                     httplib::Response& res) {
    if (method == "issafe") {
        auto snap = store_.snapshot();
        SafetyVerdict v = verdict(*snap, Clock::now());
        const std::string value = json_bool(v.safe);
        reply(req, res, &value, v.error_number, v.error_message);
    } else if (method == "connected") {
        const std::string value = json_bool(connected_);
        reply(req, res, &value);
    } else if (method == "name") {
        const std::string value = json_string(info_.name);
        reply(req, res, &value);
    } else if (method == "description") {
        const std::string value = json_string(info_.description);
        reply(req, res, &value);
    } else if (method == "driverinfo") {
        const std::string value = json_string(info_.name + " v" + info_.driver_version);
        reply(req, res, &value);
    } else if (method == "driverversion") {
        const std::string value = json_string(info_.driver_version);
        reply(req, res, &value);
    } else if (method == "interfaceversion") {
        const std::string value = std::to_string(kInterfaceVersion);
        reply(req, res, &value);
    } else if (method == "supportedactions") {
        const std::string value = "[]";
        reply(req, res, &value);
    } else if (method == "lastupdate") {
        auto snap = store_.snapshot();
        if (!snap->known()) {
            const std::string value = "\"\"";
            reply(req, res, &value, alpaca_error::kValueNotSet, "Roof status not yet determined");
        } else {
            const std::string value = json_string(iso8601_utc(snap->updated_at));
            reply(req, res, &value);
        }
    } else if (method == "status") {
        auto snap = store_.snapshot();
        const std::string value = status_json(*snap);
        reply(req, res, &value);
    } else {
        bad_request(res, "'" + method + "' is not a valid GET method for a safety monitor");
    }
}

void SafetyMonitorDevice::handle_put(const std::string& method, const httplib::Request& req,
                                     httplib::Response& res) {
    if (method == "connected") {
        auto raw = find_param(req.params, "Connected");
        if (!raw) {
            bad_request(res, "Missing Connected parameter");
            return;
        }
        auto value = parse_bool(*raw);
        if (!value) {
            bad_request(res, "Invalid Connected value '" + *raw + "'");
            return;
        }
        const bool was = connected_.exchange(*value);
        if (was != *value) log_info(*value ? "Alpaca client connected" : "Alpaca client disconnected");
        reply(req, res, nullptr);
    } else if (method == "action") {
        const std::string action = find_param(req.params, "Action").value_or("");
        const std::string value = "\"\"";
        reply(req, res, &value, alpaca_error::kActionNotImplemented,
              "Action '" + action + "' is not supported");
    } else if (method == "commandblind" || method == "commandbool" || method == "commandstring") {
        const std::string command = find_param(req.params, "Command").value_or("");
        reply(req, res, nullptr, alpaca_error::kNotImplemented,
              "Command '" + command + "' is not supported");
    } else {
        bad_request(res, "'" + method + "' is not a valid PUT method for a safety monitor");
    }
}

SafetyVerdict SafetyMonitorDevice::verdict(const StatusRecord& record, Clock::time_point now) const {
    const bool sun_up = sun_guard_ && sun_guard_->blocks_open(now);
    return evaluate_safety(record, safe_label_, connected_, stale_after_, now, sun_up);
}

std::string SafetyMonitorDevice::status_json(const StatusRecord& record) const {
    const Clock::time_point now = Clock::now();
    SafetyVerdict v = verdict(record, now);
    std::ostringstream oss;
    oss << "{\"IsSafe\":" << json_bool(v.safe)
        << ",\"RoofStatus\":" << json_string(label_to_string(record.label))
        << ",\"SafeWhen\":" << json_string(label_to_string(safe_label_))
        << ",\"Confidence\":" << fixed3(record.confidence)
        << ",\"LastUpdate\":" << json_string(record.known() ? iso8601_utc(record.updated_at) : "")
        << ",\"LastFrame\":" << json_string(record.frame_path)
        << ",\"ConsecutivePolls\":" << record.consecutive
        << ",\"Updates\":" << record.sequence;

    oss << ",\"Trend\":[";
    for (size_t i = 0; i < record.recent.size(); ++i) {
        if (i) oss << ",";
        oss << json_string(label_to_string(record.recent[i].label));
    }
    oss << "]";

    const double sun_angle = sun_guard_ ? sun_guard_->altitude(now) : NAN;
    oss << ",\"SunAngle\":" << (std::isfinite(sun_angle) ? fixed3(sun_angle) : "null");
    oss << ",\"SunOverride\":" << json_bool(record.sun_override)
        << ",\"SecondaryStatus\":" << json_string(label_to_string(record.secondary_label));

    if (diagnostics_) {
        MonitorStats st = diagnostics_();
        oss << ",\"Monitoring\":" << json_bool(st.running)
            << ",\"LoopState\":" << json_string(loop_state_to_string(st.state))
            << ",\"LastPollOutcome\":" << json_string(poll_outcome_to_string(st.last_outcome))
            << ",\"ConsecutiveFailures\":" << st.consecutive_failures
            << ",\"LastError\":" << json_string(st.last_error)
            << ",\"LogWriteFailures\":" << st.log_write_failures;
    }
    oss << ",\"SafetyError\":" << json_string(v.error_message) << "}";
    return oss.str();
}

std::string SafetyMonitorDevice::setup_page() const {
    auto snap = store_.snapshot();
    const std::string base = "/api/v1/safetymonitor/" + std::to_string(info_.device_number);
    std::ostringstream html;
    html << "<!DOCTYPE html><html><head><title>" << html_escape(info_.name) << " Setup</title></head><body>"
         << "<h1>" << html_escape(info_.name) << "</h1>"
         << "<table border=\"1\" cellpadding=\"4\">"
         << "<tr><th>Device Type</th><td>SafetyMonitor</td></tr>"
         << "<tr><th>Device Number</th><td>" << info_.device_number << "</td></tr>"
         << "<tr><th>Port</th><td>" << info_.http_port << "</td></tr>"
         << "<tr><th>Driver Version</th><td>" << html_escape(info_.driver_version) << "</td></tr>"
         << "<tr><th>Unique ID</th><td>" << html_escape(info_.unique_id) << "</td></tr>"
         << "</table>"
         << "<h3>Current Status</h3>"
         << "<p>Connected: " << (connected_ ? "yes" : "no") << "</p>"
         << "<p>Roof: " << label_to_string(snap->label) << "</p>"
         << "<p>Safe when roof is: " << label_to_string(safe_label_) << "</p>"
         << "<p>Last update: " << (snap->known() ? iso8601_utc(snap->updated_at) : "never") << "</p>"
         << "<h3>Endpoints</h3><ul>"
         << "<li><a href=\"/management/apiversions\">/management/apiversions</a></li>"
         << "<li><a href=\"/management/v1/description\">/management/v1/description</a></li>"
         << "<li><a href=\"/management/v1/configureddevices\">/management/v1/configureddevices</a></li>"
         << "<li><a href=\"" << base << "/issafe\">" << base << "/issafe</a></li>"
         << "<li><a href=\"" << base << "/status\">" << base << "/status</a></li>"
         << "</ul></body></html>";
    return html.str();
}

}  // namespace roofwatch
