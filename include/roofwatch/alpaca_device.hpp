#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "httplib.h"

#include "alpaca_protocol.hpp"
#include "frame_types.hpp"
#include "monitor_loop.hpp"
#include "status_store.hpp"
#include "sun_guard.hpp"

namespace roofwatch {

struct DeviceInfo {
    int device_number{0};
    int http_port{11111};
    std::string unique_id;
    std::string name{"Roofwatch Safety Monitor"};
    std::string description{"Safety monitor based on roof image classification"};
    std::string driver_version{"1.0.0"};
    std::string server_name{"Roofwatch Alpaca Server"};
    std::string manufacturer{"Roofwatch"};
    std::string location{"Observatory"};
};

// ASCOM Alpaca SafetyMonitor device plus the management API. Every answer is
// computed from a StatusStore snapshot; no request touches the disk.
class SafetyMonitorDevice {
public:
    SafetyMonitorDevice(DeviceInfo info,
                        const StatusStore& store,
                        RoofLabel safe_label,
                        std::chrono::seconds stale_after = std::chrono::seconds(0));

    // Optional source for the loop diagnostics in the status endpoint.
    void set_diagnostics(std::function<MonitorStats()> provider);

    // IsSafe reads an OPEN roof as CLOSED while the guard blocks it, even
    // between polls. Set before register_routes.
    void set_sun_guard(std::optional<SunGuard> guard) { sun_guard_ = std::move(guard); }

    // Management, device, setup and catch-all routes. Register other routes
    // before calling this, the catch-alls match everything.
    void register_routes(httplib::Server& srv);

    bool connected() const { return connected_; }
    void set_connected(bool connected) { connected_ = connected; }

    const DeviceInfo& info() const { return info_; }

private:
    void handle_get(const std::string& method, const httplib::Request& req, httplib::Response& res);
    void handle_put(const std::string& method, const httplib::Request& req, httplib::Response& res);

    void reply(const httplib::Request& req, httplib::Response& res, const std::string* value_json,
               int error_number = 0, const std::string& error_message = "");
    void bad_request(httplib::Response& res, const std::string& message);

    SafetyVerdict verdict(const StatusRecord& record, Clock::time_point now) const;
    std::string status_json(const StatusRecord& record) const;
    std::string setup_page() const;

    DeviceInfo info_;
    const StatusStore& store_;
    RoofLabel safe_label_;
    std::chrono::seconds stale_after_;
    std::function<MonitorStats()> diagnostics_;
    std::optional<SunGuard> sun_guard_;

    std::atomic<bool> connected_{false};
    std::atomic<std::uint32_t> server_transaction_{0};
};

}  // namespace roofwatch
