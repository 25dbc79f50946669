#pragma once

#include <string>
#include <vector>

#include "frame_types.hpp"

namespace roofwatch {

struct AppConfig {
    std::string monitor_dir{"frames"};
    std::vector<std::string> extensions{".png"};
    std::string status_file{"RoofStatusFile.txt"};
    std::string model_path{"models/roof_classifier.yml"};
    int img_size{32};
    double threshold{0.5};            // P(OPEN) must exceed this to report OPEN
    int interval_sec{60};
    RoofLabel safe_label{RoofLabel::OPEN};  // IsSafe is true while the roof reads this
    bool log_unchanged{false};        // heartbeat line when the frame did not change
    bool log_utc{false};
    int stale_after_sec{0};           // 0 disables the staleness check

    bool sun_guard{false};            // report OPEN as CLOSED while the sun is up
    double latitude{40.0};
    double longitude{-74.0};
    double sun_max_altitude{-17.0};   // degrees
    std::string secondary_status_file{};

    std::string bind_address{"0.0.0.0"};
    int port{11111};
    int device_number{0};
    int discovery_port{32227};
    bool discovery_enabled{true};
    std::string unique_id{};          // generated at startup when empty
    std::string location{"Observatory"};

    std::string diag_log{};
    bool verbose{false};
    bool autostart{true};
    bool use_ort{false};
};

// Environment first, then command line. Throws std::invalid_argument on bad
// values. Prints usage and exits for --help.
AppConfig parse_args(int argc, char** argv);

std::vector<std::string> parse_extensions(const std::string& list);

}  // namespace roofwatch
