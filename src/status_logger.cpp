#include "roofwatch/status_logger.hpp"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

#include "roofwatch/log.hpp"

namespace roofwatch {

std::string format_status_line(const LogEntry& entry, bool utc) {
    std::time_t t = Clock::to_time_t(entry.timestamp);
    std::tm tm{};
    if (utc) {
        gmtime_r(&t, &tm);
    } else {
        localtime_r(&t, &tm);
    }
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::put_time(&tm, "%Y-%m-%d %I:%M:%S%p") << " Roof Status: " << label_to_string(entry.label);
    return oss.str();
}

StatusLogger::StatusLogger(const std::string& path, bool utc) : path_(path), utc_(utc) {}

bool StatusLogger::append(const LogEntry& entry) {
    if (entry.label == RoofLabel::UNKNOWN) {
        log_warn("Refusing to write UNKNOWN roof status to " + path_);
        return false;
    }
    const std::string line = format_status_line(entry, utc_) + "\n";

    std::lock_guard<std::mutex> lock(mu_);
    std::error_code ec;
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }
    std::ofstream f(path_, std::ios::app);
    if (!f) {
        log_warn("Unable to open status file: " + path_);
        return false;
    }
    f << line;
    f.flush();
    if (!f) {
        log_warn("Write to status file failed: " + path_);
        return false;
    }
    return true;
}

}  // namespace roofwatch
