#include "roofwatch/log.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace roofwatch {

namespace {

const char* level_strings[4] = {"DEBUG", "INFO", "WARN", "ERROR"};

std::mutex log_mu;
LogLevel min_level = LogLevel::INFO;
std::ofstream log_file;

std::string current_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

}  // namespace

void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mu);
    min_level = level;
}

bool set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mu);
    if (log_file.is_open()) log_file.close();
    if (path.empty()) return true;
    log_file.open(path, std::ios::out | std::ios::app);
    return log_file.is_open();
}

void log_message(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mu);
    if (level < min_level) return;

    const char* tag = level_strings[static_cast<int>(level)];
    std::ostream& out = (level >= LogLevel::WARN) ? std::cerr : std::cout;
    out << "[" << tag << "] " << message << std::endl;

    if (log_file.is_open()) {
        log_file << current_timestamp() << " [" << tag << "] " << message << std::endl;
        log_file.flush();
    }
}

}  // namespace roofwatch
