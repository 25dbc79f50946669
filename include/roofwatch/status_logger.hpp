#pragma once

#include <mutex>
#include <string>

#include "frame_types.hpp"

namespace roofwatch {

// "2024-05-01 09:15:02PM Roof Status: OPEN". Downstream roof-status readers
// tail this file, so the layout must not change.
std::string format_status_line(const LogEntry& entry, bool utc);

// Append-only writer for the roof status file. The file is opened, written,
// flushed and closed on every call.
class StatusLogger {
public:
    explicit StatusLogger(const std::string& path, bool utc = false);

    // False (with a diagnostic warning) if the line could not be written.
    bool append(const LogEntry& entry);

    const std::string& path() const { return path_; }

private:
    std::string path_;
    bool utc_{false};
    std::mutex mu_;
};

}  // namespace roofwatch
