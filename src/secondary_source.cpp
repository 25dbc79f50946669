#include "roofwatch/secondary_source.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

#include "roofwatch/log.hpp"

namespace roofwatch {

RoofLabel parse_status_text(const std::string& line) {
    std::string upper = line;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper.find("OPEN") != std::string::npos) return RoofLabel::OPEN;
    if (upper.find("CLOSED") != std::string::npos) return RoofLabel::CLOSED;
    return RoofLabel::UNKNOWN;
}

std::optional<SecondaryStatus> read_secondary_status(const std::filesystem::path& path) {
    std::error_code ec;
    const auto mtime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        log_warn("Secondary status file " + path.string() + " not readable: " + ec.message());
        return std::nullopt;
    }

    std::ifstream in(path);
    if (!in) {
        log_warn("Secondary status file " + path.string() + " could not be opened");
        return std::nullopt;
    }

    std::string line, last;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") != std::string::npos) last = line;
    }
    if (last.empty()) {
        log_warn("Secondary status file " + path.string() + " is empty");
        return std::nullopt;
    }

    SecondaryStatus status;
    status.label = parse_status_text(last);
    status.mtime = mtime;
    status.line = last;
    if (status.label == RoofLabel::UNKNOWN) {
        log_warn("Secondary status line not understood: " + last);
        return std::nullopt;
    }
    return status;
}

}  // namespace roofwatch
