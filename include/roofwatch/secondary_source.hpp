#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "frame_types.hpp"

namespace roofwatch {

// Latest entry of a second roof status file, written by another detector.
struct SecondaryStatus {
    RoofLabel label{RoofLabel::UNKNOWN};
    std::filesystem::file_time_type mtime{};
    std::string line;
};

// OPEN or CLOSED if the line mentions one (any case), UNKNOWN otherwise.
RoofLabel parse_status_text(const std::string& line);

// Last non-blank line of `path`. nullopt (with a warning) when the file is
// missing or empty, or its last line names neither state.
std::optional<SecondaryStatus> read_secondary_status(const std::filesystem::path& path);

}  // namespace roofwatch
