#pragma once

#include <optional>
#include <string>
#include <vector>

#include "frame_types.hpp"

namespace roofwatch {

// Finds the newest camera frame in a directory. Read-only: files are never
// moved or deleted.
class FrameSource {
public:
    FrameSource(std::string directory, std::vector<std::string> extensions);

    // Newest matching file by modification time, ties broken by the greatest
    // file name. std::nullopt when nothing matches. Throws SourceUnavailable
    // if the directory is missing or cannot be listed.
    std::optional<Frame> latest() const;

    const std::string& directory() const { return directory_; }

private:
    bool matches(const std::filesystem::path& path) const;

    std::string directory_;
    std::vector<std::string> extensions_;  // lower case, with leading dot
};

}  // namespace roofwatch
