#include "roofwatch/frame_source.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>

#include <opencv2/imgcodecs.hpp>

#include "roofwatch/errors.hpp"

namespace roofwatch {

namespace fs = std::filesystem;

namespace {
std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
}  // namespace

const cv::Mat& Frame::pixels() const {
    if (!pixels_.empty()) return pixels_;
    try {
        pixels_ = cv::imread(path_.string(), cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw FrameUnreadable("cannot decode " + path_.string() + ": " + e.what());
    }
    if (pixels_.empty()) {
        throw FrameUnreadable("cannot decode " + path_.string());
    }
    return pixels_;
}

FrameSource::FrameSource(std::string directory, std::vector<std::string> extensions)
    : directory_(std::move(directory)) {
    for (auto& ext : extensions) {
        std::string e = lower(ext);
        if (!e.empty() && e.front() != '.') e.insert(e.begin(), '.');
        extensions_.push_back(e);
    }
}

bool FrameSource::matches(const fs::path& path) const {
    const std::string ext = lower(path.extension().string());
    return std::find(extensions_.begin(), extensions_.end(), ext) != extensions_.end();
}

std::optional<Frame> FrameSource::latest() const {
    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        throw SourceUnavailable("monitor directory unavailable: " + directory_);
    }

    fs::directory_iterator it(directory_, ec);
    if (ec) {
        throw SourceUnavailable("cannot list " + directory_ + ": " + ec.message());
    }

    std::optional<Frame> best;
    const fs::directory_iterator end;
    while (it != end) {
        const fs::path path = it->path();
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec) && !entry_ec && matches(path)) {
            // The camera may remove or rotate files while we scan.
            auto mtime = fs::last_write_time(path, entry_ec);
            if (!entry_ec &&
                (!best || mtime > best->mtime() ||
                 (mtime == best->mtime() && path.filename() > best->path().filename()))) {
                best = Frame(path, mtime);
            }
        }
        it.increment(ec);
        if (ec) {
            throw SourceUnavailable("cannot list " + directory_ + ": " + ec.message());
        }
    }
    return best;
}

}  // namespace roofwatch
