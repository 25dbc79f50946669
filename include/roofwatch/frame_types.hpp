#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <opencv2/core.hpp>

namespace roofwatch {

using Clock = std::chrono::system_clock;

enum class RoofLabel { UNKNOWN, OPEN, CLOSED };

inline std::string label_to_string(RoofLabel label) {
    switch (label) {
        case RoofLabel::OPEN: return "OPEN";
        case RoofLabel::CLOSED: return "CLOSED";
        default: return "UNKNOWN";
    }
}

// One camera image on disk. Pixels are decoded on first access and never
// shared between polls.
class Frame {
public:
    Frame() = default;
    Frame(std::filesystem::path path, std::filesystem::file_time_type mtime)
        : path_(std::move(path)), mtime_(mtime) {}
    // Frame whose pixels are already in memory.
    Frame(std::filesystem::path path, std::filesystem::file_time_type mtime, cv::Mat pixels)
        : path_(std::move(path)), mtime_(mtime), pixels_(std::move(pixels)) {}

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::file_time_type mtime() const { return mtime_; }
    std::string name() const { return path_.filename().string(); }

    // Throws FrameUnreadable if the file cannot be decoded.
    const cv::Mat& pixels() const;

    bool same_file(const Frame& other) const {
        return path_ == other.path_ && mtime_ == other.mtime_;
    }

private:
    std::filesystem::path path_;
    std::filesystem::file_time_type mtime_{};
    mutable cv::Mat pixels_;
};

struct ClassificationResult {
    RoofLabel label{RoofLabel::CLOSED};
    double confidence{0.0};   // probability of `label`
    double open_score{0.0};   // raw P(OPEN) from the model
    std::string frame_path;
    std::filesystem::file_time_type frame_mtime{};
    Clock::time_point evaluated_at{};
    bool sun_override{false};                   // OPEN turned into CLOSED by the sun guard
    std::optional<double> sun_altitude;         // degrees, when the sun guard is on
    RoofLabel secondary_label{RoofLabel::UNKNOWN};
};

struct TrendSample {
    RoofLabel label{RoofLabel::UNKNOWN};
    double confidence{0.0};
    Clock::time_point evaluated_at{};
};

struct StatusRecord {
    RoofLabel label{RoofLabel::UNKNOWN};
    double confidence{0.0};
    Clock::time_point updated_at{};
    std::string frame_path;
    std::uint64_t consecutive{0};   // successful polls in a row at `label`
    std::uint64_t sequence{0};      // number of updates since start
    std::vector<TrendSample> recent;  // oldest first, bounded
    bool sun_override{false};
    std::optional<double> sun_altitude;
    RoofLabel secondary_label{RoofLabel::UNKNOWN};

    bool known() const { return label != RoofLabel::UNKNOWN; }
};

struct LogEntry {
    Clock::time_point timestamp{};
    RoofLabel label{RoofLabel::CLOSED};
};

}  // namespace roofwatch
