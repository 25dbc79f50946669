#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "roofwatch/classifier.hpp"

namespace roofwatch::test_util {

namespace fs = std::filesystem;

// Scratch directory removed with everything in it on destruction.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = fs::temp_directory_path() / ("roofwatch_test_" + std::to_string(rd()) + std::to_string(rd()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    fs::path operator/(const std::string& name) const { return path_ / name; }

private:
    fs::path path_;
};

// Uniform gray image, bright for an open roof and dark for a closed one.
inline fs::path write_frame(const fs::path& path, int level, int size = 48) {
    fs::create_directories(path.parent_path());
    cv::Mat img(size, size, CV_8UC3, cv::Scalar(level, level, level));
    cv::imwrite(path.string(), img);
    return path;
}

inline void write_bytes(const fs::path& path, const std::string& bytes) {
    std::ofstream f(path, std::ios::binary);
    f << bytes;
}

// Moves the file's mtime relative to now so ordering does not depend on how
// fast the test wrote the files.
inline void set_age(const fs::path& path, std::chrono::seconds age) {
    fs::last_write_time(path, fs::file_time_type::clock::now() - age);
}

inline std::vector<std::string> read_lines(const fs::path& path) {
    std::vector<std::string> lines;
    std::ifstream f(path);
    std::string line;
    while (std::getline(f, line)) lines.push_back(line);
    return lines;
}

// Classifier driven by a callback. Tracks how many classifications overlap.
class FakeClassifier : public Classifier {
public:
    using Fn = std::function<double(const Frame&)>;

    explicit FakeClassifier(Fn score) : score_(std::move(score)) {}

    bool ready() const override { return true; }

    ClassificationResult classify(const Frame& frame) const override {
        const int now = ++active_;
        int seen = max_active_.load();
        while (now > seen && !max_active_.compare_exchange_weak(seen, now)) {
        }
        calls_++;
        struct Leave {
            std::atomic<int>& n;
            ~Leave() { --n; }
        } leave{active_};
        return make_result(frame, score_(frame), 0.5);
    }

    int calls() const { return calls_; }
    int max_active() const { return max_active_; }

private:
    Fn score_;
    mutable std::atomic<int> active_{0};
    mutable std::atomic<int> max_active_{0};
    mutable std::atomic<int> calls_{0};
};

// OPEN for frames whose name contains "open", CLOSED otherwise.
inline double score_by_name(const Frame& frame) {
    return frame.name().find("open") != std::string::npos ? 0.9 : 0.1;
}

}  // namespace roofwatch::test_util
