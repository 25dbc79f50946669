#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "classifier.hpp"
#include "frame_source.hpp"
#include "frame_types.hpp"
#include "status_logger.hpp"
#include "status_store.hpp"
#include "sun_guard.hpp"

namespace roofwatch {

enum class LoopState { IDLE, POLLING, STOPPED };

enum class PollOutcome { NONE, SUCCESS, SKIPPED, FAILED, DROPPED };

std::string loop_state_to_string(LoopState state);
std::string poll_outcome_to_string(PollOutcome outcome);

struct MonitorOptions {
    std::chrono::milliseconds interval{std::chrono::seconds(60)};
    // Re-append the current label when the newest frame has not changed.
    bool log_unchanged{false};
    // Reports OPEN as CLOSED while the sun is up. Off when empty.
    std::optional<SunGuard> sun_guard;
    // Another detector's status file, read after each classification and
    // logged next to ours. Off when empty.
    std::string secondary_status_file;
};

struct MonitorStats {
    LoopState state{LoopState::STOPPED};
    bool running{false};
    PollOutcome last_outcome{PollOutcome::NONE};
    std::string last_error;
    std::string last_frame;
    Clock::time_point last_poll_at{};
    std::uint64_t polls{0};
    std::uint64_t successes{0};
    std::uint64_t skipped{0};
    std::uint64_t failures{0};
    std::uint64_t dropped{0};
    std::uint64_t consecutive_failures{0};
    std::uint64_t log_write_failures{0};   // status lines that could not be appended
};

// Timer-driven controller. Pulls the newest frame, classifies it and
// publishes the result. It is the only writer of the StatusStore. Errors are
// recorded and never end the loop.
class MonitorLoop {
public:
    MonitorLoop(const FrameSource& source, StatusStore& store, StatusLogger& logger,
                MonitorOptions options = {});
    ~MonitorLoop();

    MonitorLoop(const MonitorLoop&) = delete;
    MonitorLoop& operator=(const MonitorLoop&) = delete;

    // Replaces the classifier used by subsequent polls. May be null.
    void attach_classifier(std::shared_ptr<const Classifier> classifier);
    std::shared_ptr<const Classifier> classifier() const;

    // Starts the timer thread. The first poll runs immediately.
    void start();
    // Cancels the pending tick, waits for an in-flight poll, then STOPPED.
    void stop();
    bool running() const { return running_; }

    // One poll. Returns DROPPED without doing anything if another poll is
    // still in flight.
    PollOutcome tick();

    LoopState state() const;
    MonitorStats stats() const;

private:
    void run();
    PollOutcome poll();
    void record(PollOutcome outcome, const std::string& error);
    void apply_sun_guard(ClassificationResult& result) const;
    void compare_secondary(ClassificationResult& result) const;
    bool write_status(const LogEntry& entry);

    const FrameSource& source_;
    StatusStore& store_;
    StatusLogger& logger_;
    MonitorOptions options_;

    mutable std::mutex classifier_mu_;
    std::shared_ptr<const Classifier> classifier_;

    std::atomic<bool> in_flight_{false};
    std::optional<Frame> last_success_;  // touched only by the poll holding in_flight_

    std::atomic<bool> running_{false};
    std::mutex timer_mu_;
    std::condition_variable timer_cv_;
    bool stop_requested_{false};
    std::thread worker_;

    mutable std::mutex stats_mu_;
    MonitorStats stats_;
};

}  // namespace roofwatch
