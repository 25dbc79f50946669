#include "roofwatch/monitor_loop.hpp"

#include <cstdio>
#include <utility>

#include "roofwatch/errors.hpp"
#include "roofwatch/log.hpp"
#include "roofwatch/secondary_source.hpp"

namespace roofwatch {

using namespace std::chrono_literals;

std::string loop_state_to_string(LoopState state) {
    switch (state) {
        case LoopState::IDLE: return "IDLE";
        case LoopState::POLLING: return "POLLING";
        default: return "STOPPED";
    }
}

std::string poll_outcome_to_string(PollOutcome outcome) {
    switch (outcome) {
        case PollOutcome::SUCCESS: return "SUCCESS";
        case PollOutcome::SKIPPED: return "SKIPPED";
        case PollOutcome::FAILED: return "FAILED";
        case PollOutcome::DROPPED: return "DROPPED";
        default: return "NONE";
    }
}

MonitorLoop::MonitorLoop(const FrameSource& source, StatusStore& store, StatusLogger& logger,
                         MonitorOptions options)
    : source_(source), store_(store), logger_(logger), options_(options) {
    if (options_.interval <= std::chrono::milliseconds::zero()) options_.interval = 1s;
}

MonitorLoop::~MonitorLoop() {
    stop();
}

void MonitorLoop::attach_classifier(std::shared_ptr<const Classifier> classifier) {
    std::lock_guard<std::mutex> lock(classifier_mu_);
    classifier_ = std::move(classifier);
}

std::shared_ptr<const Classifier> MonitorLoop::classifier() const {
    std::lock_guard<std::mutex> lock(classifier_mu_);
    return classifier_;
}

void MonitorLoop::start() {
    if (running_) return;
    if (worker_.joinable()) worker_.join();
    {
        std::lock_guard<std::mutex> lock(timer_mu_);
        stop_requested_ = false;
    }
    {
        std::lock_guard<std::mutex> lock(stats_mu_);
        stats_.state = LoopState::IDLE;
        stats_.running = true;
    }
    running_ = true;
    worker_ = std::thread(&MonitorLoop::run, this);
    log_info("Monitoring started: " + source_.directory());
}

void MonitorLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(timer_mu_);
        stop_requested_ = true;
    }
    timer_cv_.notify_all();
    if (worker_.joinable()) worker_.join();

    // A poll started through tick() from another thread still gets to finish.
    while (in_flight_) {
        std::this_thread::sleep_for(5ms);
    }

    const bool was_running = running_.exchange(false);
    {
        std::lock_guard<std::mutex> lock(stats_mu_);
        stats_.state = LoopState::STOPPED;
        stats_.running = false;
    }
    if (was_running) log_info("Monitoring stopped");
}

void MonitorLoop::run() {
    auto next = std::chrono::steady_clock::now();
    while (true) {
        {
            std::lock_guard<std::mutex> lock(timer_mu_);
            if (stop_requested_) break;
        }

        if (tick() == PollOutcome::DROPPED) {
            log_debug("Timer tick dropped, previous poll still running");
        }

        next += options_.interval;
        const auto now = std::chrono::steady_clock::now();
        if (next <= now) {
            // Missed ticks are dropped, never queued.
            const auto missed = (now - next) / options_.interval + 1;
            next += options_.interval * missed;
            {
                std::lock_guard<std::mutex> lock(stats_mu_);
                stats_.dropped += static_cast<std::uint64_t>(missed);
            }
            log_warn("Poll overran the interval, dropped " + std::to_string(missed) + " tick(s)");
        }

        std::unique_lock<std::mutex> lock(timer_mu_);
        timer_cv_.wait_until(lock, next, [this] { return stop_requested_; });
    }
}

PollOutcome MonitorLoop::tick() {
    bool expected = false;
    if (!in_flight_.compare_exchange_strong(expected, true)) {
        std::lock_guard<std::mutex> lock(stats_mu_);
        stats_.dropped++;
        return PollOutcome::DROPPED;
    }
    {
        std::lock_guard<std::mutex> lock(stats_mu_);
        stats_.state = LoopState::POLLING;
    }
    PollOutcome outcome = poll();
    in_flight_ = false;
    return outcome;
}

PollOutcome MonitorLoop::poll() {
    auto classifier = this->classifier();
    try {
        std::optional<Frame> frame = source_.latest();
        if (!frame) {
            log_debug("No frames in " + source_.directory());
            record(PollOutcome::SKIPPED, "");
            return PollOutcome::SKIPPED;
        }

        if (last_success_ && last_success_->same_file(*frame)) {
            bool written = true;
            if (options_.log_unchanged) {
                auto snap = store_.snapshot();
                if (snap->known()) written = write_status(LogEntry{Clock::now(), snap->label});
            }
            log_debug("No new frame since " + frame->name());
            record(PollOutcome::SKIPPED, written ? "" : "could not append to " + logger_.path());
            return PollOutcome::SKIPPED;
        }

        if (!classifier) throw ModelNotLoaded("no roof model attached");

        ClassificationResult result = classifier->classify(*frame);
        if (result.evaluated_at == Clock::time_point{}) result.evaluated_at = Clock::now();
        apply_sun_guard(result);
        compare_secondary(result);

        store_.update(result);
        last_success_ = Frame(frame->path(), frame->mtime());
        const bool written = write_status(LogEntry{result.evaluated_at, result.label});

        char conf[16];
        std::snprintf(conf, sizeof(conf), "%.2f", result.confidence);
        log_info("Image: " + frame->name() + ", status: " + label_to_string(result.label) +
                 " (confidence " + conf + ")");
        {
            std::lock_guard<std::mutex> lock(stats_mu_);
            stats_.last_frame = frame->path().string();
        }
        record(PollOutcome::SUCCESS, written ? "" : "could not append to " + logger_.path());
        return PollOutcome::SUCCESS;
    } catch (const ModelNotLoaded& e) {
        log_error(std::string("Poll failed: ") + e.what());
        record(PollOutcome::FAILED, e.what());
    } catch (const RoofError& e) {
        log_warn(std::string("Poll failed: ") + e.what());
        record(PollOutcome::FAILED, e.what());
    } catch (const std::exception& e) {
        log_error(std::string("Poll failed unexpectedly: ") + e.what());
        record(PollOutcome::FAILED, e.what());
    }
    return PollOutcome::FAILED;
}

void MonitorLoop::apply_sun_guard(ClassificationResult& result) const {
    if (!options_.sun_guard) return;
    const double altitude = options_.sun_guard->altitude(result.evaluated_at);
    result.sun_altitude = altitude;
    if (result.label != RoofLabel::OPEN || !options_.sun_guard->blocks_open(altitude)) return;

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.1f deg (limit %.1f deg)", altitude,
                  options_.sun_guard->options().max_altitude_deg);
    log_warn(std::string("Sun at ") + buf + ", reporting OPEN roof as CLOSED");
    result.label = RoofLabel::CLOSED;
    result.confidence = 1.0 - result.open_score;
    result.sun_override = true;
}

void MonitorLoop::compare_secondary(ClassificationResult& result) const {
    if (options_.secondary_status_file.empty()) return;
    auto secondary = read_secondary_status(options_.secondary_status_file);
    if (!secondary) return;
    result.secondary_label = secondary->label;
    if (secondary->label == result.label) {
        log_info("Secondary source agrees: " + label_to_string(secondary->label));
    } else {
        log_warn("Secondary source reports " + label_to_string(secondary->label) + ", camera reports " +
                 label_to_string(result.label));
    }
}

bool MonitorLoop::write_status(const LogEntry& entry) {
    if (logger_.append(entry)) return true;
    std::lock_guard<std::mutex> lock(stats_mu_);
    stats_.log_write_failures++;
    return false;
}

void MonitorLoop::record(PollOutcome outcome, const std::string& error) {
    std::lock_guard<std::mutex> lock(stats_mu_);
    stats_.state = running_ ? LoopState::IDLE : LoopState::STOPPED;
    stats_.last_outcome = outcome;
    stats_.last_poll_at = Clock::now();
    stats_.polls++;
    switch (outcome) {
        case PollOutcome::SUCCESS:
            stats_.successes++;
            stats_.consecutive_failures = 0;
            stats_.last_error = error;
            break;
        case PollOutcome::SKIPPED:
            stats_.skipped++;
            stats_.consecutive_failures = 0;
            stats_.last_error = error;
            break;
        case PollOutcome::FAILED:
            stats_.failures++;
            stats_.consecutive_failures++;
            stats_.last_error = error;
            break;
        default:
            break;
    }
}

LoopState MonitorLoop::state() const {
    std::lock_guard<std::mutex> lock(stats_mu_);
    return stats_.state;
}

MonitorStats MonitorLoop::stats() const {
    std::lock_guard<std::mutex> lock(stats_mu_);
    return stats_;
}

}  // namespace roofwatch
