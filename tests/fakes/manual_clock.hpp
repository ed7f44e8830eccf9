/**
 * @file manual_clock.hpp
 * @brief Deterministic IClock for tests.
 *
 * Time only moves when a test calls advance() or when code under test
 * sleeps. sleepUntil() jumps both clocks forward to the deadline.
 */
#pragma once

#include "acquisition/clock.hpp"
#include <chrono>
#include <ctime>
#include <mutex>
#include <thread>
#include <vector>

namespace opcualogger::testing {

class ManualClock : public IClock {
public:
    /// 2025-02-12 11:28:13 UTC
    static constexpr std::time_t kStartEpoch = 1739359693;

    ManualClock()
        : wall_(std::chrono::system_clock::from_time_t(kStartEpoch))
        , steady_(std::chrono::steady_clock::time_point{} + std::chrono::hours(1)) {}

    std::chrono::system_clock::time_point wallNow() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return wall_;
    }

    std::chrono::steady_clock::time_point steadyNow() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return steady_;
    }

    bool sleepUntil(std::chrono::steady_clock::time_point deadline,
                    const CancellationToken& cancel) override {
        if (real_delay_.count() > 0) {
            std::this_thread::sleep_for(real_delay_);
        }
        if (cancel.isCancelled()) {
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sleeps_.push_back(deadline);
            if (deadline > steady_) {
                auto delta = deadline - steady_;
                steady_ += delta;
                wall_ += std::chrono::duration_cast<std::chrono::system_clock::duration>(delta);
            }
        }
        return !cancel.isCancelled();
    }

    void advance(std::chrono::milliseconds delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        steady_ += delta;
        wall_ += delta;
    }

    /// Real time spent in every sleepUntil(), throttles threaded tests.
    void setRealDelay(std::chrono::milliseconds delay) { real_delay_ = delay; }

    std::vector<std::chrono::steady_clock::time_point> sleeps() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sleeps_;
    }

private:
    mutable std::mutex mutex_;
    std::chrono::system_clock::time_point wall_;
    std::chrono::steady_clock::time_point steady_;
    std::chrono::milliseconds real_delay_{0};
    std::vector<std::chrono::steady_clock::time_point> sleeps_;
};

} // namespace opcualogger::testing
