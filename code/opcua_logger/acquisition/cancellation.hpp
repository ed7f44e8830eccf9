#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace opcualogger {

/**
 * @brief 一次性取消标志
 *
 * 只能被置位一次，可被多个线程读取。waitUntil 在取消时立即返回，
 * 用于采集间隔的可中断等待。
 */
class CancellationToken {
public:
    /**
     * @brief 置位取消标志
     * @return 本次调用是否第一次置位
     */
    bool cancel();

    bool isCancelled() const { return cancelled_.load(); }

    /**
     * @brief 等待到指定时刻或被取消
     * @return 到达时刻返回true，被取消返回false
     */
    bool waitUntil(std::chrono::steady_clock::time_point deadline) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace opcualogger
