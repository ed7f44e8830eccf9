#pragma once

#include "cancellation.hpp"
#include <chrono>

namespace opcualogger {

/**
 * @brief 时钟接口
 * 调度使用单调时钟，记录时间戳使用系统时钟
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual std::chrono::system_clock::time_point wallNow() const = 0;

    virtual std::chrono::steady_clock::time_point steadyNow() const = 0;

    /**
     * @brief 休眠到指定时刻
     * @return 被取消时返回false
     */
    virtual bool sleepUntil(std::chrono::steady_clock::time_point deadline,
                            const CancellationToken& cancel) = 0;
};

/**
 * @brief 真实时钟
 */
class SystemClock : public IClock {
public:
    std::chrono::system_clock::time_point wallNow() const override;

    std::chrono::steady_clock::time_point steadyNow() const override;

    bool sleepUntil(std::chrono::steady_clock::time_point deadline,
                    const CancellationToken& cancel) override;
};

} // namespace opcualogger
