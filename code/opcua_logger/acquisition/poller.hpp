#pragma once

#include "clock.hpp"
#include "cancellation.hpp"
#include "reading.hpp"
#include "../opcua_client/session_manager.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace opcualogger {

/**
 * @brief 采集参数
 */
struct PollerOptions {
    DataPointId data_point;                             ///< 采集的节点
    std::chrono::milliseconds interval{10000};          ///< 采集间隔
    std::string default_unit = "mbar";                  ///< 服务器未提供单位时使用
};

/**
 * @brief 定时采集器
 *
 * 按固定的时间网格 t0 + k*interval 触发，读取耗时不会累积漂移；
 * 读取超过一个周期时下一次立即触发并以触发时刻重新对齐，
 * 不会积压多个待执行的周期。
 *
 * 单次失败不会终止采集，而是产生一条 Failed 读数。
 * 只有致命的连接错误会抛出。
 */
class Poller {
public:
    Poller(SessionManager& sessions, PollerOptions options, IClock& clock, const CancellationToken& cancel);

    /**
     * @brief 等待下一个周期并读取一次
     * @return 取消后返回std::nullopt
     * @throws ConnectError (Fatal)
     */
    std::optional<Reading> next();

    /**
     * @brief 持续采集直到取消，每条读数交给 handler
     * @return 产生的读数数量
     * @throws ConnectError (Fatal), handler 抛出的异常 (如 WriteError)
     */
    size_t run(IReadingHandler& handler);

    const PollerOptions& options() const { return options_; }

private:
    Reading readOnce();

    SessionManager& sessions_;                          ///< 会话管理器
    PollerOptions options_;                             ///< 采集参数
    IClock& clock_;                                     ///< 时钟
    const CancellationToken& cancel_;                   ///< 取消标志
    bool started_;                                      ///< 是否已触发第一个周期
    std::chrono::steady_clock::time_point next_tick_;   ///< 下一个周期时刻
};

} // namespace opcualogger
