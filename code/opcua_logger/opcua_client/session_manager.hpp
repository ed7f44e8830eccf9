#pragma once

#include "endpoint.hpp"
#include "remote_client.hpp"
#include "../acquisition/clock.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <random>
#include <string>

namespace opcualogger {

/**
 * @brief 会话状态
 */
enum class SessionState {
    Disconnected = 0,   ///< 未连接
    Connecting = 1,     ///< 正在连接
    Connected = 2,      ///< 会话激活
    Closing = 3         ///< 正在关闭
};

const char* sessionStateName(SessionState state);

/**
 * @brief 重连退避策略
 * 第n次连续失败后的等待时间为 min(max_delay, base_delay * 2^n)，
 * 启用抖动时在 [0, 该值] 内均匀取值
 */
struct ReconnectPolicy {
    std::chrono::milliseconds base_delay{1000};     ///< 退避基数
    std::chrono::milliseconds max_delay{30000};     ///< 退避上限
    bool full_jitter = true;                        ///< 是否启用全抖动
};

/**
 * @brief 会话管理器
 *
 * 独占远端客户端，调用方只能通过 connect / ensureConnected
 * 借用一次操作所需的会话引用。
 */
class SessionManager {
public:
    using StateListener = std::function<void(SessionState from, SessionState to, const std::string& reason)>;

    /**
     * @brief 构造函数
     * @param endpoint 服务器端点
     * @param client 远端客户端 (所有权转移给管理器)
     * @param policy 重连策略
     * @param clock 时钟
     */
    SessionManager(Endpoint endpoint,
                   std::unique_ptr<IRemoteClient> client,
                   ReconnectPolicy policy,
                   IClock& clock,
                   uint32_t seed = std::random_device{}());

    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * @brief 立即尝试建立会话 (不受退避限制)
     * @throws ConnectError 临时错误会安排下一次重连时间
     */
    IRemoteClient& connect();

    /**
     * @brief 返回可用会话，必要时重连
     *
     * 会话健康时直接返回；否则在退避窗口外尝试重连，
     * 窗口内抛出临时 ConnectError 而不阻塞。
     * @throws ConnectError
     */
    IRemoteClient& ensureConnected();

    /**
     * @brief 借用方报告会话出现临时故障，关闭会话等待重连
     */
    void markBroken(const std::string& reason);

    /**
     * @brief 断开连接，任何状态下都可调用
     */
    void disconnect();

    SessionState getState() const { return state_.load(); }

    std::string getStateString() const { return sessionStateName(getState()); }

    const Endpoint& endpoint() const { return endpoint_; }

    /// 连续失败次数
    uint32_t consecutiveFailures() const { return consecutive_failures_; }

    void setStateListener(StateListener listener) { listener_ = std::move(listener); }

private:
    void closeSession(const std::string& reason);

    void scheduleRetry();

    void updateState(SessionState new_state, const std::string& reason);

    Endpoint endpoint_;                                     ///< 服务器端点
    std::unique_ptr<IRemoteClient> client_;                 ///< 远端客户端
    ReconnectPolicy policy_;                                ///< 重连策略
    IClock& clock_;                                         ///< 时钟
    std::mt19937 rng_;                                      ///< 抖动随机源
    std::atomic<SessionState> state_;                       ///< 当前状态
    uint32_t consecutive_failures_;                         ///< 连续失败次数
    bool retry_armed_;                                      ///< 是否处于退避窗口
    std::chrono::steady_clock::time_point next_attempt_;    ///< 下一次允许重连的时刻
    StateListener listener_;                                ///< 状态变化回调
};

} // namespace opcualogger
