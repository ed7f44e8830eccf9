#pragma once

#include "../opcua_client/config.hpp"
#include "../opcua_client/session_manager.hpp"
#include "../acquisition/cancellation.hpp"
#include "../acquisition/clock.hpp"
#include "../acquisition/poller.hpp"
#include "../acquisition/reading_handlers.hpp"
#include "../catalog/catalog_browser.hpp"
#include "../record_store/durable_logger.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace opcualogger {

/**
 * @brief 进程退出码
 */
enum class ExitCode : int {
    Clean = 0,          ///< 操作员请求的正常退出 / 浏览成功
    ConfigError = 1,    ///< 参数或配置错误
    ConnectFatal = 2,   ///< 致命连接错误
    WriteFatal = 3,     ///< 致命写入错误
    BrowseFailed = 4,   ///< 浏览未完成
    Unexpected = 5      ///< 未分类的异常
};

const char* exitCodeName(ExitCode code);

/**
 * @brief 生命周期控制器
 *
 * 组装会话管理器、采集器和记录器，持有唯一的取消标志。
 * 采集在一个工作线程中顺序执行 (读取 -> 写入)，
 * 取消后完成当前读取和写入，然后关闭会话。
 */
class LifecycleController {
public:
    /**
     * @brief 构造函数
     * @param config 配置
     * @param client 远端客户端
     * @param clock 时钟
     * @throws ConnectError (Fatal) 端点配置非法
     */
    LifecycleController(const LoggerConfig& config, std::unique_ptr<IRemoteClient> client, IClock& clock);

    ~LifecycleController();

    LifecycleController(const LifecycleController&) = delete;
    LifecycleController& operator=(const LifecycleController&) = delete;

    /**
     * @brief 连接服务器并启动采集线程
     * @return 启动成功返回 Clean，否则返回对应的失败退出码 (此时不写任何记录)
     */
    ExitCode start();

    /**
     * @brief 请求停止 (只置位取消标志，可在任意线程调用)
     */
    void requestStop();

    /**
     * @brief 停止采集: 取消、等待工作线程结束、关闭会话
     * @return 最终退出码
     */
    ExitCode stop();

    /**
     * @brief 启动采集并阻塞直到取消或致命错误
     */
    ExitCode runAcquisition();

    /**
     * @brief 连接服务器并浏览节点目录 (与采集互斥)
     * @throws ConnectError
     */
    BrowseResult browse();

    /**
     * @brief 在工作线程上浏览，keep_running 变为 false 时请求停止
     *
     * 信号处理函数只能修改原子标志，这里把它转换为取消请求。
     * 已浏览的部分以 Cancelled 错误返回。
     * @throws ConnectError
     */
    BrowseResult browseWhile(const std::atomic<bool>& keep_running,
                             std::chrono::milliseconds check_interval = std::chrono::milliseconds(100));

    bool isRunning() const { return running_.load(); }

    ExitCode exitCode() const { return exit_code_.load(); }

    SessionState getSessionState() const { return sessions_.getState(); }

    size_t recordsWritten() const { return logger_ ? logger_->recordsWritten() : 0; }

    const CancellationToken& cancellation() const { return cancel_; }

private:
    void acquisitionLoop();

    /**
     * @brief 记录失败原因并取消 (只保留第一个原因)
     */
    void fail(ExitCode code);

    const LoggerConfig& config_;                        ///< 配置引用
    IClock& clock_;                                     ///< 时钟
    CancellationToken cancel_;                          ///< 取消标志
    SessionManager sessions_;                           ///< 会话管理器
    std::shared_ptr<DurableLogger> logger_;             ///< 记录存储
    std::shared_ptr<IReadingHandler> handler_;          ///< 读数处理链
    std::unique_ptr<Poller> poller_;                    ///< 采集器
    std::thread worker_thread_;                         ///< 采集线程
    std::atomic<bool> running_;                         ///< 采集线程是否运行
    std::atomic<ExitCode> exit_code_;                   ///< 退出码
};

} // namespace opcualogger
