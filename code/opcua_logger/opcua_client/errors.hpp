#pragma once

#include <stdexcept>
#include <string>

namespace opcualogger {

/**
 * @brief 错误分类
 * Transient 可重试，Fatal 需要人工介入
 */
enum class ErrorSeverity {
    Transient = 0,      ///< 临时错误 (超时、连接重置、服务器繁忙)
    Fatal = 1,          ///< 致命错误 (认证失败、地址非法、存储失败)
    DepthExceeded = 2,  ///< 浏览深度超限
    Cancelled = 3       ///< 操作被取消
};

const char* severityName(ErrorSeverity severity);

/**
 * @brief 所有分类错误的基类
 */
class LoggerError : public std::runtime_error {
public:
    LoggerError(ErrorSeverity severity, const std::string& message)
        : std::runtime_error(message)
        , severity_(severity) {}

    ErrorSeverity severity() const { return severity_; }

    bool isFatal() const { return severity_ == ErrorSeverity::Fatal; }

private:
    ErrorSeverity severity_;
};

/// 建立会话失败
class ConnectError : public LoggerError {
public:
    using LoggerError::LoggerError;
};

/// 读取数据点失败
class ReadError : public LoggerError {
public:
    using LoggerError::LoggerError;
};

/// 浏览节点目录失败
class BrowseError : public LoggerError {
public:
    using LoggerError::LoggerError;
};

/**
 * @brief 记录存储写入失败
 * 总是致命的: 无法记录数据就停止采集
 */
class WriteError : public LoggerError {
public:
    explicit WriteError(const std::string& message)
        : LoggerError(ErrorSeverity::Fatal, message) {}
};

} // namespace opcualogger
