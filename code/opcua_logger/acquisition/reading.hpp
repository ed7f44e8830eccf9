#pragma once

#include <string>
#include <chrono>

namespace opcualogger {

/**
 * @brief 读数状态
 */
enum class ReadingStatus {
    Ok = 0,         ///< 读取成功
    Failed = 1      ///< 读取失败，failure_reason 说明原因
};

/**
 * @brief 一次采集的读数
 *
 * 由 Poller 每个采集周期创建一次，创建后不再修改，
 * 由记录器消费一次。
 */
struct Reading {
    std::chrono::system_clock::time_point timestamp;    ///< 采集时间 (毫秒精度)
    double value = 0.0;                                 ///< 数值 (仅 Ok 有效)
    std::string unit;                                   ///< 工程单位 (仅 Ok 有效)
    ReadingStatus status = ReadingStatus::Ok;           ///< 状态
    std::string failure_reason;                         ///< 失败原因 (仅 Failed 有效)

    static Reading ok(std::chrono::system_clock::time_point timestamp, double value, std::string unit);

    /**
     * @brief 失败读数
     *
     * 原因保持单行 (CR/LF 替换为空格)，空原因记为 "unknown"。
     */
    static Reading failed(std::chrono::system_clock::time_point timestamp, std::string reason);

    bool isOk() const { return status == ReadingStatus::Ok; }
};

/**
 * @brief 读数处理器接口
 */
class IReadingHandler {
public:
    virtual ~IReadingHandler() = default;

    /**
     * @brief 处理一条读数
     * @param reading 读数
     */
    virtual void handleReading(const Reading& reading) = 0;
};

} // namespace opcualogger
