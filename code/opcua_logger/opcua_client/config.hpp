#pragma once

#include "endpoint.hpp"
#include <cstdint>
#include <string>
#include <optional>
#include <filesystem>
#include <istream>

namespace opcualogger {

/**
 * @brief 采集器配置
 */
struct LoggerConfig {
    std::string server_url;                  ///< OPC UA 服务器URL
    std::string security_mode;               ///< 安全模式 ("None", "Sign", "SignAndEncrypt")
    std::string username;                    ///< 用户名 (为空表示匿名)
    std::string password;                    ///< 密码
    std::optional<DataPointId> data_point;   ///< 采集的节点 (浏览模式下可为空)
    std::string unit;                        ///< 服务器未提供单位时使用的单位
    std::filesystem::path log_file;          ///< 记录存储文件路径
    double poll_interval_seconds;            ///< 采集间隔 (秒)
    double connect_timeout_seconds;          ///< 连接/请求超时 (秒)
    double reconnect_base_seconds;           ///< 重连退避基数 (秒)
    double reconnect_max_seconds;            ///< 重连退避上限 (秒)
    bool reconnect_jitter;                   ///< 是否使用全抖动
    uint32_t max_browse_depth;               ///< 浏览最大深度
    DataPointId browse_root;                 ///< 浏览起始节点
    bool timestamp_utc;                      ///< 时间戳使用UTC (否则本地时间)
    bool verbose;                            ///< 是否在控制台回显每条记录

    LoggerConfig() :
        security_mode("None"),
        unit("mbar"),
        log_file("pressure_log.txt"),
        poll_interval_seconds(10.0),
        connect_timeout_seconds(5.0),
        reconnect_base_seconds(1.0),
        reconnect_max_seconds(30.0),
        reconnect_jitter(true),
        max_browse_depth(8),
        browse_root(DataPointId::objectsFolder()),
        timestamp_utc(false),
        verbose(true) {}
};

/**
 * @brief 配置加载器
 */
class ConfigLoader {
public:
    static constexpr double kMaxSeconds = 86400.0;          ///< 时间类配置的上限 (一天)
    static constexpr uint32_t kMaxBrowseDepth = 1000;       ///< MaxBrowseDepth 上限

    /**
     * @brief 从文件加载配置
     * @param config_file_path 配置文件路径
     * @return 加载的配置，如果失败返回std::nullopt
     */
    static std::optional<LoggerConfig> loadFromFile(const std::filesystem::path& config_file_path);

    /**
     * @brief 从文本解析配置 (key = value，# 开头为注释)
     */
    static std::optional<LoggerConfig> parse(std::istream& input);

private:
    static bool parseSeconds(const std::string& key, const std::string& value, double& out);

    static bool parseBool(const std::string& value);

    /**
     * @brief 去除字符串首尾空白字符
     */
    static std::string trim(const std::string& str);
};

} // namespace opcualogger
