#pragma once

#include "../acquisition/reading.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace opcualogger {

/**
 * @brief 时间戳时区
 */
enum class TimestampZone {
    Local = 0,      ///< 本地时间
    Utc = 1         ///< UTC
};

/**
 * @brief 记录存储的行格式
 *
 * 每行一条读数:
 *   2025-02-12 11:28:13.000, 1.9899999870176543e-09 mbar
 *   2025-02-12 11:29:00.000, FAILED: timeout
 *
 * 本地时区的时间戳带 UTC 偏移 (2025-10-26 02:30:00.000+0200)，UTC 时间戳不带。
 */
class RecordCodec {
public:
    explicit RecordCodec(TimestampZone zone = TimestampZone::Local);

    /**
     * @brief 格式化一条记录 (不含换行符)
     */
    std::string format(const Reading& reading) const;

    /**
     * @brief 解析一条记录
     * @return 格式不正确返回std::nullopt
     */
    std::optional<Reading> parse(const std::string& line) const;

    std::string formatTimestamp(std::chrono::system_clock::time_point timestamp) const;

    std::optional<std::chrono::system_clock::time_point> parseTimestamp(const std::string& text) const;

    /**
     * @brief 最短且可无损还原的十进制表示
     */
    static std::string formatValue(double value);

    static std::optional<double> parseValue(const std::string& text);

    static constexpr const char* kFailedMarker = "FAILED: ";

private:
    TimestampZone zone_;
};

} // namespace opcualogger
