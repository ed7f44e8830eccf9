#pragma once

#include "record_codec.hpp"
#include "../acquisition/reading.hpp"
#include "../opcua_client/errors.hpp"
#include <atomic>
#include <filesystem>

namespace opcualogger {

/**
 * @brief 追加写入的记录存储
 *
 * 每次 append 打开文件 (不存在则创建)，一次写入完整的一行，刷新后关闭。
 * 写入失败抛出 WriteError，之后拒绝继续写入。
 */
class DurableLogger : public IReadingHandler {
public:
    DurableLogger(std::filesystem::path path, RecordCodec codec);

    /**
     * @brief 启动时检查存储尾部
     *
     * 上次进程在写入中途退出时文件末尾会残留不完整的一行，
     * 这里把它截断到最后一个完整记录。
     * @return 截断的字节数
     * @throws WriteError
     */
    std::uintmax_t recover();

    /**
     * @brief 追加一条记录
     * @throws WriteError
     */
    void append(const Reading& reading);

    void handleReading(const Reading& reading) override { append(reading); }

    size_t recordsWritten() const { return records_written_.load(); }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;            ///< 存储文件路径
    RecordCodec codec_;                     ///< 行格式
    bool failed_;                           ///< 是否已发生写入错误
    std::atomic<size_t> records_written_;   ///< 本次运行写入的记录数
};

} // namespace opcualogger
