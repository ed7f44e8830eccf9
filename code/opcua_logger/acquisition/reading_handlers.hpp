#pragma once

#include "reading.hpp"
#include "../record_store/record_codec.hpp"
#include <memory>

namespace opcualogger {

/**
 * @brief 控制台读数处理器
 * 把每条记录回显到控制台
 */
class ConsoleReadingHandler : public IReadingHandler {
public:
    explicit ConsoleReadingHandler(RecordCodec codec);

    /**
     * @brief 处理接收到的读数
     * @param reading 读数
     */
    void handleReading(const Reading& reading) override;

    /**
     * @brief 设置是否显示详细信息
     * @param verbose 是否详细输出
     */
    void setVerbose(bool verbose) { verbose_ = verbose; }

private:
    RecordCodec codec_;     ///< 行格式
    bool verbose_ = true;   ///< 是否详细输出
};

/**
 * @brief 复合读数处理器
 * 先写入记录存储，成功后再回显到控制台
 */
class CompositeReadingHandler : public IReadingHandler {
public:
    /**
     * @brief 构造函数
     * @param store_handler 记录存储处理器 (写入失败时异常向上传播)
     * @param console_handler 控制台处理器（可为空）
     */
    CompositeReadingHandler(std::shared_ptr<IReadingHandler> store_handler,
                            std::shared_ptr<ConsoleReadingHandler> console_handler);

    void handleReading(const Reading& reading) override;

private:
    std::shared_ptr<IReadingHandler> store_handler_;            ///< 记录存储处理器
    std::shared_ptr<ConsoleReadingHandler> console_handler_;    ///< 控制台处理器
};

} // namespace opcualogger
