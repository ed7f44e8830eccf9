#pragma once

#include "endpoint.hpp"
#include "errors.hpp"
#include <string>
#include <vector>

namespace opcualogger {

/**
 * @brief 一次读取的结果
 */
struct RemoteValue {
    double value = 0.0;     ///< 数值
    std::string unit;       ///< 工程单位 (服务器未提供时为空)
};

/**
 * @brief 浏览得到的子节点引用
 */
struct RemoteReference {
    DataPointId id;             ///< 子节点ID
    std::string display_name;   ///< 显示名称
};

/**
 * @brief 远端协议客户端接口
 *
 * 一个实例对应一个会话。实现负责把协议层的状态码
 * 映射为 ConnectError / ReadError / BrowseError。
 */
class IRemoteClient {
public:
    virtual ~IRemoteClient() = default;

    /**
     * @brief 建立连接并激活会话
     * @throws ConnectError
     */
    virtual void connect(const Endpoint& endpoint) = 0;

    /**
     * @brief 同步读取一个标量数据点
     * @throws ReadError
     */
    virtual RemoteValue readValue(const DataPointId& id) = 0;

    /**
     * @brief 列出节点的层级子节点，顺序与服务器返回一致
     * @throws BrowseError
     */
    virtual std::vector<RemoteReference> browseChildren(const DataPointId& id) = 0;

    /**
     * @brief 关闭会话，可重复调用
     */
    virtual void close() = 0;

    /**
     * @brief 会话是否仍然可用
     */
    virtual bool isAlive() const = 0;
};

} // namespace opcualogger
