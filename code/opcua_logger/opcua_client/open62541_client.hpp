#pragma once

#include "remote_client.hpp"
#include <open62541pp/client.hpp>
#include <open62541pp/node.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace opcualogger {

/**
 * @brief 将 OPC UA 状态码归类为临时或致命错误
 *
 * 认证、证书、端点地址、未知节点、类型不匹配等为致命错误，
 * 其余 (超时、连接关闭、服务器繁忙...) 视为临时错误。
 */
ErrorSeverity classifyStatus(UA_StatusCode status);

/**
 * @brief 取出 EngineeringUnits 属性值 (EUInformation) 的显示名
 * @return 不是 EUInformation 标量时返回空字符串
 */
std::string engineeringUnitText(const UA_Variant& value);

/**
 * @brief 基于 open62541pp 的 OPC UA 客户端
 */
class Open62541Client : public IRemoteClient {
public:
    /**
     * @brief 构造函数
     * @param request_timeout 连接及每个服务请求的超时
     */
    explicit Open62541Client(std::chrono::milliseconds request_timeout);

    ~Open62541Client() override;

    void connect(const Endpoint& endpoint) override;

    RemoteValue readValue(const DataPointId& id) override;

    std::vector<RemoteReference> browseChildren(const DataPointId& id) override;

    void close() override;

    bool isAlive() const override;

    /**
     * @brief 把浏览结果中的引用追加到 out
     * @throws BrowseError 节点标识无法转换
     */
    static void collectReferences(const UA_BrowseResult& result, std::vector<RemoteReference>& out);

private:
    static opcua::NodeId toNodeId(const DataPointId& id);

    static DataPointId fromNodeId(const UA_NodeId& id);

    /**
     * @brief 把标量 Variant 转换为 double
     * @throws ReadError (Fatal) 非标量或非数值类型
     */
    static double toNumber(const opcua::Variant& variant, const DataPointId& id);

    /**
     * @brief 查询节点的工程单位，每个会话每个节点只查一次
     * @return 节点没有 EngineeringUnits 属性时返回空字符串
     */
    std::string lookupUnit(const DataPointId& id, const opcua::NodeId& node_id);

    /**
     * @brief 通知服务器放弃未取完的浏览结果，并清空续传点
     */
    void releaseContinuationPoint(UA_ByteString& continuation);

    std::unique_ptr<opcua::Client> client_;             ///< OPC UA 客户端实例
    uint32_t request_timeout_ms_;                       ///< 请求超时 (毫秒)
    bool connected_;                                    ///< 会话是否已激活
    std::map<std::string, std::string> units_;          ///< 节点 -> 工程单位
};

} // namespace opcualogger
