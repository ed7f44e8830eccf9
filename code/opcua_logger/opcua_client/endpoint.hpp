#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace opcualogger {

/**
 * @brief 数据点标识符类型
 */
enum class IdentifierType {
    Numeric = 0,    ///< i=<数字>
    String = 1,     ///< s=<字符串>
    Opaque = 2      ///< GUID / ByteString，仅用于浏览显示
};

/**
 * @brief OPC UA 数据点标识 (命名空间 + 标识符)
 *
 * 文本形式与 OPC UA 一致: "ns=1;s=G1_pressure", "i=85"。
 * 命名空间缺省为 0。
 */
struct DataPointId {
    uint16_t namespace_index = 0;                     ///< 命名空间索引
    IdentifierType type = IdentifierType::Numeric;    ///< 标识符类型
    std::string identifier;                           ///< 标识符 (数字以十进制文本保存)

    DataPointId() = default;
    DataPointId(uint16_t ns, uint32_t numeric);
    DataPointId(uint16_t ns, std::string name);

    /**
     * @brief 解析文本形式的节点ID
     * @return 解析失败返回std::nullopt
     */
    static std::optional<DataPointId> parse(const std::string& text);

    /// 服务器 Objects 文件夹 (ns=0;i=85)
    static DataPointId objectsFolder();

    /**
     * @brief 数字标识符的值，非数字类型返回0
     */
    uint32_t numericValue() const;

    std::string toString() const;

    bool operator==(const DataPointId& other) const;
    bool operator!=(const DataPointId& other) const { return !(*this == other); }
};

/**
 * @brief 服务器端点描述 (启动时由配置生成，之后不再修改)
 */
struct Endpoint {
    std::string url;                    ///< 完整地址 opc.tcp://host:port/path
    std::string host;                   ///< 主机名或IP
    uint16_t port = 4840;               ///< 端口
    std::string security_mode = "None"; ///< "None", "Sign", "SignAndEncrypt"
    std::string username;               ///< 用户名 (为空表示匿名)
    std::string password;               ///< 密码

    /**
     * @brief 校验并拆分端点地址
     * @param url 形如 opc.tcp://10.0.5.76:4840
     * @throws ConnectError (Fatal) 地址格式非法或安全模式未知
     */
    static Endpoint parse(const std::string& url,
                          const std::string& security_mode = "None",
                          const std::string& username = "",
                          const std::string& password = "");
};

} // namespace opcualogger
