#pragma once

#include "../opcua_client/remote_client.hpp"
#include "../acquisition/cancellation.hpp"
#include <optional>
#include <string>
#include <vector>

namespace opcualogger {

/**
 * @brief 节点目录树中的一个节点 (只在一次浏览中存在)
 */
struct CatalogNode {
    DataPointId id;                     ///< 节点ID
    std::string display_name;           ///< 显示名称
    std::vector<CatalogNode> children;  ///< 子节点 (服务器返回顺序)
};

/**
 * @brief 展平后的目录条目
 */
struct CatalogEntry {
    DataPointId id;             ///< 节点ID
    std::string display_name;   ///< 显示名称
    std::string path;           ///< 从根开始的显示名称路径，以 / 分隔
    size_t depth = 0;           ///< 深度 (根为0)
};

/**
 * @brief 一次浏览的结果
 * 出错时 entries 保留已经取得的部分
 */
struct BrowseResult {
    CatalogNode root;                       ///< 目录树
    std::vector<CatalogEntry> entries;      ///< 展平列表 (深度优先顺序)
    std::optional<BrowseError> error;       ///< 中途失败的原因

    bool ok() const { return !error.has_value(); }
};

/**
 * @brief 节点目录浏览器
 *
 * 深度优先遍历，子节点按服务器返回顺序访问。
 * 不记录已访问节点，循环引用由最大深度终止 (DepthExceeded)。
 */
class CatalogBrowser {
public:
    /**
     * @brief 构造函数
     * @param max_depth 最大深度，达到该深度的节点仍有子节点时失败
     * @param cancel 取消标志 (可为空)，每一步浏览前检查
     */
    explicit CatalogBrowser(size_t max_depth, const CancellationToken* cancel = nullptr);

    /**
     * @brief 浏览服务器节点目录
     * @param session 借用的会话
     * @param root 起始节点，缺省为 Objects 文件夹
     */
    BrowseResult browse(IRemoteClient& session,
                        const DataPointId& root = DataPointId::objectsFolder()) const;

    /**
     * @brief 渲染为文本列表，每行 "<id>  <path>"
     */
    static std::string formatListing(const BrowseResult& result);

    /// 根节点的显示名称
    static std::string rootDisplayName(const DataPointId& root);

private:
    void visit(IRemoteClient& session, CatalogNode& node, const std::string& path,
               size_t depth, BrowseResult& result) const;

    size_t max_depth_;
    const CancellationToken* cancel_;
};

} // namespace opcualogger
