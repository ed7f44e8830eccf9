#include "catalog_browser.hpp"
#include <iomanip>
#include <sstream>

namespace opcualogger {

CatalogBrowser::CatalogBrowser(size_t max_depth, const CancellationToken* cancel)
    : max_depth_(max_depth)
    , cancel_(cancel) {
}

BrowseResult CatalogBrowser::browse(IRemoteClient& session, const DataPointId& root) const {
    BrowseResult result;
    result.root.id = root;
    result.root.display_name = rootDisplayName(root);

    CatalogEntry root_entry;
    root_entry.id = root;
    root_entry.display_name = result.root.display_name;
    root_entry.path = result.root.display_name;
    root_entry.depth = 0;
    result.entries.push_back(root_entry);

    try {
        visit(session, result.root, root_entry.path, 0, result);
    } catch (const BrowseError& e) {
        result.error = e;
    }

    return result;
}

void CatalogBrowser::visit(IRemoteClient& session, CatalogNode& node, const std::string& path,
                           size_t depth, BrowseResult& result) const {
    if (cancel_ && cancel_->isCancelled()) {
        throw BrowseError(ErrorSeverity::Cancelled, "Browse cancelled at " + path);
    }

    std::vector<RemoteReference> children = session.browseChildren(node.id);
    if (children.empty()) {
        return;
    }

    if (depth >= max_depth_) {
        throw BrowseError(ErrorSeverity::DepthExceeded,
                          "Maximum browse depth " + std::to_string(max_depth_) + " exceeded at " + path);
    }

    for (auto& child : children) {
        CatalogEntry entry;
        entry.id = child.id;
        entry.display_name = child.display_name;
        entry.path = path + "/" + child.display_name;
        entry.depth = depth + 1;
        result.entries.push_back(entry);

        CatalogNode child_node;
        child_node.id = std::move(child.id);
        child_node.display_name = std::move(child.display_name);
        node.children.push_back(std::move(child_node));

        visit(session, node.children.back(), entry.path, depth + 1, result);
    }
}

std::string CatalogBrowser::formatListing(const BrowseResult& result) {
    std::ostringstream oss;
    for (const auto& entry : result.entries) {
        oss << std::left << std::setw(40) << entry.id.toString() << " " << entry.path << "\n";
    }
    return oss.str();
}

std::string CatalogBrowser::rootDisplayName(const DataPointId& root) {
    if (root.namespace_index == 0 && root.type == IdentifierType::Numeric) {
        switch (root.numericValue()) {
            case 84: return "Root";
            case 85: return "Objects";
            case 86: return "Types";
            case 87: return "Views";
            default: break;
        }
    }
    return root.toString();
}

} // namespace opcualogger
