#pragma once

#include "catalog_browser.hpp"
#include <string>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace opcualogger {

/**
 * @brief 目录列表的 JSON 输出
 *
 * {"root":"i=85","complete":true,"entries":[{"id":...,"displayName":...,"path":...,"depth":...}]}
 * 浏览失败时附带 "error":{"kind":...,"message":...}
 */
class CatalogJsonWriter {
public:
    /**
     * @brief 渲染浏览结果
     * @param result 浏览结果
     * @param pretty 是否缩进输出
     */
    static std::string render(const BrowseResult& result, bool pretty = true);

private:
    template <typename Writer>
    static void write(Writer& writer, const BrowseResult& result);
};

} // namespace opcualogger
