#include "catalog_json.hpp"
#include <rapidjson/prettywriter.h>

namespace opcualogger {

std::string CatalogJsonWriter::render(const BrowseResult& result, bool pretty) {
    rapidjson::StringBuffer buffer;

    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        write(writer, result);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        write(writer, result);
    }

    return std::string(buffer.GetString(), buffer.GetSize());
}

template <typename Writer>
void CatalogJsonWriter::write(Writer& writer, const BrowseResult& result) {
    writer.StartObject();

    writer.Key("root");
    writer.String(result.root.id.toString().c_str());

    writer.Key("complete");
    writer.Bool(result.ok());

    if (result.error) {
        writer.Key("error");
        writer.StartObject();
        writer.Key("kind");
        writer.String(severityName(result.error->severity()));
        writer.Key("message");
        writer.String(result.error->what());
        writer.EndObject();
    }

    writer.Key("entries");
    writer.StartArray();
    for (const auto& entry : result.entries) {
        writer.StartObject();
        writer.Key("id");
        writer.String(entry.id.toString().c_str());
        writer.Key("displayName");
        writer.String(entry.display_name.c_str(), static_cast<rapidjson::SizeType>(entry.display_name.size()));
        writer.Key("path");
        writer.String(entry.path.c_str(), static_cast<rapidjson::SizeType>(entry.path.size()));
        writer.Key("depth");
        writer.Uint64(entry.depth);
        writer.EndObject();
    }
    writer.EndArray();

    writer.EndObject();
}

} // namespace opcualogger
