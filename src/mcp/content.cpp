#include "content.hpp"
#include "../utils.hpp"

namespace termineer {

namespace {

// Reads a string member, treating absent or mistyped fields as the fallback.
std::string string_field(const nlohmann::json& obj, const char* key, const std::string& fallback) {
    auto it = obj.find(key);
    return it != obj.end() && it->is_string() ? it->get<std::string>() : fallback;
}

} // namespace

Content convert_mcp_content(const nlohmann::json& item) {
    if (!item.is_object()) return Content::make_text(item.dump());
    std::string type = string_field(item, "type", "text");

    if (type == "image") {
        return Content::make_image(string_field(item, "mimeType", "image/png"), string_field(item, "data", ""));
    }

    if (type == "resource" && item.contains("resource") && item["resource"].is_object()) {
        auto& res = item["resource"];
        std::string uri = string_field(res, "uri", "");
        if (res.contains("text")) {
            return Content::make_text("Resource " + uri + ": " + string_field(res, "text", ""));
        }
        std::string mime = string_field(res, "mimeType", "");
        if (starts_with(mime, "image/") && res.contains("blob")) {
            return Content::make_image(mime, string_field(res, "blob", ""));
        }
        return Content::make_document(uri);
    }

    if (item.contains("text") && item["text"].is_string()) {
        return Content::make_text(item["text"].get<std::string>());
    }
    // Unknown content kinds are kept as their JSON text.
    return Content::make_text(item.dump());
}

std::vector<Content> convert_mcp_contents(const nlohmann::json& items) {
    std::vector<Content> out;
    if (!items.is_array()) return out;
    for (auto& item : items) out.push_back(convert_mcp_content(item));
    return out;
}

std::string contents_text(const std::vector<Content>& contents) {
    std::string result;
    for (auto& c : contents) {
        if (c.type != ContentType::text) continue;
        if (!result.empty()) result += "\n";
        result += c.text;
    }
    return result;
}

} // namespace termineer
