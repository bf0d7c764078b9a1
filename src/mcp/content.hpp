#pragma once
#include "../message.hpp"
#include <vector>
#include <nlohmann/json.hpp>

namespace termineer {

// MCP tools/call content item -> message content.
Content convert_mcp_content(const nlohmann::json& item);
std::vector<Content> convert_mcp_contents(const nlohmann::json& items);

// Joins the text parts with '\n'.
std::string contents_text(const std::vector<Content>& contents);

} // namespace termineer
