#include "builtin_tools.hpp"
#include "../https_client.hpp"
#include "../buffer.hpp"

namespace termineer {

static const char* DEFAULT_SEARCH_ENGINE_ID = "77f98042a073d4c0e";
static const char* BROWSER_USER_AGENT =
    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0 Safari/537.36";

static std::string json_string(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    return it != obj.end() && it->is_string() ? it->get<std::string>() : "";
}

std::vector<SearchHit> parse_google_results(const nlohmann::json& response) {
    std::vector<SearchHit> hits;
    if (!response.is_object() || !response.contains("items") || !response["items"].is_array()) return hits;
    for (auto& item : response["items"]) {
        if (!item.is_object()) continue;
        SearchHit h;
        h.title = json_string(item, "title");
        h.url = json_string(item, "link");
        h.snippet = json_string(item, "snippet");
        if (!h.url.empty()) hits.push_back(std::move(h));
    }
    return hits;
}

// Result links go through a /l/?uddg=<target> redirect.
static std::string clean_duckduckgo_url(std::string url) {
    auto pos = url.find("uddg=");
    if (pos != std::string::npos) {
        std::string encoded = url.substr(pos + 5);
        auto amp = encoded.find('&');
        return url_decode(amp == std::string::npos ? encoded : encoded.substr(0, amp));
    }
    if (starts_with(url, "//")) return "https:" + url;
    if (starts_with(url, "/")) return "https://duckduckgo.com" + url;
    return url;
}

static std::string quoted_attr(const std::string& tag, const std::string& attr) {
    auto pos = tag.find(attr + "=\"");
    if (pos == std::string::npos) return "";
    pos += attr.size() + 2;
    auto end = tag.find('"', pos);
    return end == std::string::npos ? "" : tag.substr(pos, end - pos);
}

struct HtmlElement {
    std::string open_tag;  // text between '<' and '>'
    std::string inner;
    size_t end = std::string::npos;
};

// The element whose opening tag carries `marker`, searching from `from`.
static std::optional<HtmlElement> element_with(const std::string& html, const std::string& marker, size_t from) {
    auto at = html.find(marker, from);
    if (at == std::string::npos) return std::nullopt;
    auto open = html.rfind('<', at);
    auto close = html.find('>', at);
    if (open == std::string::npos || close == std::string::npos) return std::nullopt;

    HtmlElement el;
    el.open_tag = html.substr(open + 1, close - open - 1);
    auto name_end = el.open_tag.find_first_of(" \t\n");
    std::string name = to_lower(el.open_tag.substr(0, name_end));
    auto finish = html.find("</" + name, close + 1);
    if (finish == std::string::npos) return std::nullopt;
    el.inner = html.substr(close + 1, finish - close - 1);
    el.end = finish;
    return el;
}

std::vector<SearchHit> parse_duckduckgo_html(const std::string& html) {
    std::vector<SearchHit> hits;
    size_t pos = 0;
    while (hits.size() < MAX_SEARCH_RESULTS) {
        auto link = element_with(html, "class=\"result__a\"", pos);
        if (!link) break;
        pos = link->end;

        SearchHit h;
        h.title = html_to_text(link->inner);
        h.url = clean_duckduckgo_url(quoted_attr(link->open_tag, "href"));

        // The snippet belongs to this result only if it comes before the next title.
        auto next_link = html.find("class=\"result__a\"", pos);
        auto snippet = element_with(html, "class=\"result__snippet\"", pos);
        if (snippet && (next_link == std::string::npos || snippet->end < next_link)) {
            h.snippet = html_to_text(snippet->inner);
            pos = snippet->end;
        }
        if (h.title.empty()) h.title = "No title";
        if (h.snippet.empty()) h.snippet = "No description";
        hits.push_back(std::move(h));
    }
    return hits;
}

std::string format_search_results(const std::string& query, const std::vector<SearchHit>& hits,
                                  const std::string& engine) {
    std::string text = "Search results for \"" + query + "\"" +
                       (engine.empty() ? "" : " (via " + engine + ")") + ":\n\n";
    if (hits.empty()) return text + "No results found.\n";
    for (size_t i = 0; i < hits.size(); i++) {
        text += std::to_string(i + 1) + ". " + hits[i].title + "\n";
        text += "   URL: " + hits[i].url + "\n";
        if (!hits[i].snippet.empty()) text += "   " + hits[i].snippet + "\n";
        text += "\n";
    }
    return text;
}

static ToolResult google_search(const std::string& query, const std::string& api_key) {
    std::string cx = env_or("GOOGLE_SEARCH_ENGINE_ID", DEFAULT_SEARCH_ENGINE_ID);
    auto res = https_get("https://www.googleapis.com/customsearch/v1?key=" + url_encode(api_key) +
                         "&cx=" + url_encode(cx) + "&q=" + url_encode(query));
    if (res.status == 0) return ToolResult::failed("Error connecting to Google Search API: " + res.error);
    if (!res.ok()) {
        return ToolResult::failed("Error: Google Search API returned status code " + std::to_string(res.status));
    }
    auto j = nlohmann::json::parse(res.body, nullptr, false);
    if (j.is_discarded()) return ToolResult::failed("Error parsing Google Search API response");
    return ToolResult::ok(format_search_results(query, parse_google_results(j), ""));
}

static ToolResult duckduckgo_search(const std::string& query) {
    auto res = https_get("https://html.duckduckgo.com/html/?q=" + url_encode(query),
                         {{"User-Agent", BROWSER_USER_AGENT}});
    if (res.status == 0) return ToolResult::failed("Error connecting to DuckDuckGo: " + res.error);
    if (!res.ok()) {
        return ToolResult::failed("Error: DuckDuckGo search returned status code " + std::to_string(res.status));
    }
    return ToolResult::ok(format_search_results(query, parse_duckduckgo_html(res.body), "DuckDuckGo"));
}

void register_search_tool(ToolRegistry& reg) {
    ToolDef def;
    def.name = "search";
    def.description = "Search the web. Args: QUERY. Uses Google when GOOGLE_API_KEY is set, else DuckDuckGo.";
    def.readonly_safe = true;

    def.func = [](const std::string& args, const std::string&, ToolContext& ctx) -> ToolResult {
        std::string query = trim(args);
        if (query.empty()) {
            return ToolResult::error(ToolErrorKind::bad_invocation, "No search query provided. Usage: search QUERY");
        }
        std::string key = env_or("GOOGLE_API_KEY");
        if (!ctx.silent) {
            out::tool("search", "Searching for \"" + query + "\"" + (key.empty() ? " via DuckDuckGo" : ""));
        }
        auto result = key.empty() ? duckduckgo_search(query) : google_search(query, key);
        if (!ctx.silent && !result.success) out::error(result.agent_output);
        return result;
    };

    reg.register_tool(std::move(def));
}

} // namespace termineer
