#include "builtin_tools.hpp"
#include "../https_client.hpp"
#include "../buffer.hpp"

namespace termineer {

static std::string decode_entities(const std::string& s) {
    static const std::pair<const char*, const char*> entities[] = {
        {"&amp;", "&"}, {"&lt;", "<"}, {"&gt;", ">"}, {"&quot;", "\""},
        {"&#39;", "'"}, {"&apos;", "'"}, {"&nbsp;", " "}
    };
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size();) {
        bool matched = false;
        if (s[i] == '&') {
            for (auto& [from, to] : entities) {
                size_t len = std::char_traits<char>::length(from);
                if (s.compare(i, len, from) == 0) {
                    out += to;
                    i += len;
                    matched = true;
                    break;
                }
            }
        }
        if (!matched) out += s[i++];
    }
    return out;
}

static std::string tag_name(const std::string& tag) {
    size_t i = 0;
    if (i < tag.size() && tag[i] == '/') i++;
    size_t start = i;
    while (i < tag.size() && (std::isalnum(static_cast<unsigned char>(tag[i])))) i++;
    return to_lower(tag.substr(start, i - start));
}

static std::string attr_value(const std::string& tag, const std::string& attr) {
    std::string lower = to_lower(tag);
    auto pos = lower.find(attr + "=");
    if (pos == std::string::npos) return "";
    pos += attr.size() + 1;
    if (pos >= tag.size()) return "";
    char q = tag[pos];
    if (q == '"' || q == '\'') {
        auto end = tag.find(q, pos + 1);
        if (end == std::string::npos) return "";
        return tag.substr(pos + 1, end - pos - 1);
    }
    auto end = tag.find_first_of(" \t\n>", pos);
    return tag.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
}

static bool is_block_tag(const std::string& name) {
    static const char* blocks[] = {"p", "br", "div", "li", "tr", "h1", "h2", "h3", "h4", "h5", "h6",
                                   "section", "article", "header", "footer", "ul", "ol", "table", "pre"};
    for (auto* b : blocks) {
        if (name == b) return true;
    }
    return false;
}

std::string html_to_text(const std::string& html) {
    std::string lower_html = to_lower(html);
    std::string text;
    std::string href;
    size_t i = 0;
    while (i < html.size()) {
        if (html[i] != '<') {
            auto next = html.find('<', i);
            text += decode_entities(html.substr(i, next == std::string::npos ? std::string::npos : next - i));
            if (next == std::string::npos) break;
            i = next;
            continue;
        }

        if (html.compare(i, 4, "<!--") == 0) {
            auto end = html.find("-->", i + 4);
            i = end == std::string::npos ? html.size() : end + 3;
            continue;
        }

        auto close = html.find('>', i);
        if (close == std::string::npos) break;
        std::string tag = html.substr(i + 1, close - i - 1);
        std::string name = tag_name(tag);
        bool closing = !tag.empty() && tag[0] == '/';
        i = close + 1;

        if (!closing && (name == "script" || name == "style" || name == "noscript")) {
            auto end = lower_html.find("</" + name, i);
            if (end == std::string::npos) break;
            auto end_close = html.find('>', end);
            i = end_close == std::string::npos ? html.size() : end_close + 1;
            continue;
        }

        if (name == "a") {
            if (!closing) {
                href = attr_value(tag, "href");
            } else {
                if (!href.empty()) text += " [" + href + "]";
                href.clear();
            }
            continue;
        }

        if (is_block_tag(name)) text += "\n";
    }

    // Collapse runs of blank lines and trailing spaces.
    std::string result;
    int blank = 0;
    for (auto& line : split_lines(text)) {
        std::string t = trim(line);
        if (t.empty()) {
            if (++blank > 1) continue;
        } else {
            blank = 0;
        }
        result += t + "\n";
    }
    return trim(result);
}

static bool looks_like_html(const HttpsResponse& res) {
    std::string ct = to_lower(res.header("content-type"));
    if (ct.find("text/html") != std::string::npos) return true;
    std::string head = to_lower(res.body.substr(0, 512));
    return head.find("<html") != std::string::npos || head.find("<!doctype html") != std::string::npos;
}

void register_fetch_tool(ToolRegistry& reg) {
    ToolDef def;
    def.name = "fetch";
    def.description = "Fetch a URL. Args: URL (GET) or POST URL with the body as payload.";
    def.readonly_safe = true;

    def.func = [](const std::string& args, const std::string& body, ToolContext& ctx) -> ToolResult {
        auto tokens = split_ws(args);
        if (tokens.empty()) return ToolResult::error(ToolErrorKind::bad_invocation, "No URL specified");

        bool post = false;
        std::string url;
        if (tokens.size() >= 2 && to_lower(tokens[0]) == "post") {
            post = true;
            url = tokens[1];
        } else if (tokens.size() >= 2 && to_lower(tokens[0]) == "get") {
            url = tokens[1];
        } else {
            url = tokens[0];
        }
        if (!starts_with(url, "http://") && !starts_with(url, "https://")) {
            return ToolResult::error(ToolErrorKind::bad_invocation, "URL must start with http:// or https://");
        }

        if (!ctx.silent) out::tool("fetch", (post ? "POST " : "GET ") + url);

        HttpsResponse res;
        if (post) {
            std::string payload = trim(body);
            std::string ctype = (!payload.empty() && (payload[0] == '{' || payload[0] == '['))
                                ? "application/json" : "text/plain";
            res = https_post(url, {}, body, ctype, 30);
        } else {
            res = https_get(url);
        }

        if (res.status == 0) {
            return ToolResult::failed("Failed to fetch " + url + ": " + res.error);
        }

        std::string content = looks_like_html(res) ? html_to_text(res.body) : res.body;
        if (content.size() > MAX_FETCH_CHARS) {
            content = content.substr(0, MAX_FETCH_CHARS) + "\n[Content truncated at " +
                      std::to_string(MAX_FETCH_CHARS) + " characters]";
        }
        std::string result = "Fetched from " + url + ":\n\nStatus: " + std::to_string(res.status) + "\n\n" + content;
        if (!res.ok()) return ToolResult::failed(result);
        return ToolResult::ok(result);
    };

    reg.register_tool(std::move(def));
}

} // namespace termineer
