#include "grammar.hpp"
#include "utils.hpp"
#include <cstdlib>
#include <stdexcept>

namespace termineer {

namespace {

std::string strip_one_newline(const std::string& s) {
    size_t b = 0, e = s.size();
    if (b < e && s[b] == '\n') b++;
    if (e > b && s[e - 1] == '\n') e--;
    return s.substr(b, e - b);
}

uint64_t parse_index(const std::string& s) {
    return std::strtoull(s.c_str(), nullptr, 10);
}

void flush_text(std::vector<Segment>& out, const std::string& s, size_t from, size_t to) {
    if (to <= from) return;
    std::string chunk = s.substr(from, to - from);
    if (trim(chunk).empty()) return;
    Segment seg;
    seg.type = SegmentType::text;
    seg.text = std::move(chunk);
    out.push_back(std::move(seg));
}

// ── XML helpers ─────────────────────────────────────────────────────

size_t find_open_tag(const std::string& s, const std::string& tag, size_t pos) {
    std::string needle = "<" + tag;
    while ((pos = s.find(needle, pos)) != std::string::npos) {
        size_t after = pos + needle.size();
        if (after < s.size() && (s[after] == '>' || std::isspace(static_cast<unsigned char>(s[after])))) {
            return pos;
        }
        pos = after;
    }
    return std::string::npos;
}

// End of an open tag ('>' outside double quotes).
size_t find_tag_end(const std::string& s, size_t pos) {
    bool in_quote = false;
    for (size_t i = pos; i < s.size(); i++) {
        if (s[i] == '"') in_quote = !in_quote;
        else if (s[i] == '>' && !in_quote) return i;
    }
    return std::string::npos;
}

bool take_attr(std::string& attrs, const std::string& key, std::string& value) {
    std::string needle = key + "=\"";
    size_t p = 0;
    while ((p = attrs.find(needle, p)) != std::string::npos) {
        if (p == 0 || std::isspace(static_cast<unsigned char>(attrs[p - 1]))) {
            size_t vstart = p + needle.size();
            size_t vend = attrs.find('"', vstart);
            if (vend == std::string::npos) return false;
            value = attrs.substr(vstart, vend - vstart);
            attrs.erase(p, vend + 1 - p);
            return true;
        }
        p++;
    }
    return false;
}

// ── Markdown helpers ────────────────────────────────────────────────

size_t find_fence_open(const std::string& s, size_t pos) {
    while ((pos = s.find("```", pos)) != std::string::npos) {
        if (pos == 0 || s[pos - 1] == '\n') return pos;
        pos += 3;
    }
    return std::string::npos;
}

// Position of the '\n' that starts a closing "```" line, searching from pos.
size_t find_fence_close(const std::string& s, size_t pos) {
    while ((pos = s.find("\n```", pos)) != std::string::npos) {
        size_t after = pos + 4;
        if (after >= s.size() || s[after] == '\n' || s[after] == '\r') return pos;
        pos = after;
    }
    return std::string::npos;
}

// "name=X rest..." or "X rest..."
void split_name_args(const std::string& label, std::string& name, std::string& args) {
    std::string rest = trim(label);
    size_t sp = rest.find_first_of(" \t");
    std::string first = sp == std::string::npos ? rest : rest.substr(0, sp);
    args = sp == std::string::npos ? "" : trim(rest.substr(sp));
    name = starts_with(first, "name=") ? first.substr(5) : first;
}

} // namespace

std::string Grammar::format_patch(const std::string& before, const std::string& after) const {
    return std::string(PATCH_BEFORE) + "\n" + before + "\n" + PATCH_AFTER + "\n" + after + "\n" + PATCH_END;
}

// ── XmlGrammar ──────────────────────────────────────────────────────

std::vector<Segment> XmlGrammar::parse(const std::string& s) const {
    std::vector<Segment> out;
    static const char* tags[] = {"tool", "result", "error"};

    size_t pos = 0, text_start = 0;
    while (pos < s.size()) {
        size_t best = std::string::npos;
        std::string tag;
        for (auto t : tags) {
            size_t p = find_open_tag(s, t, pos);
            if (p < best) { best = p; tag = t; }
        }
        if (best == std::string::npos) break;

        size_t attr_start = best + 1 + tag.size();
        size_t gt = find_tag_end(s, attr_start);
        if (gt == std::string::npos) break;
        std::string close = "</" + tag + ">";
        size_t close_pos = s.find(close, gt + 1);
        if (close_pos == std::string::npos) break;

        std::string attrs = trim(s.substr(attr_start, gt - attr_start));
        std::string inner = s.substr(gt + 1, close_pos - gt - 1);

        flush_text(out, s, text_start, best);

        Segment seg;
        if (tag == "tool") {
            seg.type = SegmentType::tool_call;
            if (attrs.empty()) {
                // <tool>name args\nbody</tool>
                std::string first, rest;
                size_t nl = inner.find('\n');
                first = nl == std::string::npos ? inner : inner.substr(0, nl);
                rest = nl == std::string::npos ? "" : inner.substr(nl + 1);
                split_name_args(first, seg.name, seg.args);
                seg.body = strip_one_newline(rest);
            } else {
                std::string name;
                if (take_attr(attrs, "name", name)) {
                    seg.name = name;
                    seg.args = trim(attrs);
                } else {
                    split_name_args(attrs, seg.name, seg.args);
                }
                seg.body = strip_one_newline(inner);
            }
        } else {
            seg.type = tag == "result" ? SegmentType::tool_result : SegmentType::tool_error;
            std::string name, index;
            if (!take_attr(attrs, "name", name)) take_attr(attrs, "tool", name);
            take_attr(attrs, "index", index);
            seg.name = name;
            seg.index = parse_index(index);
            seg.body = strip_one_newline(inner);
        }
        out.push_back(std::move(seg));
        pos = text_start = close_pos + close.size();
    }
    flush_text(out, s, text_start, s.size());
    return out;
}

std::string XmlGrammar::format_tool_call(const std::string& name, const std::string& args,
                                         const std::string& body) const {
    std::string open = "<tool name=\"" + name + "\"";
    if (!trim(args).empty()) open += " " + trim(args);
    return open + ">\n" + body + "\n</tool>";
}

std::string XmlGrammar::format_tool_result(const std::string& name, uint64_t index,
                                           const std::string& payload) const {
    return "<result name=\"" + name + "\" index=\"" + std::to_string(index) + "\">\n" +
           payload + "\n</result>";
}

std::string XmlGrammar::format_tool_error(const std::string& name, uint64_t index,
                                          const std::string& payload) const {
    return "<error name=\"" + name + "\" index=\"" + std::to_string(index) + "\">\n" +
           payload + "\n</error>";
}

std::string XmlGrammar::describe() const {
    return "To use a tool, write a tool tag. The first line holds the tool name and its\n"
           "arguments; the tool body follows on the next lines:\n\n"
           "<tool name=\"shell\">\nls -la\n</tool>\n\n"
           "<tool name=\"read\" src/main.cpp lines=1-40>\n</tool>\n\n"
           "Stop after the closing </tool> tag. The result arrives as\n"
           "<result name=\"TOOL\" index=\"N\">...</result>, or <error ...>...</error> on failure.\n"
           "Call the done tool with a summary when the task is complete.\n";
}

// ── MarkdownGrammar ─────────────────────────────────────────────────

std::vector<Segment> MarkdownGrammar::parse(const std::string& s) const {
    std::vector<Segment> out;
    size_t pos = 0, text_start = 0;

    while (pos < s.size()) {
        size_t f = find_fence_open(s, pos);
        if (f == std::string::npos) break;
        size_t header_end = s.find('\n', f);
        if (header_end == std::string::npos) break;

        std::string label = trim(s.substr(f + 3, header_end - f - 3));
        bool legacy = starts_with(label, "tool_use");
        bool call = !legacy && (label == "tool" || starts_with(label, "tool "));
        bool result = starts_with(label, "result");
        bool error = starts_with(label, "error");

        size_t close = find_fence_close(s, header_end);
        if (!(legacy || call || result || error)) {
            // Ordinary code block: skip it whole.
            if (close == std::string::npos) break;
            pos = close + 4;
            continue;
        }
        if (close == std::string::npos) break;

        std::string payload = close <= header_end ? "" : s.substr(header_end + 1, close - header_end - 1);
        flush_text(out, s, text_start, f);

        Segment seg;
        if (legacy) {
            seg.type = SegmentType::tool_call;
            size_t nl = payload.find('\n');
            std::string first = nl == std::string::npos ? payload : payload.substr(0, nl);
            std::string head = trim(label.substr(8));
            if (!head.empty()) {
                split_name_args(head, seg.name, seg.args);
                seg.body = payload;
            } else {
                split_name_args(first, seg.name, seg.args);
                seg.body = nl == std::string::npos ? "" : payload.substr(nl + 1);
            }
        } else if (call) {
            seg.type = SegmentType::tool_call;
            split_name_args(label.substr(4), seg.name, seg.args);
            seg.body = payload;
        } else {
            seg.type = result ? SegmentType::tool_result : SegmentType::tool_error;
            for (auto& tok : split_ws(label)) {
                if (starts_with(tok, "name=")) seg.name = tok.substr(5);
                else if (starts_with(tok, "index=")) seg.index = parse_index(tok.substr(6));
            }
            seg.body = payload;
        }
        out.push_back(std::move(seg));
        pos = text_start = close + 4;
    }
    flush_text(out, s, text_start, s.size());
    return out;
}

std::string MarkdownGrammar::format_tool_call(const std::string& name, const std::string& args,
                                              const std::string& body) const {
    std::string open = "```tool name=" + name;
    if (!trim(args).empty()) open += " " + trim(args);
    return open + "\n" + body + "\n```";
}

std::string MarkdownGrammar::format_tool_result(const std::string& name, uint64_t index,
                                                const std::string& payload) const {
    return "```result name=" + name + " index=" + std::to_string(index) + "\n" + payload + "\n```";
}

std::string MarkdownGrammar::format_tool_error(const std::string& name, uint64_t index,
                                               const std::string& payload) const {
    return "```error name=" + name + " index=" + std::to_string(index) + "\n" + payload + "\n```";
}

std::string MarkdownGrammar::describe() const {
    return "To use a tool, write a fenced block labelled with the tool name and its\n"
           "arguments; the block content is the tool body:\n\n"
           "```tool name=shell\nls -la\n```\n\n"
           "```tool name=read src/main.cpp lines=1-40\n```\n\n"
           "Stop after the closing fence. The result arrives as a block labelled\n"
           "`result name=TOOL index=N`, or `error name=TOOL index=N` on failure.\n"
           "Call the done tool with a summary when the task is complete.\n";
}

// ── Selection ───────────────────────────────────────────────────────

std::shared_ptr<Grammar> make_grammar(GrammarType type) {
    if (type == GrammarType::markdown) return std::make_shared<MarkdownGrammar>();
    return std::make_shared<XmlGrammar>();
}

GrammarType parse_grammar_type(const std::string& s) {
    std::string l = to_lower(s);
    if (l == "xml") return GrammarType::xml;
    if (l == "markdown" || l == "md") return GrammarType::markdown;
    throw std::invalid_argument("unknown grammar: " + s + " (expected xml or markdown)");
}

GrammarType default_grammar_for(const std::string& backend_name, const std::string& model) {
    if (backend_name == "google" || backend_name == "cohere") return GrammarType::markdown;
    if (backend_name == "openai" && starts_with(model, "o1")) return GrammarType::markdown;
    return GrammarType::xml;
}

} // namespace termineer
