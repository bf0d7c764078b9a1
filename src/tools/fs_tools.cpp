#include "builtin_tools.hpp"
#include "path_utils.hpp"
#include "../buffer.hpp"
#include "../grammar.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cstdio>

namespace termineer {

static size_t count_lines(const std::string& s) {
    if (s.empty()) return 0;
    size_t n = static_cast<size_t>(std::count(s.begin(), s.end(), '\n'));
    if (s.back() != '\n') n++;
    return n;
}

static ToolResult path_failure(const PathError& e) {
    return ToolResult::error(e.denied() ? ToolErrorKind::permission_denied : ToolErrorKind::failed, e.what());
}

static bool parse_int(const std::string& s, int& out) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        if (used != s.size()) return false;
        out = v;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

ReadArgs parse_read_args(const std::string& args) {
    ReadArgs ra;
    for (auto& tok : split_ws(args)) {
        int v = 0;
        if (starts_with(tok, "offset=") && parse_int(tok.substr(7), v)) {
            ra.offset = std::max(0, v);
        } else if (starts_with(tok, "limit=") && parse_int(tok.substr(6), v)) {
            ra.limit = std::max(0, v);
        } else if (starts_with(tok, "lines=")) {
            std::string range = tok.substr(6);
            auto dash = range.find('-');
            int a = 0, b = 0;
            if (dash != std::string::npos && parse_int(range.substr(0, dash), a) &&
                parse_int(range.substr(dash + 1), b) && a >= 1 && b >= a) {
                ra.offset = a - 1;
                ra.limit = b - a + 1;
            } else if (dash == std::string::npos && parse_int(range, a) && a >= 1) {
                ra.offset = a - 1;
                ra.limit = 1;
            } else {
                ra.paths.push_back(tok);
            }
        } else {
            ra.paths.push_back(tok);
        }
    }
    return ra;
}

static std::string list_directory(const fs::path& dir) {
    std::vector<std::string> entries;
    std::error_code ec;
    for (auto& e : fs::directory_iterator(dir, ec)) {
        std::string name = e.path().filename().string();
        if (e.is_directory(ec)) name += "/";
        entries.push_back(name);
    }
    std::sort(entries.begin(), entries.end());
    std::string result = "Directory: " + dir.string() + " (" + std::to_string(entries.size()) + " entries)\n";
    for (auto& n : entries) result += n + "\n";
    return result;
}

static std::string read_file_range(const fs::path& file, const ReadArgs& ra, bool& ok) {
    std::ifstream f(file);
    if (!f) {
        ok = false;
        return "Cannot read file: " + file.string();
    }
    ok = true;

    int limit = ra.limit ? std::min(*ra.limit, MAX_READ_LINES) : MAX_READ_LINES;
    std::string body;
    std::string line;
    int line_num = 0;
    int shown = 0;
    bool more = false;
    while (std::getline(f, line)) {
        line_num++;
        if (line_num <= ra.offset) continue;
        if (shown >= limit) {
            more = true;
            continue;  // keep counting for the total
        }
        body += line + "\n";
        shown++;
    }

    std::string header = "File: " + file.string();
    if (shown > 0) {
        header += " (lines " + std::to_string(ra.offset + 1) + "-" + std::to_string(ra.offset + shown) +
                  " of " + std::to_string(line_num) + ")";
    } else if (line_num == 0) {
        header += " (empty)";
    } else {
        header += " (offset " + std::to_string(ra.offset) + " is past the end, " +
                  std::to_string(line_num) + " lines)";
    }

    std::string result = header + "\n" + body;
    bool hit_cap = more && (!ra.limit || *ra.limit > MAX_READ_LINES);
    if (hit_cap) {
        result += "[Output truncated at " + std::to_string(MAX_READ_LINES) + " lines. Use offset=" +
                  std::to_string(ra.offset + shown) + " to continue reading]\n";
    }
    return result;
}

PatchSpec parse_patch_body(const std::string& body) {
    auto b = body.find(PATCH_BEFORE);
    if (b == std::string::npos) throw std::invalid_argument("Patch is missing the <<<<BEFORE marker");
    auto start = body.find('\n', b);
    if (start == std::string::npos) throw std::invalid_argument("Patch is missing the <<<<AFTER marker");
    start++;

    auto a = body.find(PATCH_AFTER, start);
    if (a == std::string::npos) throw std::invalid_argument("Patch is missing the <<<<AFTER marker");
    auto e = body.find(PATCH_END, a);
    if (e == std::string::npos) throw std::invalid_argument("Patch is missing the <<<<END marker");

    auto section = [&](size_t from, size_t marker) {
        if (marker <= from) return std::string();
        size_t len = marker - from;
        if (body[marker - 1] == '\n') len--;
        return body.substr(from, len);
    };

    PatchSpec p;
    p.before = section(start, a);
    auto after_start = body.find('\n', a);
    if (after_start == std::string::npos || after_start > e) {
        p.after = "";
    } else {
        p.after = section(after_start + 1, e);
    }
    if (p.before.empty()) throw std::invalid_argument("Patch BEFORE section is empty");
    return p;
}

static bool write_atomic(const fs::path& target, const std::string& content, std::string& err) {
    fs::path tmp = target;
    tmp += ".termineer-tmp";
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) {
            err = "Cannot write temporary file: " + tmp.string();
            return false;
        }
        f << content;
        if (!f.good()) {
            err = "Failed writing temporary file: " + tmp.string();
            return false;
        }
    }
    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(tmp, ec);
        err = "Failed to replace file: " + target.string();
        return false;
    }
    return true;
}

void register_fs_tools(ToolRegistry& reg) {
    // ── read ──
    {
        ToolDef def;
        def.name = "read";
        def.description = "Read files or list directories. Args: PATH... [offset=N] [limit=N] [lines=START-END].";
        def.readonly_safe = true;

        def.func = [](const std::string& args, const std::string&, ToolContext& ctx) -> ToolResult {
            auto ra = parse_read_args(args);
            if (ra.paths.empty()) {
                return ToolResult::error(ToolErrorKind::bad_invocation, "No path specified");
            }

            std::string result;
            bool any_ok = false;
            for (auto& p : ra.paths) {
                fs::path resolved;
                try {
                    resolved = validate_path(ctx.workdir, p);
                } catch (const PathError& e) {
                    if (e.denied() || ra.paths.size() == 1) return path_failure(e);
                    result += "Error: " + p + ": " + e.what() + "\n\n";
                    continue;
                }

                std::error_code ec;
                if (fs::is_directory(resolved, ec)) {
                    result += list_directory(resolved);
                    any_ok = true;
                } else if (fs::exists(resolved, ec)) {
                    bool ok = false;
                    result += read_file_range(resolved, ra, ok);
                    any_ok = any_ok || ok;
                } else {
                    result += "Error: file not found: " + p + "\n";
                }
                result += "\n";
            }

            if (!ctx.silent) out::tool("read", "Read " + std::to_string(ra.paths.size()) + " path(s)");
            if (!any_ok) return ToolResult::failed(result);
            return ToolResult::ok(result);
        };
        reg.register_tool(std::move(def));
    }

    // ── write ──
    {
        ToolDef def;
        def.name = "write";
        def.description = "Write the body to the file named in args, replacing any existing content.";

        def.func = [](const std::string& args, const std::string& body, ToolContext& ctx) -> ToolResult {
            std::string path = trim(args);
            if (path.empty()) return ToolResult::error(ToolErrorKind::bad_invocation, "No path specified");

            fs::path resolved;
            try {
                resolved = validate_path(ctx.workdir, path);
            } catch (const PathError& e) {
                return path_failure(e);
            }

            std::ofstream f(resolved, std::ios::binary | std::ios::trunc);
            if (!f) return ToolResult::failed("Cannot write file: " + resolved.string());
            f << body;
            f.close();
            if (!f) return ToolResult::failed("Failed writing file: " + resolved.string());

            size_t n = count_lines(body);
            std::string msg = "Successfully wrote to file '" + path + "' (" + std::to_string(n) +
                              " lines, line range: 1-" + std::to_string(n) + ")";
            if (!ctx.silent) out::tool("write", msg);
            return ToolResult::ok(msg);
        };
        reg.register_tool(std::move(def));
    }

    // ── patch ──
    {
        ToolDef def;
        def.name = "patch";
        def.description = "Replace text in the file named in args. Body: <<<<BEFORE, old text, <<<<AFTER, new text, <<<<END.";

        def.func = [](const std::string& args, const std::string& body, ToolContext& ctx) -> ToolResult {
            std::string path = trim(args);
            if (path.empty()) return ToolResult::error(ToolErrorKind::bad_invocation, "No path specified");

            PatchSpec spec;
            try {
                spec = parse_patch_body(body);
            } catch (const std::invalid_argument& e) {
                return ToolResult::error(ToolErrorKind::bad_invocation, e.what());
            }

            fs::path resolved;
            try {
                resolved = validate_path(ctx.workdir, path);
            } catch (const PathError& e) {
                return path_failure(e);
            }

            std::error_code ec;
            if (!fs::is_regular_file(resolved, ec)) {
                return ToolResult::failed("File not found: " + path);
            }
            std::string content = read_file(resolved.string());

            size_t pos = content.find(spec.before);
            if (pos == std::string::npos) {
                return ToolResult::failed("Text to replace not found in the file");
            }
            size_t first_line = static_cast<size_t>(std::count(content.begin(), content.begin() + pos, '\n')) + 1;
            size_t old_lines = count_lines(spec.before);
            size_t new_lines = count_lines(spec.after);
            content.replace(pos, spec.before.size(), spec.after);

            std::string err;
            if (!write_atomic(resolved, content, err)) return ToolResult::failed(err);

            size_t last_line = first_line + (new_lines > 0 ? new_lines - 1 : 0);
            std::string msg = "Successfully patched file '" + path + "' at lines " + std::to_string(first_line) +
                              "-" + std::to_string(last_line) + " (replaced " + std::to_string(old_lines) +
                              " lines with " + std::to_string(new_lines) + " lines)";
            if (!ctx.silent) out::tool("patch", msg);
            return ToolResult::ok(msg);
        };
        reg.register_tool(std::move(def));
    }
}

} // namespace termineer
