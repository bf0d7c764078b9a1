#include "path_utils.hpp"
#include "../buffer.hpp"
#include <iterator>

namespace termineer {

bool path_within(const fs::path& base, const fs::path& p) {
    auto b = base.begin();
    auto q = p.begin();
    for (; b != base.end(); ++b, ++q) {
        // A trailing separator shows up as an empty final component.
        if (b->empty() && std::next(b) == base.end()) break;
        if (q == p.end() || *b != *q) return false;
    }
    return true;
}

static constexpr int MAX_SYMLINK_HOPS = 40;

fs::path validate_path(const fs::path& workdir, const std::string& path) {
    if (trim(path).empty()) {
        throw PathError("No path specified", false);
    }

    std::error_code ec;
    fs::path base = fs::canonical(workdir, ec);
    if (ec) {
        throw PathError("Working directory is not accessible: " + workdir.string(), false);
    }

    fs::path p(expand_path(trim(path)));
    if (p.is_relative()) p = base / p;

    // Follow links by hand: exists() is false for a dangling link, which
    // would otherwise be judged by its own location instead of its target.
    for (int hops = 0; fs::is_symlink(fs::symlink_status(p, ec)); hops++) {
        if (hops >= MAX_SYMLINK_HOPS) throw PathError("Too many levels of symbolic links: " + path, false);
        fs::path target = fs::read_symlink(p, ec);
        if (ec) throw PathError("Cannot resolve path: " + path, false);
        p = target.is_absolute() ? target : p.parent_path() / target;
    }

    fs::path resolved;
    if (fs::exists(p, ec)) {
        resolved = fs::canonical(p, ec);
        if (ec) throw PathError("Cannot resolve path: " + path, false);
    } else {
        fs::path parent = p.parent_path();
        if (!fs::exists(parent, ec)) {
            throw PathError("Parent directory does not exist: " + parent.string(), false);
        }
        fs::path cparent = fs::canonical(parent, ec);
        if (ec) throw PathError("Cannot resolve path: " + path, false);
        resolved = cparent / p.filename();
    }

    if (!path_within(base, resolved)) {
        throw PathError("Access denied: path is outside the working directory", true);
    }
    return resolved;
}

static bool glob_at(const std::string& pat, size_t pi, const std::string& s, size_t si) {
    while (pi < pat.size()) {
        char c = pat[pi];
        if (c == '*') {
            bool deep = pi + 1 < pat.size() && pat[pi + 1] == '*';
            size_t next = pi + (deep ? 2 : 1);
            // "**/" also matches zero directories.
            if (deep && next < pat.size() && pat[next] == '/' && glob_at(pat, next + 1, s, si)) return true;
            for (size_t k = si; k <= s.size(); k++) {
                if (glob_at(pat, next, s, k)) return true;
                if (k < s.size() && s[k] == '/' && !deep) break;
            }
            return false;
        }
        if (si >= s.size()) return false;
        if (c == '?') {
            if (s[si] == '/') return false;
        } else if (c != s[si]) {
            return false;
        }
        pi++;
        si++;
    }
    return si == s.size();
}

bool glob_match(const std::string& pattern, const std::string& path) {
    return glob_at(pattern, 0, path, 0);
}

std::vector<fs::path> glob_files(const fs::path& workdir, const std::string& pattern, size_t max_files) {
    std::vector<fs::path> found;
    std::error_code ec;
    fs::path base = fs::canonical(workdir, ec);
    if (ec) return found;

    // A plain path needs no walk.
    if (pattern.find_first_of("*?") == std::string::npos) {
        try {
            fs::path p = validate_path(base, pattern);
            if (fs::is_regular_file(p, ec)) found.push_back(p);
        } catch (const PathError& e) {
            out::debug(std::string("include skipped: ") + e.what());
        }
        return found;
    }

    auto it = fs::recursive_directory_iterator(base, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (it->is_directory(ec) && (name == ".git" || name == "node_modules" || name == "build")) {
            it.disable_recursion_pending();
            continue;
        }
        if (!it->is_regular_file(ec)) continue;
        std::string rel = fs::relative(it->path(), base, ec).generic_string();
        if (!glob_match(pattern, rel)) continue;
        try {
            validate_path(base, rel);
        } catch (const PathError& e) {
            out::debug("include skipped: " + rel + ": " + e.what());
            continue;
        }
        found.push_back(it->path());
        if (found.size() >= max_files) break;
    }
    std::sort(found.begin(), found.end());
    return found;
}

} // namespace termineer
