#pragma once
#include "../utils.hpp"
#include <stdexcept>

namespace termineer {

class PathError : public std::runtime_error {
public:
    PathError(const std::string& msg, bool denied)
        : std::runtime_error(msg), denied_(denied) {}
    // True when the path escapes the working directory.
    bool denied() const { return denied_; }
private:
    bool denied_;
};

// Resolves path against workdir, following symlinks and "..".
// Throws PathError when the result is outside workdir or its parent is missing.
fs::path validate_path(const fs::path& workdir, const std::string& path);

// Component-wise prefix test on already-canonical paths.
bool path_within(const fs::path& base, const fs::path& p);

// '*' and '?' stay within one path component, '**' spans directories.
bool glob_match(const std::string& pattern, const std::string& path);

// Regular files under workdir whose relative path matches pattern, sorted.
std::vector<fs::path> glob_files(const fs::path& workdir, const std::string& pattern, size_t max_files = 50);

} // namespace termineer
