#pragma once
#include "message.hpp"
#include "utils.hpp"
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>

namespace termineer {

class SessionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct SessionMetadata {
    int64_t created_at = 0;
    int64_t last_updated = 0;
    size_t message_count = 0;
    std::optional<size_t> token_count;
    std::optional<std::string> description;
    std::vector<std::string> tags;
};

struct Session {
    std::string id;
    std::string name;
    int64_t timestamp = 0;
    std::string model;
    std::optional<std::string> system_prompt;
    std::vector<Message> conversation;
    SessionMetadata metadata;

    nlohmann::json to_json() const;
    static Session from_json(const nlohmann::json& j);
};

// $XDG_CONFIG_HOME/termineer/sessions/<cwd with '/' replaced by '_'>
fs::path default_session_dir();

// Conversation snapshots on disk. ".last" holds the id of the last
// session saved or loaded.
class SessionStore {
public:
    explicit SessionStore(fs::path dir = default_session_dir()) : dir_(std::move(dir)) {}

    // Empty messages are dropped before writing. Throws SessionError.
    Session save(const std::string& name, const std::string& model,
                 const std::optional<std::string>& system_prompt,
                 const std::vector<Message>& conversation);

    // Exact id, then case-insensitive name (newest wins), then a .json path.
    Session load(const std::string& id_name_or_path);
    std::optional<Session> load_last();

    // Newest first. Unreadable files are skipped with a warning.
    std::vector<Session> list() const;

    void remove(const std::string& id_or_name);

    const fs::path& dir() const { return dir_; }

private:
    fs::path dir_;

    fs::path last_file() const { return dir_ / ".last"; }
    void write_last(const std::string& id);
    static Session read(const fs::path& file);
};

} // namespace termineer
