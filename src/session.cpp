#include "session.hpp"
#include "conversation.hpp"
#include <fstream>
#include <iostream>
#include <algorithm>

namespace termineer {

nlohmann::json Session::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["name"] = name;
    j["timestamp"] = timestamp;
    j["model"] = model;
    j["system_prompt"] = system_prompt ? nlohmann::json(*system_prompt) : nlohmann::json(nullptr);
    auto arr = nlohmann::json::array();
    for (auto& m : conversation) arr.push_back(m.to_json());
    j["conversation"] = std::move(arr);

    auto& md = j["metadata"];
    md["created_at"] = metadata.created_at;
    md["last_updated"] = metadata.last_updated;
    md["message_count"] = metadata.message_count;
    md["token_count"] = metadata.token_count ? nlohmann::json(*metadata.token_count) : nlohmann::json(nullptr);
    md["description"] = metadata.description ? nlohmann::json(*metadata.description) : nlohmann::json(nullptr);
    md["tags"] = metadata.tags;
    return j;
}

Session Session::from_json(const nlohmann::json& j) {
    Session s;
    s.id = j.value("id", "");
    s.name = j.value("name", "");
    s.timestamp = j.value("timestamp", int64_t(0));
    s.model = j.value("model", "");
    if (j.contains("system_prompt") && j["system_prompt"].is_string()) {
        s.system_prompt = j["system_prompt"].get<std::string>();
    }
    if (j.contains("conversation")) s.conversation = Conversation::messages_from_json(j["conversation"]);

    if (j.contains("metadata") && j["metadata"].is_object()) {
        auto& md = j["metadata"];
        s.metadata.created_at = md.value("created_at", s.timestamp);
        s.metadata.last_updated = md.value("last_updated", s.timestamp);
        s.metadata.message_count = md.value("message_count", s.conversation.size());
        if (md.contains("token_count") && md["token_count"].is_number()) {
            s.metadata.token_count = md["token_count"].get<size_t>();
        }
        if (md.contains("description") && md["description"].is_string()) {
            s.metadata.description = md["description"].get<std::string>();
        }
        if (md.contains("tags") && md["tags"].is_array()) {
            for (auto& t : md["tags"]) {
                if (t.is_string()) s.metadata.tags.push_back(t.get<std::string>());
            }
        }
    }
    return s;
}

fs::path default_session_dir() {
    std::string cwd = fs::current_path().string();
    std::replace(cwd.begin(), cwd.end(), '/', '_');
    return fs::path(config_dir()) / "termineer" / "sessions" / cwd;
}

Session SessionStore::read(const fs::path& file) {
    std::ifstream f(file);
    if (!f) throw SessionError("Cannot read session file: " + file.string());
    try {
        return Session::from_json(nlohmann::json::parse(f));
    } catch (const nlohmann::json::exception& e) {
        throw SessionError("Invalid session file " + file.string() + ": " + e.what());
    }
}

void SessionStore::write_last(const std::string& id) {
    std::ofstream f(last_file(), std::ios::trunc);
    if (!f) throw SessionError("Cannot write " + last_file().string());
    f << id;
}

Session SessionStore::save(const std::string& name, const std::string& model,
                           const std::optional<std::string>& system_prompt,
                           const std::vector<Message>& conversation) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) throw SessionError("Cannot create session directory " + dir_.string() + ": " + ec.message());

    Conversation conv;
    conv.replace(conversation);
    conv.sanitize();

    Session s;
    s.timestamp = epoch_now();
    s.id = "session_" + std::to_string(s.timestamp);
    for (int n = 2; fs::exists(dir_ / (s.id + ".json")); n++) {
        s.id = "session_" + std::to_string(s.timestamp) + "_" + std::to_string(n);
    }
    s.name = name.empty() ? s.id : name;
    s.model = model;
    s.system_prompt = system_prompt;
    s.conversation = conv.messages();
    s.metadata.created_at = s.timestamp;
    s.metadata.last_updated = s.timestamp;
    s.metadata.message_count = s.conversation.size();

    fs::path file = dir_ / (s.id + ".json");
    std::ofstream f(file);
    if (!f) throw SessionError("Cannot write session file: " + file.string());
    f << s.to_json().dump(2) << std::endl;
    f.close();
    if (!f) throw SessionError("Failed writing session file: " + file.string());

    write_last(s.id);
    return s;
}

std::vector<Session> SessionStore::list() const {
    std::vector<Session> sessions;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) return sessions;

    for (auto& e : fs::directory_iterator(dir_, ec)) {
        if (e.path().extension() != ".json") continue;
        try {
            sessions.push_back(read(e.path()));
        } catch (const SessionError& err) {
            std::cerr << "[warn] " << err.what() << "\n";
        }
    }
    std::sort(sessions.begin(), sessions.end(), [](const Session& a, const Session& b) {
        if (a.timestamp != b.timestamp) return a.timestamp > b.timestamp;
        if (a.id.size() != b.id.size()) return a.id.size() > b.id.size();
        return a.id > b.id;
    });
    return sessions;
}

Session SessionStore::load(const std::string& key) {
    fs::path by_id = dir_ / (key + ".json");
    Session s;
    if (fs::exists(by_id)) {
        s = read(by_id);
    } else {
        bool found = false;
        for (auto& candidate : list()) {  // newest first
            if (to_lower(candidate.name) == to_lower(key)) {
                s = std::move(candidate);
                found = true;
                break;
            }
        }
        if (!found) {
            if (ends_with(key, ".json") && fs::exists(key)) {
                s = read(key);
            } else {
                throw SessionError("No session found with ID or name '" + key + "'");
            }
        }
    }

    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (!ec) write_last(s.id);
    return s;
}

std::optional<Session> SessionStore::load_last() {
    std::ifstream f(last_file());
    if (!f) return std::nullopt;
    std::string id;
    std::getline(f, id);
    id = trim(id);
    if (id.empty()) return std::nullopt;
    return load(id);
}

void SessionStore::remove(const std::string& key) {
    fs::path file = dir_ / (key + ".json");
    std::string id = key;
    if (!fs::exists(file)) {
        bool found = false;
        for (auto& s : list()) {
            if (to_lower(s.name) == to_lower(key)) {
                id = s.id;
                file = dir_ / (s.id + ".json");
                found = true;
                break;
            }
        }
        if (!found) throw SessionError("No session found with ID or name '" + key + "'");
    }

    std::error_code ec;
    fs::remove(file, ec);
    if (ec) throw SessionError("Cannot delete " + file.string() + ": " + ec.message());

    std::ifstream last(last_file());
    std::string last_id;
    if (last && std::getline(last, last_id) && trim(last_id) == id) {
        last.close();
        fs::remove(last_file(), ec);
    }
}

} // namespace termineer
