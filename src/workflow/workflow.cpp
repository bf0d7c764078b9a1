#include "workflow.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <fstream>
#include <iterator>

namespace termineer {

static std::string error_prefix(WorkflowErrorKind kind) {
    switch (kind) {
        case WorkflowErrorKind::missing_parameter: return "Missing required parameter: ";
        case WorkflowErrorKind::invalid_step_type: return "Invalid step type: ";
        case WorkflowErrorKind::missing_field:     return "Missing required field: ";
        case WorkflowErrorKind::template_error:    return "Template error: ";
        case WorkflowErrorKind::io_error:          return "IO error: ";
        case WorkflowErrorKind::shell_error:       return "Shell command failed: ";
        case WorkflowErrorKind::agent_error:       return "Agent error: ";
        case WorkflowErrorKind::invalid_config:    return "Invalid workflow configuration: ";
        case WorkflowErrorKind::permission_denied: return "Permission denied: ";
    }
    return "";
}

WorkflowError::WorkflowError(WorkflowErrorKind kind, const std::string& detail)
    : std::runtime_error(error_prefix(kind) + detail), kind_(kind) {}

std::string step_type_name(StepType type) {
    switch (type) {
        case StepType::shell:   return "shell";
        case StepType::message: return "message";
        case StepType::file:    return "file";
        case StepType::output:  return "output";
        case StepType::wait:    return "wait";
        case StepType::agent:   return "agent";
    }
    return "unknown";
}

// ── YAML ──

static nlohmann::json scalar_to_json(const YAML::Node& node) {
    const std::string& s = node.Scalar();
    // "!" is the tag yaml-cpp gives quoted scalars
    if (node.Tag() == "!") return s;

    bool b;
    if (YAML::convert<bool>::decode(node, b)) return b;
    long long i;
    if (YAML::convert<long long>::decode(node, i)) return i;
    double d;
    if (YAML::convert<double>::decode(node, d)) return d;
    return s;
}

static nlohmann::json node_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
        case YAML::NodeType::Scalar:
            return scalar_to_json(node);
        case YAML::NodeType::Sequence: {
            auto arr = nlohmann::json::array();
            for (const auto& item : node) arr.push_back(node_to_json(item));
            return arr;
        }
        case YAML::NodeType::Map: {
            auto obj = nlohmann::json::object();
            for (const auto& kv : node) obj[kv.first.as<std::string>()] = node_to_json(kv.second);
            return obj;
        }
    }
    return nullptr;
}

nlohmann::json yaml_to_json(const std::string& yaml_text, const std::string& source) {
    try {
        return node_to_json(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        throw WorkflowError(WorkflowErrorKind::invalid_config,
                            source + ": line " + std::to_string(e.mark.line + 1) + ": " + e.msg);
    }
}

// ── Workflow ──

static std::optional<std::string> opt_string(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    if (j[key].is_string()) return j[key].get<std::string>();
    return j[key].dump();
}

static std::string required_string(const nlohmann::json& j, const char* key, const std::string& where) {
    auto v = opt_string(j, key);
    if (!v) throw WorkflowError(WorkflowErrorKind::missing_field, std::string(key) + " (" + where + ")");
    return *v;
}

static WorkflowStep step_from_json(const nlohmann::json& j, size_t index) {
    if (!j.is_object()) {
        throw WorkflowError(WorkflowErrorKind::invalid_config, "step " + std::to_string(index + 1) + " is not a mapping");
    }

    static const std::pair<const char*, StepType> keys[] = {
        {"shell", StepType::shell},   {"message", StepType::message}, {"file", StepType::file},
        {"output", StepType::output}, {"wait", StepType::wait},       {"agent", StepType::agent},
    };

    WorkflowStep step;
    bool typed = false;
    for (auto& [key, type] : keys) {
        if (j.contains(key)) {
            step.type = type;
            step.id = opt_string(j, key).value_or("");
            typed = true;
            break;
        }
    }
    if (!typed) throw WorkflowError(WorkflowErrorKind::invalid_step_type, "step " + std::to_string(index + 1));

    std::string where = step_type_name(step.type) + " step '" + step.id + "'";
    step.description = opt_string(j, "description");
    if (j.contains("fail_on_error") && j["fail_on_error"].is_boolean()) {
        step.fail_on_error = j["fail_on_error"].get<bool>();
    }

    switch (step.type) {
        case StepType::shell:
            step.command = required_string(j, "command", where);
            step.store_output = opt_string(j, "store_output");
            break;
        case StepType::message:
            step.content = required_string(j, "content", where);
            step.store_response = opt_string(j, "store_response");
            break;
        case StepType::file: {
            std::string action = to_lower(required_string(j, "action", where));
            if (action == "read") step.action = FileAction::read;
            else if (action == "write") step.action = FileAction::write;
            else if (action == "append") step.action = FileAction::append;
            else throw WorkflowError(WorkflowErrorKind::invalid_config, "unknown file action '" + action + "' in " + where);
            step.path = required_string(j, "path", where);
            if (step.action == FileAction::read) {
                step.store_as = opt_string(j, "store_as");
            } else {
                step.content = required_string(j, "content", where);
            }
            break;
        }
        case StepType::output:
            step.content = required_string(j, "content", where);
            break;
        case StepType::wait:
            step.wait_message = opt_string(j, "wait_message");
            step.store_input = opt_string(j, "store_input");
            break;
        case StepType::agent:
            step.prompt = required_string(j, "prompt", where);
            step.kind = opt_string(j, "kind");
            step.into = opt_string(j, "into");
            break;
    }
    return step;
}

Workflow Workflow::from_json(const nlohmann::json& j) {
    if (!j.is_object()) throw WorkflowError(WorkflowErrorKind::invalid_config, "document is not a mapping");

    Workflow wf;
    wf.name = required_string(j, "name", "workflow");
    wf.description = opt_string(j, "description");
    wf.version = opt_string(j, "version");
    wf.author = opt_string(j, "author");
    wf.query_template = opt_string(j, "query_template");

    if (j.contains("parameters") && j["parameters"].is_array()) {
        for (auto& p : j["parameters"]) {
            WorkflowParameter param;
            param.name = required_string(p, "name", "parameter");
            param.description = opt_string(p, "description");
            param.type = p.value("type", std::string("string"));
            param.required = p.value("required", false);
            if (p.contains("default") && !p["default"].is_null()) param.default_value = p["default"];
            wf.parameters.push_back(std::move(param));
        }
    }

    if (!j.contains("steps") || !j["steps"].is_array()) {
        throw WorkflowError(WorkflowErrorKind::missing_field, "steps (workflow '" + wf.name + "')");
    }
    for (size_t i = 0; i < j["steps"].size(); i++) {
        wf.steps.push_back(step_from_json(j["steps"][i], i));
    }
    return wf;
}

Workflow parse_workflow(const std::string& yaml_text, const std::string& source) {
    return Workflow::from_json(yaml_to_json(yaml_text, source));
}

// ── Loading ──

std::vector<fs::path> workflow_dirs() {
    std::vector<fs::path> dirs{fs::path(".termineer") / "workflows"};
    std::string home = home_dir();
    if (!home.empty()) dirs.push_back(fs::path(home) / ".termineer" / "workflows");
    return dirs;
}

Workflow load_workflow(const std::string& name, const std::vector<fs::path>& dirs) {
    std::vector<std::string> candidates;
    if (ends_with(name, ".yaml") || ends_with(name, ".yml")) {
        candidates.push_back(name);
    } else {
        candidates.push_back(name + ".yaml");
        candidates.push_back(name + ".yml");
    }

    for (auto& dir : dirs) {
        for (auto& c : candidates) {
            fs::path p = dir / c;
            std::error_code ec;
            if (!fs::is_regular_file(p, ec)) continue;

            std::ifstream f(p);
            if (!f) throw WorkflowError(WorkflowErrorKind::io_error, "cannot read " + p.string());
            std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
            return parse_workflow(text, p.string());
        }
    }
    throw WorkflowError(WorkflowErrorKind::invalid_config,
                        "Workflow file not found: " + name + " (searched in .termineer/workflows/)");
}

std::vector<std::string> list_workflows(const std::vector<fs::path>& dirs) {
    std::vector<std::string> names;
    for (auto& dir : dirs) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) continue;
        for (auto& e : fs::directory_iterator(dir, ec)) {
            auto ext = e.path().extension().string();
            if (ext == ".yaml" || ext == ".yml") names.push_back(e.path().stem().string());
        }
    }
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());
    return names;
}

nlohmann::json parse_parameter_args(const std::vector<std::string>& values) {
    auto params = nlohmann::json::object();
    for (auto& v : values) {
        auto eq = v.find('=');
        if (eq == std::string::npos || eq == 0) {
            throw WorkflowError(WorkflowErrorKind::invalid_config,
                                "Invalid parameter format: " + v + ". Use key=value");
        }
        params[v.substr(0, eq)] = v.substr(eq + 1);
    }
    return params;
}

} // namespace termineer
