#include "context.hpp"

namespace termineer {

WorkflowContext::WorkflowContext(nlohmann::json parameters, std::optional<std::string> query)
    : parameters_(parameters.is_object() ? std::move(parameters) : nlohmann::json::object()),
      query_(std::move(query)) {}

void WorkflowContext::apply_parameters(const Workflow& wf) {
    for (auto& p : wf.parameters) {
        if (parameters_.contains(p.name)) continue;
        if (p.default_value) {
            parameters_[p.name] = *p.default_value;
        } else if (p.required) {
            throw WorkflowError(WorkflowErrorKind::missing_parameter, p.name);
        }
    }
}

std::optional<std::string> WorkflowContext::variable(const std::string& name) const {
    auto it = variables_.find(name);
    if (it == variables_.end()) return std::nullopt;
    return it->second;
}

nlohmann::json WorkflowContext::scope() const {
    nlohmann::json s = nlohmann::json::object();
    s["parameters"] = parameters_;
    for (auto& [k, v] : variables_) s[k] = v;
    if (agent_response_) s["agent_response"] = *agent_response_;
    if (query_) s["query"] = *query_;
    return s;
}

std::string WorkflowContext::render(const std::string& tmpl) const {
    return render_template(tmpl, scope());
}

static const nlohmann::json* lookup(const nlohmann::json& scope, const std::string& path) {
    const nlohmann::json* cur = &scope;
    size_t start = 0;
    while (start <= path.size()) {
        size_t dot = path.find('.', start);
        std::string key = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (cur->is_object()) {
            auto it = cur->find(key);
            if (it == cur->end()) return nullptr;
            cur = &*it;
        } else if (cur->is_array() && !key.empty() && key.size() < 10 &&
                   key.find_first_not_of("0123456789") == std::string::npos) {
            size_t idx = std::stoul(key);
            if (idx >= cur->size()) return nullptr;
            cur = &(*cur)[idx];
        } else {
            return nullptr;
        }
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return cur;
}

static std::string stringify(const nlohmann::json& v) {
    if (v.is_null()) return "";
    if (v.is_string()) return v.get<std::string>();
    return v.dump();
}

std::string render_template(const std::string& tmpl, const nlohmann::json& scope) {
    std::string result;
    size_t pos = 0;
    while (pos < tmpl.size()) {
        size_t open = tmpl.find("{{", pos);
        if (open == std::string::npos) {
            result.append(tmpl, pos, std::string::npos);
            break;
        }
        result.append(tmpl, pos, open - pos);

        // {{{ x }}} renders the same as {{ x }}
        bool triple = open + 2 < tmpl.size() && tmpl[open + 2] == '{';
        size_t body = open + (triple ? 3 : 2);
        const char* closer = triple ? "}}}" : "}}";
        size_t close = tmpl.find(closer, body);
        if (close == std::string::npos) {
            throw WorkflowError(WorkflowErrorKind::template_error,
                                "unterminated '{{' at offset " + std::to_string(open));
        }

        std::string path = trim(tmpl.substr(body, close - body));
        if (path.empty()) {
            throw WorkflowError(WorkflowErrorKind::template_error,
                                "empty expression at offset " + std::to_string(open));
        }
        if (auto* v = lookup(scope, path)) result += stringify(*v);
        pos = close + (triple ? 3 : 2);
    }
    return result;
}

} // namespace termineer
