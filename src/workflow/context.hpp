#pragma once
#include "workflow.hpp"
#include <map>

namespace termineer {

// Values visible to {{ path }} templates while a workflow runs.
class WorkflowContext {
public:
    WorkflowContext(nlohmann::json parameters = nlohmann::json::object(),
                    std::optional<std::string> query = std::nullopt);

    // Fills defaults, then throws WorkflowError(missing_parameter) for any
    // required parameter still absent.
    void apply_parameters(const Workflow& wf);

    void set_query(std::optional<std::string> q) { query_ = std::move(q); }
    const std::optional<std::string>& query() const { return query_; }

    void set_variable(const std::string& name, const std::string& value) { variables_[name] = value; }
    std::optional<std::string> variable(const std::string& name) const;
    const std::map<std::string, std::string>& variables() const { return variables_; }

    void set_agent_response(const std::string& r) { agent_response_ = r; }
    const std::optional<std::string>& agent_response() const { return agent_response_; }

    const nlohmann::json& parameters() const { return parameters_; }

    // {parameters: {...}, query, <variables>, agent_response}
    nlohmann::json scope() const;

    // Missing values render empty. An unterminated "{{" throws template_error.
    std::string render(const std::string& tmpl) const;

private:
    nlohmann::json parameters_;
    std::map<std::string, std::string> variables_;
    std::optional<std::string> agent_response_;
    std::optional<std::string> query_;
};

// Renders {{ a.b.c }} against scope. Exposed for tests.
std::string render_template(const std::string& tmpl, const nlohmann::json& scope);

} // namespace termineer
