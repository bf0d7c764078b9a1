#pragma once
#include "../utils.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>

namespace termineer {

enum class WorkflowErrorKind {
    missing_parameter,
    invalid_step_type,
    missing_field,
    template_error,
    io_error,
    shell_error,
    agent_error,
    invalid_config,
    permission_denied
};

class WorkflowError : public std::runtime_error {
public:
    WorkflowError(WorkflowErrorKind kind, const std::string& detail);
    WorkflowErrorKind kind() const { return kind_; }
private:
    WorkflowErrorKind kind_;
};

struct WorkflowParameter {
    std::string name;
    std::optional<std::string> description;
    std::string type = "string";
    bool required = false;
    std::optional<nlohmann::json> default_value;
};

enum class StepType {
    shell,
    message,
    file,
    output,
    wait,
    agent
};

enum class FileAction {
    read,
    write,
    append
};

// A step's type is chosen by which of the step keys is present; that key's
// value is the step id.
struct WorkflowStep {
    StepType type = StepType::shell;
    std::string id;
    std::optional<std::string> description;
    bool fail_on_error = true;

    // shell
    std::string command;
    std::optional<std::string> store_output;

    // message, output, file(write/append)
    std::string content;
    std::optional<std::string> store_response;

    // file
    FileAction action = FileAction::read;
    std::string path;
    std::optional<std::string> store_as;

    // wait
    std::optional<std::string> wait_message;
    std::optional<std::string> store_input;

    // agent
    std::optional<std::string> kind;
    std::string prompt;
    std::optional<std::string> into;
};

struct Workflow {
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> version;
    std::optional<std::string> author;
    std::vector<WorkflowParameter> parameters;
    std::optional<std::string> query_template;
    std::vector<WorkflowStep> steps;

    // Throws WorkflowError (missing_field, invalid_step_type, invalid_config).
    static Workflow from_json(const nlohmann::json& j);
};

std::string step_type_name(StepType type);

// YAML document -> JSON. Plain scalars that read as bool/int/float are typed;
// quoted scalars stay strings. Throws WorkflowError(invalid_config).
nlohmann::json yaml_to_json(const std::string& yaml_text, const std::string& source = "<string>");

Workflow parse_workflow(const std::string& yaml_text, const std::string& source = "<string>");

// .termineer/workflows under the current directory, then under $HOME.
std::vector<fs::path> workflow_dirs();

// NAME, NAME.yaml or NAME.yml in the given dirs, first hit wins.
Workflow load_workflow(const std::string& name, const std::vector<fs::path>& dirs = workflow_dirs());

// Sorted, de-duplicated file stems.
std::vector<std::string> list_workflows(const std::vector<fs::path>& dirs = workflow_dirs());

// "K=V" strings from the command line. Throws WorkflowError(invalid_config).
nlohmann::json parse_parameter_args(const std::vector<std::string>& values);

} // namespace termineer
