#include "workflow_config.hpp"
#include <set>

namespace cacm {
namespace orchestrator {

namespace {

std::string optional_string(const Value& node, const char* key) {
    if (node.is_object() && node.contains(key) && node[key].is_string()) {
        return node[key].get<std::string>();
    }
    return "";
}

std::string required_string(const Value& node, const char* key, const std::string& where) {
    if (!node.contains(key) || !node[key].is_string()) {
        throw WorkflowConfigError(where + " missing required string field: " + key);
    }
    return node[key].get<std::string>();
}

// "cacm.outputs.a.b" and "cacm.outputs.a" overlap; "cacm.outputs.ab" does not
bool paths_overlap(const std::string& a, const std::string& b) {
    if (a == b) {
        return true;
    }
    const std::string& shorter = a.size() < b.size() ? a : b;
    const std::string& longer = a.size() < b.size() ? b : a;
    return longer.compare(0, shorter.size(), shorter) == 0 && longer[shorter.size()] == '.';
}

} // anonymous namespace

const WorkflowStep* WorkflowInstance::find_step(const std::string& step_id) const {
    for (const auto& step : steps) {
        if (step.step_id == step_id) {
            return &step;
        }
    }
    return nullptr;
}

bool WorkflowInstance::declares_output(const std::string& output_name) const {
    for (const auto& output : outputs) {
        if (output.name == output_name) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> WorkflowInstance::producer_of(const std::string& target) const {
    for (const auto& step : steps) {
        for (const auto& [field, bound_target] : step.output_bindings) {
            if (paths_overlap(bound_target, target)) {
                return step.step_id;
            }
        }
    }
    return std::nullopt;
}

std::vector<std::string> WorkflowInstance::upstream_steps(const std::string& step_id) const {
    std::vector<std::string> result;
    std::set<std::string> seen;

    const WorkflowStep* step = find_step(step_id);
    if (!step) {
        return result;
    }

    for (const auto& [name, binding] : step->input_bindings) {
        if (!binding.is_string()) {
            continue;
        }
        auto producer = producer_of(binding.get<std::string>());
        if (producer && *producer != step_id && seen.insert(*producer).second) {
            result.push_back(*producer);
        }
    }
    return result;
}

WorkflowInstance build_workflow_instance(const Value& document) {
    if (!document.is_object()) {
        throw WorkflowConfigError("Workflow document must be a JSON object");
    }

    WorkflowInstance instance;
    instance.cacm_id = required_string(document, "cacmId", "Workflow");
    instance.name = required_string(document, "name", "Workflow");
    instance.version = optional_string(document, "version");
    instance.description = optional_string(document, "description");

    if (document.contains("inputs")) {
        const Value& inputs = document["inputs"];
        if (!inputs.is_object()) {
            throw WorkflowConfigError("Workflow field 'inputs' must be an object");
        }
        instance.inputs_document = inputs;
        for (auto it = inputs.begin(); it != inputs.end(); ++it) {
            InputDeclaration input(it.key(), it.value());
            input.type = optional_string(it.value(), "type");
            input.description = optional_string(it.value(), "description");
            instance.inputs.push_back(std::move(input));
        }
    }

    if (document.contains("outputs")) {
        const Value& outputs = document["outputs"];
        if (!outputs.is_object()) {
            throw WorkflowConfigError("Workflow field 'outputs' must be an object");
        }
        for (auto it = outputs.begin(); it != outputs.end(); ++it) {
            OutputDeclaration output(it.key());
            output.type = optional_string(it.value(), "type");
            output.description = optional_string(it.value(), "description");
            if (it.value().is_object() && it.value().contains("optional")
                && it.value()["optional"].is_boolean()) {
                output.optional = it.value()["optional"].get<bool>();
            }
            instance.outputs.push_back(std::move(output));
        }
    }

    if (!document.contains("workflow") || !document["workflow"].is_array()) {
        throw WorkflowConfigError("Workflow missing required array field: workflow");
    }

    std::set<std::string> step_ids;
    size_t index = 0;
    for (const auto& step_json : document["workflow"]) {
        std::string where = "workflow[" + std::to_string(index++) + "]";
        if (!step_json.is_object()) {
            throw WorkflowConfigError(where + " must be an object");
        }

        WorkflowStep step(required_string(step_json, "stepId", where),
                          required_string(step_json, "computeCapabilityRef", where));
        step.description = optional_string(step_json, "description");

        if (!step_ids.insert(step.step_id).second) {
            throw WorkflowConfigError("Duplicate stepId: " + step.step_id);
        }

        if (step_json.contains("inputBindings")) {
            const Value& bindings = step_json["inputBindings"];
            if (!bindings.is_object()) {
                throw WorkflowConfigError(where + ".inputBindings must be an object");
            }
            for (auto it = bindings.begin(); it != bindings.end(); ++it) {
                step.input_bindings[it.key()] = it.value();
            }
        }

        if (step_json.contains("outputBindings")) {
            const Value& bindings = step_json["outputBindings"];
            if (!bindings.is_object()) {
                throw WorkflowConfigError(where + ".outputBindings must be an object");
            }
            for (auto it = bindings.begin(); it != bindings.end(); ++it) {
                if (!it.value().is_string()) {
                    throw WorkflowConfigError(where + ".outputBindings." + it.key() +
                                              " must be a reference string");
                }
                step.output_bindings[it.key()] = it.value().get<std::string>();
            }
        }

        if (step_json.contains("required") && step_json["required"].is_boolean()) {
            step.required = step_json["required"].get<bool>();
        }

        instance.steps.push_back(std::move(step));
    }

    return instance;
}

} // namespace orchestrator
} // namespace cacm
