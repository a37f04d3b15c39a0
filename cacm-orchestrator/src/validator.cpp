#include "validator.hpp"
#include "binding_resolver.hpp"
#include <set>

namespace cacm {
namespace orchestrator {

namespace {

bool is_non_empty_string(const Value& node, const char* key) {
    return node.contains(key) && node[key].is_string() && !node[key].get<std::string>().empty();
}

} // anonymous namespace

ValidationReport SchemaValidator::validate(const Value& document) const {
    ValidationReport report;

    if (!document.is_object()) {
        report.add("$", "workflow instance must be a JSON object");
        return report;
    }

    if (!is_non_empty_string(document, "cacmId")) {
        report.add("cacmId", "required non-empty string");
    }
    if (!is_non_empty_string(document, "name")) {
        report.add("name", "required non-empty string");
    }
    if (document.contains("version") && !document["version"].is_string()) {
        report.add("version", "must be a string");
    }
    if (document.contains("description") && !document["description"].is_string()) {
        report.add("description", "must be a string");
    }

    validate_declarations(document, report);

    if (!document.contains("workflow")) {
        report.add("workflow", "required field missing");
        return report;
    }

    const Value& workflow = document["workflow"];
    if (!workflow.is_array()) {
        report.add("workflow", "must be an array");
        return report;
    }
    if (workflow.empty()) {
        report.add("workflow", "must contain at least one step");
        return report;
    }

    std::set<std::string> step_ids;
    for (size_t i = 0; i < workflow.size(); ++i) {
        std::string path = "workflow." + std::to_string(i);
        const Value& step = workflow[i];

        validate_step(document, step, path, report);

        if (step.is_object() && is_non_empty_string(step, "stepId")) {
            std::string step_id = step["stepId"].get<std::string>();
            if (!step_ids.insert(step_id).second) {
                report.add(path + ".stepId", "duplicate stepId '" + step_id + "'");
            }
        }
    }

    return report;
}

void SchemaValidator::validate_declarations(const Value& document, ValidationReport& report) const {
    if (document.contains("inputs")) {
        const Value& inputs = document["inputs"];
        if (!inputs.is_object()) {
            report.add("inputs", "must be an object");
        } else {
            for (auto it = inputs.begin(); it != inputs.end(); ++it) {
                std::string path = "inputs." + it.key();
                if (!it.value().is_object()) {
                    report.add(path, "input declaration must be an object");
                } else if (!it.value().contains("type") || !it.value()["type"].is_string()) {
                    report.add(path + ".type", "required string");
                }
            }
        }
    }

    if (document.contains("outputs")) {
        const Value& outputs = document["outputs"];
        if (!outputs.is_object()) {
            report.add("outputs", "must be an object");
        } else {
            for (auto it = outputs.begin(); it != outputs.end(); ++it) {
                std::string path = "outputs." + it.key();
                if (!it.value().is_object()) {
                    report.add(path, "output declaration must be an object");
                } else if (it.value().contains("optional") && !it.value()["optional"].is_boolean()) {
                    report.add(path + ".optional", "must be a boolean");
                }
            }
        }
    }
}

void SchemaValidator::validate_step(const Value& document, const Value& step, const std::string& path,
                                    ValidationReport& report) const {
    if (!step.is_object()) {
        report.add(path, "step must be an object");
        return;
    }

    if (!is_non_empty_string(step, "stepId")) {
        report.add(path + ".stepId", "required non-empty string");
    }
    if (!is_non_empty_string(step, "computeCapabilityRef")) {
        report.add(path + ".computeCapabilityRef", "required non-empty string");
    }
    if (step.contains("description") && !step["description"].is_string()) {
        report.add(path + ".description", "must be a string");
    }
    if (step.contains("required") && !step["required"].is_boolean()) {
        report.add(path + ".required", "must be a boolean");
    }
    if (step.contains("inputBindings") && !step["inputBindings"].is_object()) {
        report.add(path + ".inputBindings", "must be an object");
    }

    if (!step.contains("outputBindings")) {
        return;
    }

    const Value& bindings = step["outputBindings"];
    if (!bindings.is_object()) {
        report.add(path + ".outputBindings", "must be an object");
        return;
    }

    const Value empty_outputs = Value::object();
    const Value& declared = (document.contains("outputs") && document["outputs"].is_object())
        ? document["outputs"] : empty_outputs;

    for (auto it = bindings.begin(); it != bindings.end(); ++it) {
        std::string binding_path = path + ".outputBindings." + it.key();

        if (!it.value().is_string()) {
            report.add(binding_path, "target must be a reference string");
            continue;
        }

        std::string target = it.value().get<std::string>();
        Reference reference;
        try {
            reference = parse_reference(target);
        } catch (const BindingParseError& e) {
            report.add(binding_path, e.what());
            continue;
        }

        if (reference.ns == BindingNamespace::INPUTS) {
            report.add(binding_path, "target '" + target + "' must be under cacm.outputs. or intermediate.");
        } else if (reference.ns == BindingNamespace::OUTPUTS
                   && !declared.contains(reference.segments.front())) {
            report.add(binding_path, "target '" + target + "' names undeclared output '" +
                       reference.segments.front() + "'");
        }
    }
}

} // namespace orchestrator
} // namespace cacm
