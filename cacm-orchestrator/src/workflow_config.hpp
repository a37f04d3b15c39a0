#ifndef CACM_ORCHESTRATOR_WORKFLOW_CONFIG_HPP
#define CACM_ORCHESTRATOR_WORKFLOW_CONFIG_HPP

#include "value.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <stdexcept>

namespace cacm {
namespace orchestrator {

/**
 * @brief Exception thrown when a workflow document cannot be turned into a WorkflowInstance
 */
class WorkflowConfigError : public std::runtime_error {
public:
    explicit WorkflowConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Declared workflow input ("inputs.<name>")
 */
struct InputDeclaration {
    std::string name;
    std::string type;           // e.g. "string", "object"
    std::string description;
    Value declaration;          // Full declaration as written, {"value": ..., "type": ...}

    InputDeclaration() = default;
    InputDeclaration(const std::string& name_, const Value& declaration_)
        : name(name_), declaration(declaration_) {}

    bool has_value() const {
        return declaration.is_object() && declaration.contains("value");
    }
};

/**
 * @brief Declared workflow output ("outputs.<name>")
 */
struct OutputDeclaration {
    std::string name;
    std::string type;
    std::string description;
    bool optional;              // Optional outputs may stay unbound without a warning

    OutputDeclaration() : optional(false) {}
    explicit OutputDeclaration(const std::string& name_)
        : name(name_), optional(false) {}
};

/**
 * @brief One step of the workflow
 */
struct WorkflowStep {
    std::string step_id;
    std::string description;
    std::string capability_ref;                        // computeCapabilityRef
    std::map<std::string, Value> input_bindings;       // input name -> reference string or literal
    std::map<std::string, std::string> output_bindings; // result field -> target reference
    bool required;                                     // A failure skips the remaining steps

    WorkflowStep() : required(false) {}
    WorkflowStep(const std::string& step_id_, const std::string& capability_ref_)
        : step_id(step_id_), capability_ref(capability_ref_), required(false) {}
};

/**
 * @brief Parsed workflow instance, immutable once execution begins
 */
struct WorkflowInstance {
    std::string cacm_id;
    std::string name;
    std::string version;
    std::string description;
    std::vector<InputDeclaration> inputs;     // Sorted by name
    std::vector<OutputDeclaration> outputs;   // Sorted by name
    std::vector<WorkflowStep> steps;          // Execution order

    Value inputs_document;                    // Raw "inputs" object, root of cacm.inputs.*

    WorkflowInstance() : inputs_document(Value::object()) {}

    const WorkflowStep* find_step(const std::string& step_id) const;

    bool declares_output(const std::string& name) const;

    /**
     * @brief Step that writes an output binding target, if any
     *
     * Returns the first step in execution order whose output bindings write
     * the target or one of its parents/children.
     */
    std::optional<std::string> producer_of(const std::string& target) const;

    /**
     * @brief IDs of earlier steps whose outputs the given step's bindings reference
     */
    std::vector<std::string> upstream_steps(const std::string& step_id) const;
};

/**
 * @brief Build a WorkflowInstance from a workflow document
 *
 * Performs only the structural checks needed to build the model. Documents
 * that pass SchemaValidator always build.
 *
 * @throws WorkflowConfigError if the document does not have the expected shape
 */
WorkflowInstance build_workflow_instance(const Value& document);

} // namespace orchestrator
} // namespace cacm

#endif // CACM_ORCHESTRATOR_WORKFLOW_CONFIG_HPP
