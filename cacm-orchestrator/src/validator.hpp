#ifndef CACM_ORCHESTRATOR_VALIDATOR_HPP
#define CACM_ORCHESTRATOR_VALIDATOR_HPP

#include "value.hpp"
#include <string>
#include <vector>

namespace cacm {
namespace orchestrator {

/**
 * @brief One validation problem: dotted document path plus message
 */
struct ValidationIssue {
    std::string path;       // e.g. "workflow.1.outputBindings.score"
    std::string message;

    ValidationIssue() = default;
    ValidationIssue(const std::string& path_, const std::string& message_)
        : path(path_), message(message_) {}

    std::string to_string() const { return path + ": " + message; }
};

/**
 * @brief Ordered validation outcome
 */
struct ValidationReport {
    std::vector<ValidationIssue> errors;

    bool is_valid() const { return errors.empty(); }

    void add(const std::string& path, const std::string& message) {
        errors.emplace_back(path, message);
    }
};

/**
 * @brief Validator seam used by the orchestrator before any step executes
 */
class IWorkflowValidator {
public:
    virtual ~IWorkflowValidator() = default;

    virtual ValidationReport validate(const Value& document) const = 0;
};

/**
 * @brief Structural validator for workflow instance documents
 *
 * Checks required fields, field types, unique step IDs and output binding
 * targets. Capability references are not checked here; an unknown
 * capability fails only its own step.
 */
class SchemaValidator : public IWorkflowValidator {
public:
    ValidationReport validate(const Value& document) const override;

private:
    void validate_declarations(const Value& document, ValidationReport& report) const;
    void validate_step(const Value& document, const Value& step, const std::string& path,
                       ValidationReport& report) const;
};

} // namespace orchestrator
} // namespace cacm

#endif // CACM_ORCHESTRATOR_VALIDATOR_HPP
