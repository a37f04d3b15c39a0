#ifndef CACM_ORCHESTRATOR_ORCHESTRATOR_CONFIG_HPP
#define CACM_ORCHESTRATOR_ORCHESTRATOR_CONFIG_HPP

#include "logger.hpp"
#include "worker_interface.hpp"
#include <string>
#include <cstddef>

namespace cacm {
namespace orchestrator {

/**
 * @brief What the orchestrator does after a (non-required) step fails
 */
enum class FailurePolicy {
    FAIL_FORWARD,   ///< Keep executing later steps; dependent steps cascade-fail
    FAIL_FAST       ///< Skip every remaining step
};

/**
 * @brief What happens when a step writes a target that is already bound
 */
enum class OutputConflictPolicy {
    LAST_WRITE_WINS,    ///< Overwrite, log a warning
    FIRST_WRITE_WINS,   ///< Keep the existing value, log a warning
    FAIL_STEP           ///< Fail the writing step with an OutputBinding error
};

inline std::string to_string(FailurePolicy policy) {
    switch (policy) {
        case FailurePolicy::FAIL_FORWARD: return "fail_forward";
        case FailurePolicy::FAIL_FAST: return "fail_fast";
        default: return "unknown";
    }
}

inline std::string to_string(OutputConflictPolicy policy) {
    switch (policy) {
        case OutputConflictPolicy::LAST_WRITE_WINS: return "last_write_wins";
        case OutputConflictPolicy::FIRST_WRITE_WINS: return "first_write_wins";
        case OutputConflictPolicy::FAIL_STEP: return "fail_step";
        default: return "unknown";
    }
}

/**
 * @throws ConfigurationError on an unknown policy name
 */
inline FailurePolicy parse_failure_policy(const std::string& name) {
    if (name == "fail_forward") return FailurePolicy::FAIL_FORWARD;
    if (name == "fail_fast") return FailurePolicy::FAIL_FAST;
    throw ConfigurationError("Unknown failure_policy: " + name);
}

/**
 * @throws ConfigurationError on an unknown policy name
 */
inline OutputConflictPolicy parse_output_conflict_policy(const std::string& name) {
    if (name == "last_write_wins") return OutputConflictPolicy::LAST_WRITE_WINS;
    if (name == "first_write_wins") return OutputConflictPolicy::FIRST_WRITE_WINS;
    if (name == "fail_step") return OutputConflictPolicy::FAIL_STEP;
    throw ConfigurationError("Unknown output_conflict_policy: " + name);
}

/**
 * @brief Orchestrator settings
 */
struct OrchestratorConfig {
    std::string catalog_path;                   ///< Capability catalog document, empty for none
    FailurePolicy failure_policy;
    OutputConflictPolicy output_conflict_policy;
    bool dispatch_on_unresolved_inputs;         ///< Run workers even with missing markers bound
    int step_timeout_ms;                        ///< Per-step timeout, 0 disables
    size_t max_delegation_depth;
    bool check_capabilities;                    ///< Warn about unknown capability refs before executing
    LoggerConfig logging;

    OrchestratorConfig()
        : failure_policy(FailurePolicy::FAIL_FORWARD),
          output_conflict_policy(OutputConflictPolicy::LAST_WRITE_WINS),
          dispatch_on_unresolved_inputs(false),
          step_timeout_ms(0),
          max_delegation_depth(8),
          check_capabilities(true) {}
};

} // namespace orchestrator
} // namespace cacm

#endif // CACM_ORCHESTRATOR_ORCHESTRATOR_CONFIG_HPP
