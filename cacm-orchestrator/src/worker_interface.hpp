/**
 * @file worker_interface.hpp
 * @brief Abstract contract for the workers ("agents") that execute workflow steps
 *
 * Every analytical agent implements Worker::run(). The orchestrator resolves a
 * step's input bindings, hands them to the worker together with the run's
 * SharedContext, and captures named fields of the returned WorkerResult into
 * the step's output bindings.
 *
 * Design Principles:
 * - Failures are data: expected failures come back as WorkerResult::error(),
 *   exceptions are reserved for programmer mistakes and setup problems
 * - Workers never own each other: peers are reached through the
 *   WorkerLifecycleManager back-reference injected at creation
 * - Workers are cached and reused, so per-worker state persists across steps
 */

#ifndef CACM_WORKER_INTERFACE_HPP
#define CACM_WORKER_INTERFACE_HPP

#include "value.hpp"
#include <string>
#include <vector>
#include <stdexcept>

namespace cacm {

class SharedContext;
class WorkerLifecycleManager;
class ISkillService;

/**
 * @brief Status discriminator carried by every worker result
 */
enum class ResultStatus {
    SUCCESS,    ///< All requested work done, payload complete
    ERROR,      ///< Work failed, payload must not be bound
    PARTIAL     ///< Usable payload with warnings (some fields may be absent)
};

inline std::string status_to_string(ResultStatus status) {
    switch (status) {
        case ResultStatus::SUCCESS: return "success";
        case ResultStatus::ERROR: return "error";
        case ResultStatus::PARTIAL: return "partial";
        default: return "unknown";
    }
}

/**
 * @brief Classification of a failed step or invocation
 */
enum class ErrorKind {
    NONE,
    VALIDATION,
    CATALOG_LOAD,
    CAPABILITY_NOT_FOUND,
    WORKER_CONSTRUCTION,
    UNRESOLVED_BINDING,
    WORKER_EXECUTION,
    TIMEOUT,
    DELEGATION,
    OUTPUT_BINDING
};

inline std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "None";
        case ErrorKind::VALIDATION: return "ValidationError";
        case ErrorKind::CATALOG_LOAD: return "CatalogLoadError";
        case ErrorKind::CAPABILITY_NOT_FOUND: return "CapabilityNotFound";
        case ErrorKind::WORKER_CONSTRUCTION: return "WorkerConstructionError";
        case ErrorKind::UNRESOLVED_BINDING: return "UnresolvedBinding";
        case ErrorKind::WORKER_EXECUTION: return "WorkerExecutionError";
        case ErrorKind::TIMEOUT: return "Timeout";
        case ErrorKind::DELEGATION: return "DelegationError";
        case ErrorKind::OUTPUT_BINDING: return "OutputBindingError";
        default: return "Unknown";
    }
}

/**
 * @brief Result returned by Worker::run
 *
 * `fields` is always a JSON object; its members are the named payload fields
 * that output bindings pick from.
 */
struct WorkerResult {
    ResultStatus status;
    std::string message;
    Value fields;
    std::vector<std::string> warnings;
    ErrorKind error_kind;                ///< Set for ERROR results
    double execution_time_ms;

    WorkerResult()
        : status(ResultStatus::SUCCESS), fields(Value::object()),
          error_kind(ErrorKind::NONE), execution_time_ms(0.0) {}

    static WorkerResult success(Value fields = Value::object(), const std::string& message = "") {
        WorkerResult result;
        result.fields = fields.is_object() ? std::move(fields) : Value::object();
        result.message = message;
        return result;
    }

    static WorkerResult error(const std::string& message,
                              ErrorKind kind = ErrorKind::WORKER_EXECUTION) {
        WorkerResult result;
        result.status = ResultStatus::ERROR;
        result.message = message;
        result.error_kind = kind;
        return result;
    }

    static WorkerResult partial(Value fields,
                                std::vector<std::string> warnings,
                                const std::string& message = "") {
        WorkerResult result = success(std::move(fields), message);
        result.status = ResultStatus::PARTIAL;
        result.warnings = std::move(warnings);
        return result;
    }

    bool ok() const { return status != ResultStatus::ERROR; }

    bool has_field(const std::string& name) const {
        return fields.is_object() && fields.contains(name);
    }
};

/**
 * @brief Worker metadata
 */
struct WorkerInfo {
    std::string name;            ///< Name the worker is cached under
    std::string worker_type;     ///< Registry type it was built from
    std::string default_skill;   ///< Default skill plugin, empty if none
};

/**
 * @brief Base exception for orchestration errors
 */
class OrchestrationError : public std::runtime_error {
public:
    explicit OrchestrationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when a worker cannot be constructed
 */
class WorkerConstructionError : public OrchestrationError {
public:
    explicit WorkerConstructionError(const std::string& message)
        : OrchestrationError("Worker construction failed: " + message) {}
};

/**
 * @brief Raised inside a worker when its task fails
 *
 * The lifecycle manager converts it into an ERROR result; it never reaches
 * the orchestrator's step loop.
 */
class WorkerExecutionError : public OrchestrationError {
public:
    explicit WorkerExecutionError(const std::string& message)
        : OrchestrationError("Execution failed: " + message) {}
};

/**
 * @brief Raised when configuration is invalid
 */
class ConfigurationError : public OrchestrationError {
public:
    explicit ConfigurationError(const std::string& message)
        : OrchestrationError("Configuration error: " + message) {}
};

/**
 * @brief Abstract base for all workers
 *
 * Lifecycle:
 *   1. constructed by a WorkerRegistry factory
 *   2. attach(manager, skills) - called once by WorkerLifecycleManager
 *   3. run(task, inputs, context) - any number of times, across steps and runs
 *
 * Usage Example:
 *   @code
 *   class ScoringWorker : public Worker {
 *   public:
 *       ScoringWorker() : Worker("ScoringWorker", "scoring", "BasicCalculations") {}
 *
 *       WorkerResult run(const std::string& task, const Value& inputs,
 *                        SharedContext& context) override {
 *           Value ratio = skills()->invoke(default_skill(), "calculate_ratio", inputs);
 *           return WorkerResult::success({{"ratio", ratio}});
 *       }
 *   };
 *   @endcode
 */
class Worker {
public:
    Worker(const std::string& name,
           const std::string& worker_type,
           const std::string& default_skill = "");

    virtual ~Worker() = default;

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    /**
     * @brief Execute one step's task
     *
     * @param task_description Step description from the workflow
     * @param step_inputs Resolved input bindings (object); unresolved inputs
     *                    carry a missing marker (see binding_resolver.hpp)
     * @param context Shared state of the current run
     *
     * @return WorkerResult; implementations should return ERROR results
     *         instead of throwing for expected failures
     */
    virtual WorkerResult run(
        const std::string& task_description,
        const Value& step_inputs,
        SharedContext& context
    ) = 0;

    virtual WorkerInfo get_info() const;

    const std::string& name() const { return name_; }
    const std::string& worker_type() const { return worker_type_; }
    const std::string& default_skill() const { return default_skill_; }

    /**
     * @brief Wire the worker to its manager and the skill service
     *
     * Called by WorkerLifecycleManager right after construction.
     */
    void attach(WorkerLifecycleManager* manager, ISkillService* skills);

    bool is_attached() const { return manager_ != nullptr; }

protected:
    /**
     * @brief Run a peer worker through the lifecycle manager
     *
     * Delegation depth and cycles are guarded by the manager; a tripped guard
     * comes back as an ERROR result with ErrorKind::DELEGATION.
     */
    WorkerResult delegate(
        const std::string& peer_name,
        const std::string& task_description,
        const Value& inputs,
        SharedContext& context,
        const Value& creation_hints = Value::object()
    );

    ISkillService* skills() const { return skills_; }

private:
    std::string name_;
    std::string worker_type_;
    std::string default_skill_;
    WorkerLifecycleManager* manager_;
    ISkillService* skills_;
};

} // namespace cacm

#endif // CACM_WORKER_INTERFACE_HPP
