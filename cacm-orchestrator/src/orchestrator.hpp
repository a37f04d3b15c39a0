/**
 * @file orchestrator.hpp
 * @brief Top-level driver executing CACM workflow instances
 *
 * The Orchestrator is responsible for:
 * - Validating a workflow instance before anything runs
 * - Executing steps in declared order against one SharedContext per run
 * - Resolving each step's input bindings and capturing its output bindings
 * - Obtaining workers through the WorkerLifecycleManager
 * - Recording a per-run ExecutionLog and step reports
 *
 * Error Handling:
 * - Validation failure ends the run before any step executes
 * - Every other failure is step-local: unresolved inputs, unknown
 *   capabilities, construction failures, worker errors, timeouts and output
 *   binding errors mark the step FAILED and execution continues (unless the
 *   step is required or the failure policy is fail_fast)
 * - run() does not throw for business-logic failures
 */

#ifndef CACM_ORCHESTRATOR_HPP
#define CACM_ORCHESTRATOR_HPP

#include "worker_interface.hpp"
#include "worker_registry.hpp"
#include "worker_lifecycle.hpp"
#include "capability_catalog.hpp"
#include "shared_context.hpp"
#include "skill_service.hpp"
#include "binding_resolver.hpp"
#include "validator.hpp"
#include "workflow_config.hpp"
#include "orchestrator_config.hpp"
#include "execution_log.hpp"
#include "logger.hpp"
#include <memory>
#include <vector>
#include <map>
#include <set>
#include <string>

namespace cacm {

/**
 * @brief Run-level state machine
 */
enum class RunState {
    IDLE,
    VALIDATING,
    INVALID,
    VALID,
    EXECUTING,
    DONE_SUCCESS,
    DONE_PARTIAL_FAILURE,
    DONE_FAILED
};

/**
 * @brief Step-level state machine
 */
enum class StepState {
    PENDING,
    RESOLVING_INPUTS,
    DISPATCHED,
    CAPTURED,
    FAILED,
    SKIPPED     ///< Not executed because an earlier required step failed (or fail_fast)
};

std::string run_state_to_string(RunState state);
std::string step_state_to_string(StepState state);

/**
 * @brief Outcome of one workflow step
 */
struct StepReport {
    std::string step_id;
    std::string capability_ref;
    StepState state;
    ResultStatus result_status;            ///< Worker status, meaningful once dispatched
    ErrorKind error_kind;                  ///< NONE unless FAILED
    std::string message;
    std::vector<std::string> unresolved_inputs;
    std::vector<std::string> bound_targets;
    std::vector<std::string> warnings;
    double execution_time_ms;

    StepReport()
        : state(StepState::PENDING), result_status(ResultStatus::SUCCESS),
          error_kind(ErrorKind::NONE), execution_time_ms(0.0) {}

    StepReport(const std::string& step_id_, const std::string& capability_ref_)
        : step_id(step_id_), capability_ref(capability_ref_),
          state(StepState::PENDING), result_status(ResultStatus::SUCCESS),
          error_kind(ErrorKind::NONE), execution_time_ms(0.0) {}
};

/**
 * @brief Everything a run produces
 *
 * `outputs` holds every cacm.outputs.* value bound during the run, including
 * values bound before or after a failing step.
 */
struct RunResult {
    bool success;                                     ///< All steps captured, no required output missing
    RunState state;
    std::vector<RunState> state_history;              ///< Every state entered, in order
    std::string cacm_id;
    std::string session_id;
    ExecutionLog logs;
    Value outputs;
    Value intermediate;
    std::vector<StepReport> steps;
    std::vector<orchestrator::ValidationIssue> validation_errors;
    std::vector<std::string> missing_outputs;         ///< Declared, non-optional, never bound
    std::shared_ptr<SharedContext> context;
    double total_execution_time_ms;

    RunResult()
        : success(false), state(RunState::IDLE),
          outputs(Value::object()), intermediate(Value::object()),
          total_execution_time_ms(0.0) {}

    const StepReport* find_step(const std::string& step_id) const;

    /**
     * @brief Number of steps that were dispatched or failed (not skipped)
     */
    size_t steps_executed() const;

    size_t count(StepState state) const;
};

/**
 * @brief Main orchestrator coordinating workflow execution
 *
 * The worker cache lives as long as the orchestrator, so two runs (or two
 * steps of one run) naming the same capability share one worker instance.
 *
 * Usage Example:
 *   @code
 *   OrchestratorConfig config = parse_orchestrator_config_from_file("orchestrator.json");
 *   Orchestrator orchestrator(config);
 *
 *   Value document = load_json_document("workflow.json");
 *   RunResult result = orchestrator.run(document);
 *
 *   for (const auto& line : result.logs.lines()) {
 *       std::cout << line << std::endl;
 *   }
 *   if (!result.success) {
 *       std::cerr << "Run failed" << std::endl;
 *   }
 *   @endcode
 */
class Orchestrator {
public:
    /**
     * @brief Constructor with an already loaded catalog
     *
     * @param catalog Capability catalog (copied into the orchestrator)
     * @param config Orchestrator configuration (optional)
     * @param skills Skill service (optional, a SkillRegistry with the
     *               BasicCalculations plugin is created if nullptr)
     * @param validator Validator (optional, SchemaValidator if nullptr)
     * @param logger Logger instance (optional, uses default if nullptr)
     */
    explicit Orchestrator(
        CapabilityCatalog catalog,
        const orchestrator::OrchestratorConfig& config = orchestrator::OrchestratorConfig(),
        ISkillService* skills = nullptr,
        const orchestrator::IWorkflowValidator* validator = nullptr,
        Logger* logger = nullptr
    );

    /**
     * @brief Constructor loading the catalog from config.catalog_path
     *
     * An empty catalog_path gives an empty catalog; a missing or malformed
     * catalog file is logged and also gives an empty catalog.
     */
    explicit Orchestrator(
        const orchestrator::OrchestratorConfig& config,
        ISkillService* skills = nullptr,
        const orchestrator::IWorkflowValidator* validator = nullptr,
        Logger* logger = nullptr
    );

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * @brief Execute a workflow instance document with a fresh SharedContext
     */
    RunResult run(const Value& document);

    /**
     * @brief Execute a workflow instance document against a caller-supplied context
     *
     * @param context Shared context for the run (a fresh one is created if null)
     */
    RunResult run(const Value& document, std::shared_ptr<SharedContext> context);

    /**
     * @brief Registry used to construct workers; register custom types here
     */
    WorkerRegistry& worker_registry() { return registry_; }

    WorkerLifecycleManager& worker_manager() { return *manager_; }

    const CapabilityCatalog& catalog() const { return catalog_; }

    const orchestrator::OrchestratorConfig& get_config() const { return config_; }

    std::map<std::string, WorkerStats> get_worker_stats() const;

private:
    void initialize();

    bool execute_step(
        const orchestrator::WorkflowStep& step,
        const orchestrator::WorkflowInstance& instance,
        orchestrator::BindingResolver& resolver,
        SharedContext& context,
        const std::set<std::string>& failed_steps,
        StepReport& report,
        ExecutionLog& logs
    );

    bool capture_outputs(
        const orchestrator::WorkflowStep& step,
        const WorkerResult& worker_result,
        orchestrator::BindingResolver& resolver,
        const LogContext& ctx,
        StepReport& report,
        ExecutionLog& logs
    );

    void fail_step(StepReport& report, ErrorKind kind, const std::string& message,
                   const LogContext& ctx, ExecutionLog& logs);

    void transition(RunResult& result, RunState next, const LogContext& ctx);
    void transition(StepReport& report, StepState next, const LogContext& ctx);

    void check_capabilities(const orchestrator::WorkflowInstance& instance, ExecutionLog& logs) const;

    CapabilityCatalog catalog_;
    orchestrator::OrchestratorConfig config_;
    Logger* logger_;

    WorkerRegistry registry_;
    std::unique_ptr<SkillRegistry> owned_skills_;
    ISkillService* skills_;
    orchestrator::SchemaValidator default_validator_;
    const orchestrator::IWorkflowValidator* validator_;
    std::unique_ptr<WorkerLifecycleManager> manager_;
};

} // namespace cacm

#endif // CACM_ORCHESTRATOR_HPP
