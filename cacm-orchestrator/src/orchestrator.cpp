/**
 * @file orchestrator.cpp
 * @brief Implementation of the workflow Orchestrator
 */

#include "orchestrator.hpp"
#include <chrono>
#include <sstream>
#include <algorithm>
#include <utility>

namespace cacm {

using orchestrator::BindingResolver;
using orchestrator::OutputConflictPolicy;
using orchestrator::FailurePolicy;
using orchestrator::WorkflowInstance;
using orchestrator::WorkflowStep;

namespace {

const char* const kOrchestrator = "Orchestrator";
const char* const kValidator = "Validator";
const char* const kResolver = "BindingResolver";
const char* const kCatalog = "Catalog";
const char* const kWorker = "Worker";

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::string text;
    for (const auto& item : items) {
        if (!text.empty()) text += separator;
        text += item;
    }
    return text;
}

std::string document_cacm_id(const Value& document) {
    if (document.is_object() && document.contains("cacmId") && document["cacmId"].is_string()) {
        return document["cacmId"].get<std::string>();
    }
    return "";
}

} // anonymous namespace

std::string run_state_to_string(RunState state) {
    switch (state) {
        case RunState::IDLE: return "Idle";
        case RunState::VALIDATING: return "Validating";
        case RunState::INVALID: return "Invalid";
        case RunState::VALID: return "Valid";
        case RunState::EXECUTING: return "Executing";
        case RunState::DONE_SUCCESS: return "DoneSuccess";
        case RunState::DONE_PARTIAL_FAILURE: return "DonePartialFailure";
        case RunState::DONE_FAILED: return "DoneFailed";
        default: return "Unknown";
    }
}

std::string step_state_to_string(StepState state) {
    switch (state) {
        case StepState::PENDING: return "Pending";
        case StepState::RESOLVING_INPUTS: return "ResolvingInputs";
        case StepState::DISPATCHED: return "Dispatched";
        case StepState::CAPTURED: return "Captured";
        case StepState::FAILED: return "Failed";
        case StepState::SKIPPED: return "Skipped";
        default: return "Unknown";
    }
}

const StepReport* RunResult::find_step(const std::string& step_id) const {
    for (const auto& step : steps) {
        if (step.step_id == step_id) {
            return &step;
        }
    }
    return nullptr;
}

size_t RunResult::steps_executed() const {
    return steps.size() - count(StepState::SKIPPED);
}

size_t RunResult::count(StepState state_filter) const {
    return static_cast<size_t>(std::count_if(steps.begin(), steps.end(),
        [state_filter](const StepReport& step) { return step.state == state_filter; }));
}

Orchestrator::Orchestrator(
    CapabilityCatalog catalog,
    const orchestrator::OrchestratorConfig& config,
    ISkillService* skills,
    const orchestrator::IWorkflowValidator* validator,
    Logger* logger
)
    : catalog_(std::move(catalog)),
      config_(config),
      logger_(logger),
      skills_(skills),
      validator_(validator) {
    initialize();
}

Orchestrator::Orchestrator(
    const orchestrator::OrchestratorConfig& config,
    ISkillService* skills,
    const orchestrator::IWorkflowValidator* validator,
    Logger* logger
)
    : config_(config),
      logger_(logger),
      skills_(skills),
      validator_(validator) {

    if (!config_.catalog_path.empty()) {
        catalog_ = CapabilityCatalog::load(config_.catalog_path, logger_);
    }
    initialize();
}

void Orchestrator::initialize() {
    // Create default logger if none provided
    if (!logger_) {
        logger_ = &Logger::get_instance();
    }
    if (!skills_) {
        owned_skills_ = std::make_unique<SkillRegistry>();
        skills_ = owned_skills_.get();
    }
    if (!validator_) {
        validator_ = &default_validator_;
    }

    LifecycleConfig lifecycle_config;
    lifecycle_config.max_delegation_depth = config_.max_delegation_depth;
    lifecycle_config.timeout_ms = config_.step_timeout_ms;

    manager_ = std::make_unique<WorkerLifecycleManager>(
        catalog_, registry_, skills_, lifecycle_config, logger_);
}

RunResult Orchestrator::run(const Value& document) {
    return run(document, nullptr);
}

RunResult Orchestrator::run(const Value& document, std::shared_ptr<SharedContext> context) {
    RunResult result;
    auto start_time = std::chrono::steady_clock::now();

    result.cacm_id = document_cacm_id(document);
    LogContext run_ctx;
    run_ctx.phase = "validate";
    if (context) {
        run_ctx.session_id = context->get_session_id();
    }

    transition(result, RunState::VALIDATING, run_ctx);
    result.logs.info(kOrchestrator, "Validating CACM instance '" + result.cacm_id + "'");

    orchestrator::ValidationReport report = validator_->validate(document);

    WorkflowInstance instance;
    if (report.is_valid()) {
        try {
            instance = orchestrator::build_workflow_instance(document);
        } catch (const orchestrator::WorkflowConfigError& e) {
            report.add("$", e.what());
        }
    }

    if (!report.is_valid()) {
        result.validation_errors = report.errors;
        result.logs.error(kOrchestrator, "Workflow instance is invalid.");
        for (const auto& issue : report.errors) {
            result.logs.error(kValidator, issue.to_string());
            logger_->log_error(run_ctx, "Validation error: " + issue.to_string());
        }
        transition(result, RunState::INVALID, run_ctx);
        transition(result, RunState::DONE_FAILED, run_ctx);
        result.total_execution_time_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start_time).count();
        return result;
    }

    result.logs.info(kOrchestrator, "CACM instance is valid.");
    transition(result, RunState::VALID, run_ctx);

    if (!context) {
        context = std::make_shared<SharedContext>(instance.cacm_id, "", logger_);
    }
    result.context = context;
    result.session_id = context->get_session_id();
    run_ctx.session_id = result.session_id;
    run_ctx.phase = "execute";

    if (catalog_.has_load_error()) {
        result.logs.warn(kCatalog, "Catalog unavailable, continuing with an empty catalog: " +
                         catalog_.load_error());
    }
    if (config_.check_capabilities) {
        check_capabilities(instance, result.logs);
    }

    transition(result, RunState::EXECUTING, run_ctx);

    BindingResolver resolver(instance.inputs_document);
    std::set<std::string> failed_steps;
    std::string abort_reason;

    for (const auto& step : instance.steps) {
        StepReport step_report(step.step_id, step.capability_ref);
        LogContext step_ctx(result.session_id, step.step_id);
        step_ctx.worker_name = step.capability_ref;

        if (!abort_reason.empty()) {
            transition(step_report, StepState::SKIPPED, step_ctx);
            step_report.message = abort_reason;
            result.logs.warn(kOrchestrator, "Skipping step '" + step.step_id + "': " + abort_reason);
            result.steps.push_back(std::move(step_report));
            continue;
        }

        result.logs.info(kOrchestrator, "--- Executing Step '" + step.step_id + "' (" +
                         step.capability_ref + ") ---");

        bool ok = execute_step(step, instance, resolver, *context, failed_steps, step_report, result.logs);
        result.steps.push_back(std::move(step_report));

        if (!ok) {
            failed_steps.insert(step.step_id);
            if (step.required) {
                abort_reason = "required step '" + step.step_id + "' failed";
            } else if (config_.failure_policy == FailurePolicy::FAIL_FAST) {
                abort_reason = "step '" + step.step_id + "' failed and failure_policy is fail_fast";
            }
        }
    }

    // Timed-out workers may still reference the context
    size_t drained = manager_->drain_abandoned();
    if (drained > 0) {
        result.logs.warn(kOrchestrator, "Waited for " + std::to_string(drained) +
                         " timed-out worker invocation(s) to finish");
    }

    result.outputs = resolver.outputs();
    result.intermediate = resolver.intermediate();

    for (const auto& output : instance.outputs) {
        if (!output.optional && !result.outputs.contains(output.name)) {
            result.missing_outputs.push_back(output.name);
            result.logs.warn(kOrchestrator, "Declared output '" + output.name + "' was not bound");
        }
    }

    size_t failed = result.count(StepState::FAILED);
    size_t skipped = result.count(StepState::SKIPPED);
    result.success = failed == 0 && skipped == 0 && result.missing_outputs.empty();

    if (result.success) {
        result.logs.info(kOrchestrator, "CACM instance '" + instance.cacm_id + "' completed successfully.");
        transition(result, RunState::DONE_SUCCESS, run_ctx);
    } else {
        std::ostringstream summary;
        summary << "CACM instance '" << instance.cacm_id << "' completed with failures: "
                << failed << " failed, " << skipped << " skipped, "
                << result.missing_outputs.size() << " declared output(s) unbound.";
        result.logs.error(kOrchestrator, summary.str());
        transition(result, RunState::DONE_PARTIAL_FAILURE, run_ctx);
    }

    result.total_execution_time_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start_time).count();
    return result;
}

bool Orchestrator::execute_step(
    const WorkflowStep& step,
    const WorkflowInstance& instance,
    BindingResolver& resolver,
    SharedContext& context,
    const std::set<std::string>& failed_steps,
    StepReport& report,
    ExecutionLog& logs
) {
    LogContext ctx(context.get_session_id(), step.step_id);
    ctx.worker_name = step.capability_ref;
    ctx.phase = "resolve";

    transition(report, StepState::RESOLVING_INPUTS, ctx);

    Value inputs = Value::object();
    for (const auto& [name, binding] : step.input_bindings) {
        orchestrator::ResolutionResult resolution = resolver.resolve(binding);
        if (resolution.resolved) {
            inputs[name] = resolution.value;
            continue;
        }

        std::string reference = binding.is_string() ? binding.get<std::string>() : dump_value(binding);
        std::string reason = resolution.error_message;
        if (binding.is_string()) {
            auto producer = instance.producer_of(reference);
            if (producer && failed_steps.count(*producer) > 0) {
                reason += " (producer step '" + *producer + "' failed)";
            }
        }

        logs.warn(kResolver, "Step '" + step.step_id + "': input '" + name + "' <- '" +
                  reference + "' unresolved: " + reason);
        logger_->log_binding_unresolved(ctx, name, reference, reason);

        inputs[name] = orchestrator::make_missing_marker(reference, reason);
        report.unresolved_inputs.push_back(name);
    }

    logger_->log_value(ctx, "step_inputs", inputs);

    if (!report.unresolved_inputs.empty() && !config_.dispatch_on_unresolved_inputs) {
        fail_step(report, ErrorKind::UNRESOLVED_BINDING,
                  "Unresolved input binding(s): " + join(report.unresolved_inputs, ", "), ctx, logs);
        return false;
    }

    ctx.phase = "dispatch";
    transition(report, StepState::DISPATCHED, ctx);
    logger_->log_step_start(ctx, step.capability_ref, inputs.size());

    WorkerResult worker_result = manager_->invoke(step.capability_ref, step.description, inputs, context);
    logger_->log_step_complete(ctx, worker_result);

    report.result_status = worker_result.status;
    report.execution_time_ms = worker_result.execution_time_ms;
    report.warnings = worker_result.warnings;

    if (!worker_result.ok()) {
        ErrorKind kind = worker_result.error_kind == ErrorKind::NONE
            ? ErrorKind::WORKER_EXECUTION : worker_result.error_kind;
        fail_step(report, kind, worker_result.message, ctx, logs);
        return false;
    }

    for (const auto& warning : worker_result.warnings) {
        logs.warn(kWorker, "Step '" + step.step_id + "': " + warning);
    }

    ctx.phase = "capture";
    if (!capture_outputs(step, worker_result, resolver, ctx, report, logs)) {
        return false;
    }

    report.message = worker_result.message;
    transition(report, StepState::CAPTURED, ctx);
    logs.info(kOrchestrator, "Step '" + step.step_id + "' completed (" +
              status_to_string(worker_result.status) + ").");
    return true;
}

bool Orchestrator::capture_outputs(
    const WorkflowStep& step,
    const WorkerResult& worker_result,
    BindingResolver& resolver,
    const LogContext& ctx,
    StepReport& report,
    ExecutionLog& logs
) {
    std::vector<std::string> errors;
    std::vector<std::pair<std::string, std::string>> written;
    bool partial = worker_result.status == ResultStatus::PARTIAL;

    // Writes go to a staged copy and are committed only if every binding succeeds
    BindingResolver staged = resolver;

    for (const auto& [field, target] : step.output_bindings) {
        if (!worker_result.has_field(field)) {
            if (partial) {
                logs.warn(kOrchestrator, "Step '" + step.step_id + "': partial result has no field '" +
                          field + "'; '" + target + "' left unbound");
            } else {
                errors.push_back("result field '" + field + "' missing for target '" + target + "'");
            }
            continue;
        }

        if (staged.contains(target)) {
            std::string policy = orchestrator::to_string(config_.output_conflict_policy);
            logger_->log_output_conflict(ctx, target, policy);

            if (config_.output_conflict_policy == OutputConflictPolicy::FAIL_STEP) {
                errors.push_back("target '" + target + "' is already bound");
                continue;
            }
            if (config_.output_conflict_policy == OutputConflictPolicy::FIRST_WRITE_WINS) {
                logs.warn(kOrchestrator, "Step '" + step.step_id + "': target '" + target +
                          "' already bound, keeping the existing value (" + policy + ")");
                continue;
            }
            logs.warn(kOrchestrator, "Step '" + step.step_id + "': target '" + target +
                      "' already bound, overwriting (" + policy + ")");
        }

        try {
            staged.write(target, worker_result.fields[field]);
        } catch (const orchestrator::BindingParseError& e) {
            errors.push_back(e.what());
            continue;
        } catch (const orchestrator::BindingWriteError& e) {
            errors.push_back(e.what());
            continue;
        }
        written.emplace_back(field, target);
    }

    if (!errors.empty()) {
        fail_step(report, ErrorKind::OUTPUT_BINDING, "Output binding failed: " + join(errors, "; "), ctx, logs);
        return false;
    }

    resolver = std::move(staged);
    for (const auto& [field, target] : written) {
        report.bound_targets.push_back(target);
        logs.info(kOrchestrator, "Step '" + step.step_id + "': bound '" + field + "' -> '" + target + "'");
    }
    return true;
}

void Orchestrator::fail_step(StepReport& report, ErrorKind kind, const std::string& message,
                             const LogContext& ctx, ExecutionLog& logs) {
    report.error_kind = kind;
    report.message = message;
    transition(report, StepState::FAILED, ctx);

    logs.error(kOrchestrator, "Step '" + report.step_id + "' failed (" +
               error_kind_to_string(kind) + "): " + message);
    logger_->log_error(ctx, error_kind_to_string(kind) + ": " + message);
}

void Orchestrator::transition(RunResult& result, RunState next, const LogContext& ctx) {
    logger_->log_state_transition(ctx, "run", run_state_to_string(result.state), run_state_to_string(next));
    result.state = next;
    result.state_history.push_back(next);
}

void Orchestrator::transition(StepReport& report, StepState next, const LogContext& ctx) {
    logger_->log_state_transition(ctx, "step", step_state_to_string(report.state), step_state_to_string(next));
    report.state = next;
}

void Orchestrator::check_capabilities(const WorkflowInstance& instance, ExecutionLog& logs) const {
    for (const auto& step : instance.steps) {
        if (!catalog_.contains(step.capability_ref) && !registry_.is_registered(step.capability_ref)) {
            logs.warn(kOrchestrator, "Step '" + step.step_id + "' references unknown capability '" +
                      step.capability_ref + "'");
        }
    }
}

std::map<std::string, WorkerStats> Orchestrator::get_worker_stats() const {
    return manager_->get_all_stats();
}

} // namespace cacm
