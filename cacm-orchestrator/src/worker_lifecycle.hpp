/**
 * @file worker_lifecycle.hpp
 * @brief Worker lifecycle management: lazy creation, caching, guarded invocation
 *
 * The WorkerLifecycleManager handles:
 * - Resolving a name (capability id or worker type) to a live worker
 * - Creating workers on first use and caching them for the manager's lifetime
 * - Wiring each worker to the manager (for delegation) and the skill service
 * - Invoking workers with delegation depth/cycle guards and an optional timeout
 * - Per-worker execution statistics
 *
 * Design Pattern: Resource Manager; the manager exclusively owns every worker
 * it creates, workers only hold a non-owning back-reference.
 */

#ifndef CACM_WORKER_LIFECYCLE_HPP
#define CACM_WORKER_LIFECYCLE_HPP

#include "worker_interface.hpp"
#include "worker_registry.hpp"
#include "capability_catalog.hpp"
#include "skill_service.hpp"
#include "logger.hpp"
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <map>
#include <set>

namespace cacm {

/**
 * @brief Lifecycle configuration
 */
struct LifecycleConfig {
    size_t max_delegation_depth;     ///< Maximum workers on one delegation chain (default: 8)
    int timeout_ms;                  ///< Timeout for top-level invocations, 0 disables

    LifecycleConfig()
        : max_delegation_depth(8),
          timeout_ms(0) {}
};

/**
 * @brief Outcome of get_or_create
 */
struct WorkerHandle {
    Worker* worker;                  ///< Cached worker, nullptr on failure
    ErrorKind error_kind;            ///< CAPABILITY_NOT_FOUND or WORKER_CONSTRUCTION on failure
    std::string error_message;
    bool created;                    ///< true if this call constructed the worker

    WorkerHandle()
        : worker(nullptr), error_kind(ErrorKind::NONE), created(false) {}

    bool ok() const { return worker != nullptr; }
};

/**
 * @brief Per-worker execution statistics
 */
struct WorkerStats {
    size_t successful_runs;
    size_t failed_runs;
    size_t partial_runs;
    size_t timeout_count;
    double total_execution_time_ms;
    double average_execution_time_ms;

    WorkerStats()
        : successful_runs(0), failed_runs(0), partial_runs(0), timeout_count(0),
          total_execution_time_ms(0.0), average_execution_time_ms(0.0) {}

    size_t total_runs() const { return successful_runs + failed_runs + partial_runs; }
};

/**
 * @brief Resolves names to live workers and runs them
 *
 * Usage Example:
 *   @code
 *   CapabilityCatalog catalog = CapabilityCatalog::load("catalog.json");
 *   WorkerRegistry registry;
 *   SkillRegistry skills;
 *
 *   WorkerLifecycleManager manager(catalog, registry, &skills);
 *   SharedContext context("cacm-1");
 *
 *   WorkerResult result = manager.invoke("echo", "Echo inputs", {{"in", "hi"}}, context);
 *   if (!result.ok()) {
 *       std::cerr << "Error: " << result.message << std::endl;
 *   }
 *   @endcode
 */
class WorkerLifecycleManager {
public:
    /**
     * @param catalog Capability catalog (must outlive the manager)
     * @param registry Worker factories (must outlive the manager)
     * @param skills Skill service handed to every worker (may be nullptr)
     * @param config Lifecycle configuration
     * @param logger Logger instance (optional, uses default if nullptr)
     */
    WorkerLifecycleManager(
        const CapabilityCatalog& catalog,
        const WorkerRegistry& registry,
        ISkillService* skills,
        const LifecycleConfig& config = LifecycleConfig(),
        Logger* logger = nullptr
    );

    /**
     * @brief Destructor - waits for abandoned (timed-out) invocations
     */
    ~WorkerLifecycleManager();

    WorkerLifecycleManager(const WorkerLifecycleManager&) = delete;
    WorkerLifecycleManager& operator=(const WorkerLifecycleManager&) = delete;

    /**
     * @brief Return the cached worker for a name, creating it on first use
     *
     * The worker type comes from the catalog descriptor when the name is a
     * capability id, otherwise from creation_hints["worker_type"], otherwise
     * the name itself is used as the worker type.
     *
     * Never throws for unknown names or failing factories; the handle
     * carries the error instead.
     */
    WorkerHandle get_or_create(const std::string& name,
                               const Value& creation_hints = Value::object());

    /**
     * @brief Obtain a worker and run it
     *
     * Guards, checked before the worker is obtained:
     * - a name already on the active delegation chain is a cycle
     * - a chain already holding max_delegation_depth workers is too deep
     * Both return an ERROR result with ErrorKind::DELEGATION.
     *
     * Top-level invocations (empty chain) run under timeout_ms when set; a
     * timed-out worker is abandoned, not cancelled, and keeps running until
     * drain_abandoned() collects it. While it runs, a later invocation of
     * the same worker waits up to timeout_ms for it and then returns an ERROR
     * result with ErrorKind::TIMEOUT; a worker never runs twice at once.
     *
     * Exceptions thrown by the worker are converted to ERROR results.
     */
    WorkerResult invoke(
        const std::string& name,
        const std::string& task_description,
        const Value& inputs,
        SharedContext& context,
        const Value& creation_hints = Value::object()
    );

    bool has_worker(const std::string& name) const;

    size_t worker_count() const;

    std::vector<std::string> list_workers() const;

    /**
     * @brief Statistics for one worker (zeroed if it never ran)
     */
    WorkerStats get_stats(const std::string& name) const;

    std::map<std::string, WorkerStats> get_all_stats() const;

    /**
     * @brief Wait for every abandoned invocation to finish
     *
     * @return Number of invocations waited for
     */
    size_t drain_abandoned();

    const LifecycleConfig& get_config() const { return config_; }

    /**
     * @brief Delegation chain of the calling thread (outermost first)
     */
    static std::vector<std::string> active_chain();

private:
    WorkerResult run_guarded(
        Worker& worker,
        const std::string& name,
        const std::vector<std::string>& chain,
        const std::string& task_description,
        const Value& inputs,
        SharedContext& context
    );

    // Claims the worker for one run, waiting out a timed-out invocation still holding it
    bool acquire(const std::string& name);
    void release(const std::string& name);

    void record_result(const std::string& name, const WorkerResult& result);

    static std::string format_chain(const std::vector<std::string>& chain, const std::string& next);

    const CapabilityCatalog& catalog_;
    const WorkerRegistry& registry_;
    ISkillService* skills_;
    LifecycleConfig config_;
    Logger* logger_;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Worker>> workers_;
    std::map<std::string, WorkerStats> stats_;
    std::vector<std::future<WorkerResult>> abandoned_;
    std::set<std::string> busy_;                 ///< Workers with a run in progress
    std::condition_variable idle_cv_;
};

} // namespace cacm

#endif // CACM_WORKER_LIFECYCLE_HPP
