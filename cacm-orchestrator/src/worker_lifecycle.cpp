/**
 * @file worker_lifecycle.cpp
 * @brief Implementation of WorkerLifecycleManager
 */

#include "worker_lifecycle.hpp"
#include "shared_context.hpp"
#include <algorithm>
#include <chrono>
#include <system_error>

namespace cacm {

namespace {

thread_local std::vector<std::string> t_delegation_chain;

// Installs a delegation chain on the current thread for the scope's lifetime
class ChainScope {
public:
    explicit ChainScope(const std::vector<std::string>& chain)
        : saved_(t_delegation_chain) {
        t_delegation_chain = chain;
    }

    ~ChainScope() {
        t_delegation_chain = std::move(saved_);
    }

    ChainScope(const ChainScope&) = delete;
    ChainScope& operator=(const ChainScope&) = delete;

private:
    std::vector<std::string> saved_;
};

} // anonymous namespace

WorkerLifecycleManager::WorkerLifecycleManager(
    const CapabilityCatalog& catalog,
    const WorkerRegistry& registry,
    ISkillService* skills,
    const LifecycleConfig& config,
    Logger* logger
)
    : catalog_(catalog),
      registry_(registry),
      skills_(skills),
      config_(config),
      logger_(logger) {

    if (!logger_) {
        logger_ = &Logger::get_instance();
    }
    if (config_.max_delegation_depth == 0) {
        throw ConfigurationError("max_delegation_depth must be at least 1");
    }
    if (config_.timeout_ms < 0) {
        throw ConfigurationError("timeout_ms cannot be negative");
    }
}

WorkerLifecycleManager::~WorkerLifecycleManager() {
    drain_abandoned();
}

WorkerHandle WorkerLifecycleManager::get_or_create(const std::string& name, const Value& creation_hints) {
    WorkerHandle handle;
    std::lock_guard<std::mutex> lock(mutex_);

    auto cached = workers_.find(name);
    if (cached != workers_.end()) {
        handle.worker = cached->second.get();
        return handle;
    }

    WorkerCreationContext creation(name);
    creation.descriptor = catalog_.lookup(name);
    if (creation_hints.is_object()) {
        creation.hints = creation_hints;
    }

    std::string worker_type;
    if (creation.descriptor && !creation.descriptor->worker_type.empty()) {
        worker_type = creation.descriptor->worker_type;
    } else if (creation.hints.contains("worker_type") && creation.hints["worker_type"].is_string()) {
        worker_type = creation.hints["worker_type"].get<std::string>();
    } else {
        worker_type = name;
    }

    if (!creation.descriptor && !registry_.is_registered(worker_type)) {
        handle.error_kind = ErrorKind::CAPABILITY_NOT_FOUND;
        handle.error_message = "Capability '" + name + "' not found in catalog and no worker type '" +
                               worker_type + "' is registered";
        logger_->log_worker_construction_failed(name, handle.error_message);
        return handle;
    }

    std::unique_ptr<Worker> worker;
    try {
        worker = registry_.create_worker(worker_type, creation);
    } catch (const WorkerConstructionError& e) {
        handle.error_kind = ErrorKind::WORKER_CONSTRUCTION;
        handle.error_message = e.what();
        logger_->log_worker_construction_failed(name, handle.error_message);
        return handle;
    }

    worker->attach(this, skills_);
    logger_->log_worker_created(worker->get_info(), creation.descriptor.has_value());

    handle.worker = worker.get();
    handle.created = true;
    workers_[name] = std::move(worker);
    return handle;
}

WorkerResult WorkerLifecycleManager::invoke(
    const std::string& name,
    const std::string& task_description,
    const Value& inputs,
    SharedContext& context,
    const Value& creation_hints
) {
    const std::vector<std::string> chain = t_delegation_chain;

    if (std::find(chain.begin(), chain.end(), name) != chain.end()) {
        WorkerResult result = WorkerResult::error(
            "Delegation cycle detected: " + format_chain(chain, name), ErrorKind::DELEGATION);
        record_result(name, result);
        return result;
    }

    if (chain.size() >= config_.max_delegation_depth) {
        WorkerResult result = WorkerResult::error(
            "Delegation depth limit (" + std::to_string(config_.max_delegation_depth) +
            ") exceeded: " + format_chain(chain, name), ErrorKind::DELEGATION);
        record_result(name, result);
        return result;
    }

    if (!chain.empty()) {
        logger_->log_delegation(chain.back(), name, chain.size());
    }

    WorkerHandle handle = get_or_create(name, creation_hints);
    if (!handle.ok()) {
        return WorkerResult::error(handle.error_message, handle.error_kind);
    }

    if (!acquire(name)) {
        WorkerResult result = WorkerResult::error(
            "Worker '" + name + "' is still running a timed-out invocation", ErrorKind::TIMEOUT);
        record_result(name, result);
        return result;
    }

    std::vector<std::string> next_chain = chain;
    next_chain.push_back(name);

    auto start_time = std::chrono::steady_clock::now();
    WorkerResult result;

    if (chain.empty() && config_.timeout_ms > 0) {
        Worker* worker = handle.worker;
        std::future<WorkerResult> future;
        try {
            future = std::async(std::launch::async,
                [this, worker, name, next_chain, task_description, inputs, &context]() {
                    return run_guarded(*worker, name, next_chain, task_description, inputs, context);
                });
        } catch (const std::system_error& e) {
            release(name);
            result = WorkerResult::error(std::string("Could not start worker thread: ") + e.what(),
                                         ErrorKind::WORKER_EXECUTION);
            record_result(name, result);
            return result;
        }

        if (future.wait_for(std::chrono::milliseconds(config_.timeout_ms)) == std::future_status::timeout) {
            result = WorkerResult::error(
                "Execution timeout after " + std::to_string(config_.timeout_ms) + " ms",
                ErrorKind::TIMEOUT);
            std::lock_guard<std::mutex> lock(mutex_);
            abandoned_.push_back(std::move(future));
        } else {
            result = future.get();
        }
    } else {
        result = run_guarded(*handle.worker, name, next_chain, task_description, inputs, context);
    }

    auto end_time = std::chrono::steady_clock::now();
    double actual_time_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    // If the worker didn't report time, use actual measurement
    if (result.execution_time_ms == 0.0) {
        result.execution_time_ms = actual_time_ms;
    }

    record_result(name, result);
    return result;
}

WorkerResult WorkerLifecycleManager::run_guarded(
    Worker& worker,
    const std::string& name,
    const std::vector<std::string>& chain,
    const std::string& task_description,
    const Value& inputs,
    SharedContext& context
) {
    // Hands the worker back once this run ends, on whichever thread ran it
    struct BusyRelease {
        WorkerLifecycleManager& manager;
        const std::string& name;
        ~BusyRelease() { manager.release(name); }
    } busy_release{*this, name};

    ChainScope scope(chain);

    try {
        WorkerResult result = worker.run(task_description, inputs, context);
        if (!result.fields.is_object()) {
            result.fields = Value::object();
        }
        return result;
    } catch (const WorkerExecutionError& e) {
        return WorkerResult::error(e.what(), ErrorKind::WORKER_EXECUTION);
    } catch (const std::exception& e) {
        return WorkerResult::error(
            std::string("Unexpected error during execution: ") + e.what(),
            ErrorKind::WORKER_EXECUTION);
    }
}

bool WorkerLifecycleManager::acquire(const std::string& name) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto idle = [this, &name]() { return busy_.count(name) == 0; };

    if (config_.timeout_ms > 0) {
        if (!idle_cv_.wait_for(lock, std::chrono::milliseconds(config_.timeout_ms), idle)) {
            return false;
        }
    } else {
        idle_cv_.wait(lock, idle);
    }
    busy_.insert(name);
    return true;
}

void WorkerLifecycleManager::release(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        busy_.erase(name);
    }
    idle_cv_.notify_all();
}

void WorkerLifecycleManager::record_result(const std::string& name, const WorkerResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    WorkerStats& stats = stats_[name];

    switch (result.status) {
        case ResultStatus::SUCCESS: stats.successful_runs++; break;
        case ResultStatus::PARTIAL: stats.partial_runs++; break;
        case ResultStatus::ERROR: stats.failed_runs++; break;
    }
    if (result.error_kind == ErrorKind::TIMEOUT) {
        stats.timeout_count++;
    }

    stats.total_execution_time_ms += result.execution_time_ms;
    size_t runs = stats.total_runs();
    stats.average_execution_time_ms = runs > 0 ? stats.total_execution_time_ms / runs : 0.0;
}

bool WorkerLifecycleManager::has_worker(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.find(name) != workers_.end();
}

size_t WorkerLifecycleManager::worker_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

std::vector<std::string> WorkerLifecycleManager::list_workers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(workers_.size());
    for (const auto& pair : workers_) {
        names.push_back(pair.first);
    }
    return names;
}

WorkerStats WorkerLifecycleManager::get_stats(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stats_.find(name);
    return it != stats_.end() ? it->second : WorkerStats();
}

std::map<std::string, WorkerStats> WorkerLifecycleManager::get_all_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

size_t WorkerLifecycleManager::drain_abandoned() {
    std::vector<std::future<WorkerResult>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(abandoned_);
    }

    for (auto& future : pending) {
        if (future.valid()) {
            future.wait();
        }
    }
    return pending.size();
}

std::vector<std::string> WorkerLifecycleManager::active_chain() {
    return t_delegation_chain;
}

std::string WorkerLifecycleManager::format_chain(const std::vector<std::string>& chain, const std::string& next) {
    std::string text;
    for (const auto& name : chain) {
        text += name + " -> ";
    }
    return text + next;
}

} // namespace cacm
