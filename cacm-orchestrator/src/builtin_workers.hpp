/**
 * @file builtin_workers.hpp
 * @brief Generic plumbing workers registered with every WorkerRegistry
 *
 * - echo: returns its inputs
 * - skill: calls a skill function through the skill service
 * - context_store: reads and writes the run's SharedContext
 * - relay: forwards its task to a peer worker
 */

#ifndef CACM_BUILTIN_WORKERS_HPP
#define CACM_BUILTIN_WORKERS_HPP

#include "worker_interface.hpp"
#include <string>

namespace cacm {

class WorkerRegistry;

/**
 * @brief Returns every input under its own name
 *
 * Also sets `echo` to the input `in` (when given) and `invocation` to the
 * number of times this instance has run.
 */
class EchoWorker : public Worker {
public:
    explicit EchoWorker(const std::string& name);

    WorkerResult run(const std::string& task_description,
                     const Value& step_inputs,
                     SharedContext& context) override;

    size_t invocation_count() const { return invocation_count_; }

private:
    size_t invocation_count_;
};

/**
 * @brief Invokes one skill function and returns it as `result`
 *
 * Inputs:
 *   plugin     skill plugin (defaults to the worker's default skill)
 *   function   skill function name (required)
 *   arguments  argument object; without it every other input is an argument
 */
class SkillWorker : public Worker {
public:
    SkillWorker(const std::string& name, const std::string& default_skill);

    WorkerResult run(const std::string& task_description,
                     const Value& step_inputs,
                     SharedContext& context) override;
};

/**
 * @brief Reads and writes the shared context
 *
 * Operations (input `operation`):
 *   set          data store[key] = value (default)
 *   get          returns `value` and `found`; partial when the key is absent
 *                and no `default` is given
 *   set_global   global parameter key = value
 *   add_document document reference doc_type -> uri
 */
class ContextStoreWorker : public Worker {
public:
    explicit ContextStoreWorker(const std::string& name);

    WorkerResult run(const std::string& task_description,
                     const Value& step_inputs,
                     SharedContext& context) override;
};

/**
 * @brief Delegates its task to a peer and returns the peer's result
 *
 * The peer is input `target`, else the creation hint `target`. The peer
 * receives input `inputs` when it is an object, otherwise every input except
 * `target`.
 */
class RelayWorker : public Worker {
public:
    RelayWorker(const std::string& name, const std::string& default_target);

    WorkerResult run(const std::string& task_description,
                     const Value& step_inputs,
                     SharedContext& context) override;

private:
    std::string default_target_;
};

/**
 * @brief Register echo, skill, context_store and relay
 */
void register_builtin_workers(WorkerRegistry& registry);

} // namespace cacm

#endif // CACM_BUILTIN_WORKERS_HPP
