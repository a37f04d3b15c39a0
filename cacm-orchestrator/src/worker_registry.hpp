/**
 * @file worker_registry.hpp
 * @brief Registry of worker factories keyed by worker type
 *
 * The WorkerRegistry maps a worker type (the catalog's "agentType") to a
 * factory function that builds a polymorphic Worker.
 *
 * Design Pattern: Factory Method with Registry
 * - Each worker type registers a factory function at startup
 * - The lifecycle manager requests workers by type identifier
 * - Factories receive the requested name, the catalog descriptor and any
 *   creation hints
 */

#ifndef CACM_WORKER_REGISTRY_HPP
#define CACM_WORKER_REGISTRY_HPP

#include "worker_interface.hpp"
#include "capability_catalog.hpp"
#include <map>
#include <string>
#include <memory>
#include <optional>
#include <functional>

namespace cacm {

/**
 * @brief Built-in worker type identifiers
 */
namespace WorkerType {
    constexpr const char* ECHO = "echo";
    constexpr const char* SKILL = "skill";
    constexpr const char* CONTEXT_STORE = "context_store";
    constexpr const char* RELAY = "relay";
}

/**
 * @brief Everything a factory may use to build a worker
 */
struct WorkerCreationContext {
    std::string name;                                   ///< Name the worker will be cached under
    std::optional<CapabilityDescriptor> descriptor;     ///< Catalog entry when name is a capability id
    Value hints;                                        ///< Caller-supplied creation hints (object)

    WorkerCreationContext() : hints(Value::object()) {}

    explicit WorkerCreationContext(const std::string& name_)
        : name(name_), hints(Value::object()) {}

    /**
     * @brief Default skill from the descriptor, else hints["default_skill"]
     */
    std::string default_skill() const;
};

/**
 * @brief Factory for creating worker instances
 *
 * Usage Example:
 *   @code
 *   WorkerRegistry registry;
 *   registry.register_worker("scoring", [](const WorkerCreationContext& ctx) {
 *       return std::make_unique<ScoringWorker>(ctx.name);
 *   });
 *   auto worker = registry.create_worker("scoring", WorkerCreationContext("ScoringAgent"));
 *   @endcode
 */
class WorkerRegistry {
public:
    using FactoryFunction = std::function<std::unique_ptr<Worker>(const WorkerCreationContext&)>;

    /**
     * @param register_builtins Register echo, skill, context_store and relay
     */
    explicit WorkerRegistry(bool register_builtins = true);

    /**
     * @brief Create a worker instance by type
     *
     * @throws WorkerConstructionError If the type is unknown, the factory
     *         throws, or the factory returns null
     */
    std::unique_ptr<Worker> create_worker(const std::string& worker_type,
                                          const WorkerCreationContext& context) const;

    /**
     * @brief Register a worker type
     *
     * @throws ConfigurationError If worker_type is empty or already registered
     */
    void register_worker(const std::string& worker_type, FactoryFunction factory_fn);

    bool is_registered(const std::string& worker_type) const;

    std::vector<std::string> list_worker_types() const;

private:
    std::map<std::string, FactoryFunction> registry_;
};

} // namespace cacm

#endif // CACM_WORKER_REGISTRY_HPP
