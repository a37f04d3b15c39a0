/**
 * @file worker_registry.cpp
 * @brief Implementation of WorkerRegistry
 */

#include "worker_registry.hpp"
#include "builtin_workers.hpp"

namespace cacm {

std::string WorkerCreationContext::default_skill() const {
    if (descriptor && !descriptor->default_skill.empty()) {
        return descriptor->default_skill;
    }
    if (hints.is_object() && hints.contains("default_skill") && hints["default_skill"].is_string()) {
        return hints["default_skill"].get<std::string>();
    }
    return "";
}

WorkerRegistry::WorkerRegistry(bool register_builtins) {
    if (register_builtins) {
        register_builtin_workers(*this);
    }
}

std::unique_ptr<Worker> WorkerRegistry::create_worker(
    const std::string& worker_type,
    const WorkerCreationContext& context
) const {
    auto it = registry_.find(worker_type);
    if (it == registry_.end()) {
        std::string types;
        for (const auto& pair : registry_) {
            if (!types.empty()) types += ", ";
            types += pair.first;
        }
        throw WorkerConstructionError("Unknown worker type '" + worker_type + "' for '" +
                                      context.name + "'. Available types: " + types);
    }

    std::unique_ptr<Worker> worker;
    try {
        worker = it->second(context);
    } catch (const WorkerConstructionError&) {
        throw;
    } catch (const std::exception& e) {
        throw WorkerConstructionError("Factory for '" + worker_type + "' threw: " + e.what());
    }

    if (!worker) {
        throw WorkerConstructionError("Factory for '" + worker_type + "' returned no worker");
    }
    return worker;
}

void WorkerRegistry::register_worker(const std::string& worker_type, FactoryFunction factory_fn) {
    if (worker_type.empty()) {
        throw ConfigurationError("Worker type cannot be empty");
    }
    if (registry_.find(worker_type) != registry_.end()) {
        throw ConfigurationError("Worker type already registered: " + worker_type);
    }
    registry_[worker_type] = std::move(factory_fn);
}

bool WorkerRegistry::is_registered(const std::string& worker_type) const {
    return registry_.find(worker_type) != registry_.end();
}

std::vector<std::string> WorkerRegistry::list_worker_types() const {
    std::vector<std::string> types;
    types.reserve(registry_.size());
    for (const auto& pair : registry_) {
        types.push_back(pair.first);
    }
    return types;
}

} // namespace cacm
