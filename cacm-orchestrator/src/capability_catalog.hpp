/**
 * @file capability_catalog.hpp
 * @brief Static table of compute capabilities available to workflow steps
 *
 * A workflow step names a capability through `computeCapabilityRef`; the
 * catalog maps that identifier to the worker type that implements it and the
 * skill plugin the worker uses by default.
 *
 * Catalog document format:
 *   {
 *     "computeCapabilities": [
 *       {"id": "ratio_calc", "name": "...", "description": "...",
 *        "agentType": "skill", "skillPlugin": "BasicCalculations",
 *        "inputs": [...], "outputs": [...]}
 *     ]
 *   }
 *
 * Loading never throws: a missing or malformed document yields an empty
 * catalog whose load_error() carries the reason.
 */

#ifndef CACM_CAPABILITY_CATALOG_HPP
#define CACM_CAPABILITY_CATALOG_HPP

#include "value.hpp"
#include "logger.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>

namespace cacm {

/**
 * @brief One catalog entry
 *
 * Declared inputs/outputs are documentation only and not enforced at runtime.
 */
struct CapabilityDescriptor {
    std::string id;
    std::string name;
    std::string description;
    std::string worker_type;               ///< Registry key ("agentType"/"workerType")
    std::string default_skill;             ///< Skill plugin ("skillPlugin"/"defaultSkill"), may be empty
    std::vector<std::string> inputs;
    std::vector<std::string> outputs;
};

class CapabilityCatalog {
public:
    CapabilityCatalog() = default;

    /**
     * @brief Load a catalog document from disk
     *
     * Errors are logged through the logger and recorded in load_error().
     */
    static CapabilityCatalog load(const std::string& path, Logger* logger = nullptr);

    static CapabilityCatalog load_from_string(const std::string& json_string, Logger* logger = nullptr);

    static CapabilityCatalog from_json(const Value& document, Logger* logger = nullptr);

    std::optional<CapabilityDescriptor> lookup(const std::string& id) const;

    bool contains(const std::string& id) const { return capabilities_.count(id) > 0; }
    size_t size() const { return capabilities_.size(); }
    bool empty() const { return capabilities_.empty(); }

    /**
     * @brief Capability IDs in document order
     */
    const std::vector<std::string>& list_ids() const { return ordered_ids_; }

    const std::string& load_error() const { return load_error_; }
    bool has_load_error() const { return !load_error_.empty(); }

    const std::string& source_path() const { return source_path_; }

private:
    void add_entries(const Value& document, Logger& logger);

    std::map<std::string, CapabilityDescriptor> capabilities_;
    std::vector<std::string> ordered_ids_;
    std::string load_error_;
    std::string source_path_;
};

} // namespace cacm

#endif // CACM_CAPABILITY_CATALOG_HPP
