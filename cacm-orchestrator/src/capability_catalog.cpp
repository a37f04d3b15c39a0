/**
 * @file capability_catalog.cpp
 * @brief Implementation of the capability catalog loader
 */

#include "capability_catalog.hpp"
#include <fstream>
#include <sstream>

namespace cacm {

namespace {

std::string string_field(const Value& entry, const char* key, const char* alias = nullptr) {
    if (entry.contains(key) && entry[key].is_string()) {
        return entry[key].get<std::string>();
    }
    if (alias && entry.contains(alias) && entry[alias].is_string()) {
        return entry[alias].get<std::string>();
    }
    return "";
}

// Accepts {"name": {...}}, ["name", ...] or [{"name": "..."}, ...]
std::vector<std::string> name_list(const Value& entry, const char* key) {
    std::vector<std::string> names;
    if (!entry.contains(key)) {
        return names;
    }

    const Value& node = entry[key];
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            names.push_back(it.key());
        }
    } else if (node.is_array()) {
        for (const auto& item : node) {
            if (item.is_string()) {
                names.push_back(item.get<std::string>());
            } else if (item.is_object() && item.contains("name") && item["name"].is_string()) {
                names.push_back(item["name"].get<std::string>());
            }
        }
    }
    return names;
}

} // anonymous namespace

CapabilityCatalog CapabilityCatalog::load(const std::string& path, Logger* logger) {
    Logger& log = logger ? *logger : Logger::get_instance();

    std::ifstream file(path);
    if (!file.is_open()) {
        CapabilityCatalog catalog;
        catalog.source_path_ = path;
        catalog.load_error_ = "Failed to open catalog file: " + path;
        log.log_catalog_error(path, catalog.load_error_);
        return catalog;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    CapabilityCatalog catalog = load_from_string(buffer.str(), &log);
    catalog.source_path_ = path;
    if (!catalog.has_load_error()) {
        log.log_catalog_loaded(path, catalog.size());
    }
    return catalog;
}

CapabilityCatalog CapabilityCatalog::load_from_string(const std::string& json_string, Logger* logger) {
    Logger& log = logger ? *logger : Logger::get_instance();

    Value document;
    try {
        document = Value::parse(json_string);
    } catch (const nlohmann::json::parse_error& e) {
        CapabilityCatalog catalog;
        catalog.load_error_ = std::string("JSON parse error: ") + e.what();
        log.log_catalog_error("<string>", catalog.load_error_);
        return catalog;
    }

    return from_json(document, &log);
}

CapabilityCatalog CapabilityCatalog::from_json(const Value& document, Logger* logger) {
    Logger& log = logger ? *logger : Logger::get_instance();
    CapabilityCatalog catalog;

    if (!document.is_object() || !document.contains("computeCapabilities")) {
        catalog.load_error_ = "Catalog document missing required field: computeCapabilities";
    } else if (!document["computeCapabilities"].is_array()) {
        catalog.load_error_ = "Catalog field 'computeCapabilities' must be an array";
    }

    if (catalog.has_load_error()) {
        log.log_catalog_error("<document>", catalog.load_error_);
        return catalog;
    }

    catalog.add_entries(document["computeCapabilities"], log);
    return catalog;
}

void CapabilityCatalog::add_entries(const Value& entries, Logger& logger) {
    LogContext ctx;
    ctx.phase = "catalog";

    size_t index = 0;
    for (const auto& entry : entries) {
        std::string position = "computeCapabilities[" + std::to_string(index++) + "]";

        if (!entry.is_object()) {
            logger.log_warning(ctx, "Skipping " + position + ": entry is not an object");
            continue;
        }

        CapabilityDescriptor descriptor;
        descriptor.id = string_field(entry, "id");
        if (descriptor.id.empty()) {
            logger.log_warning(ctx, "Skipping " + position + ": missing 'id'");
            continue;
        }

        if (capabilities_.count(descriptor.id) > 0) {
            logger.log_warning(ctx, "Duplicate capability id '" + descriptor.id +
                               "' at " + position + ", keeping the first entry");
            continue;
        }

        descriptor.name = string_field(entry, "name");
        descriptor.description = string_field(entry, "description");
        descriptor.worker_type = string_field(entry, "agentType", "workerType");
        descriptor.default_skill = string_field(entry, "skillPlugin", "defaultSkill");
        descriptor.inputs = name_list(entry, "inputs");
        descriptor.outputs = name_list(entry, "outputs");

        ordered_ids_.push_back(descriptor.id);
        capabilities_.emplace(descriptor.id, std::move(descriptor));
    }
}

std::optional<CapabilityDescriptor> CapabilityCatalog::lookup(const std::string& id) const {
    auto it = capabilities_.find(id);
    if (it == capabilities_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace cacm
