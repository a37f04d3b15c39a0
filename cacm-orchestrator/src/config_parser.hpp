#ifndef CACM_ORCHESTRATOR_CONFIG_PARSER_HPP
#define CACM_ORCHESTRATOR_CONFIG_PARSER_HPP

#include "orchestrator_config.hpp"
#include "value.hpp"
#include <string>
#include <stdexcept>

namespace cacm {
namespace orchestrator {

/**
 * @brief Exception thrown when a config or workflow file cannot be parsed
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Reads and parses a JSON document from disk
 *
 * @param file_path Path to the JSON file
 * @return Parsed document
 * @throws ConfigParseError if the file cannot be read or the JSON is invalid
 */
Value load_json_document(const std::string& file_path);

/**
 * @brief Parses a JSON document from a string
 *
 * @throws ConfigParseError if the JSON is invalid
 */
Value parse_json_document(const std::string& json_string);

/**
 * @brief Parses orchestrator settings from a JSON file
 *
 * Relative paths (catalog_path, logging.file) are resolved against the
 * directory containing the config file.
 *
 * @throws ConfigParseError if the file cannot be read or JSON is invalid
 * @throws ConfigurationError if a setting has an invalid value
 */
OrchestratorConfig parse_orchestrator_config_from_file(const std::string& file_path);

/**
 * @brief Parses orchestrator settings from a JSON string
 *
 * @param json_string JSON configuration as string
 * @param config_file_path Path used to resolve relative paths (empty: leave as is)
 * @throws ConfigParseError if JSON is invalid
 * @throws ConfigurationError if a setting has an invalid value
 */
OrchestratorConfig parse_orchestrator_config_from_string(
    const std::string& json_string,
    const std::string& config_file_path = ""
);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to
 * the empty string; a '$' not followed by a name is kept.
 *
 * @param value String potentially containing variable references
 * @return String with variables expanded
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * Absolute paths are returned unchanged.
 *
 * @param path File path to resolve
 * @param config_file_path Path to the configuration file
 * @return Resolved path
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace orchestrator
} // namespace cacm

#endif // CACM_ORCHESTRATOR_CONFIG_PARSER_HPP
