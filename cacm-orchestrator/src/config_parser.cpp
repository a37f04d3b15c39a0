#include "config_parser.hpp"
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cctype>
#include <cstdint>
#include <limits>
#include <filesystem>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace cacm {
namespace orchestrator {

namespace {

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string read_string(const json& node, const char* key) {
    if (!node[key].is_string()) {
        throw ConfigurationError(std::string("'") + key + "' must be a string");
    }
    return expand_environment_variables(node[key].get<std::string>());
}

// Integer in [min_value, max_value]; fractions and out-of-range values are rejected
int read_bounded_int(const json& node, const char* key, int min_value, int max_value) {
    const json& value = node[key];
    if (!value.is_number_integer()) {
        throw ConfigurationError(std::string("'") + key + "' must be an integer");
    }

    bool in_range;
    if (value.is_number_unsigned()) {
        std::uint64_t number = value.get<std::uint64_t>();
        in_range = number <= static_cast<std::uint64_t>(max_value) &&
                   (min_value <= 0 || number >= static_cast<std::uint64_t>(min_value));
    } else {
        std::int64_t number = value.get<std::int64_t>();
        in_range = number >= min_value && number <= max_value;
    }
    if (!in_range) {
        throw ConfigurationError(std::string("'") + key + "' must be between " +
                                 std::to_string(min_value) + " and " + std::to_string(max_value));
    }
    return static_cast<int>(value.get<std::int64_t>());
}

} // anonymous namespace

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        size_t name_start = pos;
        while (pos < result.size() && is_name_char(result[pos])) {
            pos++;
        }
        size_t name_end = pos;

        if (name_end == name_start) {
            // Lone '$' or "${" without a name
            pos = start + 1;
            continue;
        }

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                pos = start + 1;
                continue;
            }
            pos++; // Skip '}'
        }

        std::string var_name = result.substr(name_start, name_end - name_start);
        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (path.empty() || p.is_absolute() || config_file_path.empty()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

Value parse_json_document(const std::string& json_string) {
    try {
        return json::parse(json_string);
    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    }
}

Value load_json_document(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse_json_document(buffer.str());
}

OrchestratorConfig parse_orchestrator_config_from_string(
    const std::string& json_string,
    const std::string& config_file_path
) {
    OrchestratorConfig config;
    json j = parse_json_document(json_string);

    if (!j.is_object()) {
        throw ConfigParseError("Configuration document must be a JSON object");
    }

    try {
        if (j.contains("catalog_path")) {
            config.catalog_path = resolve_relative_path(read_string(j, "catalog_path"), config_file_path);
        }
        if (j.contains("failure_policy")) {
            config.failure_policy = parse_failure_policy(read_string(j, "failure_policy"));
        }
        if (j.contains("output_conflict_policy")) {
            config.output_conflict_policy =
                parse_output_conflict_policy(read_string(j, "output_conflict_policy"));
        }
        if (j.contains("dispatch_on_unresolved_inputs")) {
            config.dispatch_on_unresolved_inputs = j["dispatch_on_unresolved_inputs"].get<bool>();
        }
        if (j.contains("step_timeout_ms")) {
            config.step_timeout_ms = read_bounded_int(j, "step_timeout_ms", 0, std::numeric_limits<int>::max());
        }
        if (j.contains("max_delegation_depth")) {
            config.max_delegation_depth = static_cast<size_t>(
                read_bounded_int(j, "max_delegation_depth", 1, std::numeric_limits<int>::max()));
        }
        if (j.contains("check_capabilities")) {
            config.check_capabilities = j["check_capabilities"].get<bool>();
        }

        if (j.contains("logging")) {
            const json& logging = j["logging"];
            if (!logging.is_object()) {
                throw ConfigurationError("'logging' must be an object");
            }
            if (logging.contains("level")) {
                config.logging.min_level = string_to_level(read_string(logging, "level"));
            }
            if (logging.contains("json")) {
                config.logging.enable_json = logging["json"].get<bool>();
            }
            if (logging.contains("console")) {
                config.logging.enable_console = logging["console"].get<bool>();
            }
            if (logging.contains("file")) {
                std::string file = read_string(logging, "file");
                if (!file.empty()) {
                    config.logging.enable_file = true;
                    config.logging.log_file_path = resolve_relative_path(file, config_file_path);
                }
            }
            if (logging.contains("value_dump")) {
                config.logging.enable_value_dump = logging["value_dump"].get<bool>();
            }
        }
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    return config;
}

OrchestratorConfig parse_orchestrator_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    return parse_orchestrator_config_from_string(buffer.str(), file_path);
}

} // namespace orchestrator
} // namespace cacm
