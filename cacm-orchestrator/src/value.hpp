#ifndef CACM_VALUE_HPP
#define CACM_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace cacm {

/**
 * @brief Dynamic value exchanged between bindings, workers and the shared context
 */
using Value = nlohmann::json;

/**
 * @brief Type name of a value for log lines ("string", "object", ...)
 */
inline std::string value_type_name(const Value& value) {
    return value.type_name();
}

/**
 * @brief Serialize a value, substituting U+FFFD for invalid UTF-8 in strings
 */
inline std::string dump_value(const Value& value, int indent = -1) {
    return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace cacm

#endif // CACM_VALUE_HPP
