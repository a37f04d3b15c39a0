/**
 * @file binding_resolver.hpp
 * @brief Resolution of step bindings against the namespaces of a run
 *
 * A binding value is either a reference into one of three namespaces or a
 * literal constant:
 *
 *   cacm.inputs.<name>[.<path>]     declared workflow inputs (read-only)
 *   cacm.outputs.<name>[.<path>]    workflow outputs bound by earlier steps
 *   intermediate.<name>[.<path>]    scratch values bound by earlier steps
 *
 * Anything else (non-string values, strings without a recognized prefix) is a
 * literal and binds as written. Paths walk objects by key and arrays by
 * decimal index.
 */

#ifndef CACM_ORCHESTRATOR_BINDING_RESOLVER_HPP
#define CACM_ORCHESTRATOR_BINDING_RESOLVER_HPP

#include "value.hpp"
#include <string>
#include <vector>
#include <variant>
#include <stdexcept>

namespace cacm {
namespace orchestrator {

enum class BindingNamespace {
    INPUTS,
    OUTPUTS,
    INTERMEDIATE
};

/**
 * @brief Reference prefix of a namespace, including the trailing dot
 */
std::string namespace_prefix(BindingNamespace ns);

/**
 * @brief Parsed reference, e.g. cacm.outputs.report.summary -> {OUTPUTS, [report, summary]}
 */
struct Reference {
    BindingNamespace ns;
    std::vector<std::string> segments;

    Reference() : ns(BindingNamespace::INPUTS) {}
    Reference(BindingNamespace ns_, std::vector<std::string> segments_)
        : ns(ns_), segments(std::move(segments_)) {}

    std::string to_string() const;
};

/**
 * @brief Constant bound as written
 */
struct Literal {
    Value value;

    Literal() = default;
    explicit Literal(Value value_) : value(std::move(value_)) {}
};

using BindingExpression = std::variant<Reference, Literal>;

/**
 * @brief Exception thrown for malformed references ("cacm.outputs.", "intermediate.a..b")
 */
class BindingParseError : public std::runtime_error {
public:
    explicit BindingParseError(const std::string& message)
        : std::runtime_error("Malformed binding: " + message) {}
};

/**
 * @brief Exception thrown when an output binding target cannot be written
 */
class BindingWriteError : public std::runtime_error {
public:
    explicit BindingWriteError(const std::string& message)
        : std::runtime_error("Cannot write binding target: " + message) {}
};

/**
 * @brief Classify a binding value
 *
 * @throws BindingParseError if a recognized prefix is followed by an empty
 *         path or an empty segment
 */
BindingExpression parse_binding(const Value& binding);

/**
 * @brief Parse a value that must be a reference (output binding targets)
 *
 * @throws BindingParseError if the value is not a well-formed reference
 */
Reference parse_reference(const std::string& text);

/**
 * @brief Outcome of resolving one binding
 */
struct ResolutionResult {
    bool resolved;
    bool is_literal;
    Value value;                  ///< Resolved value, null when unresolved
    std::string error_message;    ///< Why resolution failed

    ResolutionResult() : resolved(false), is_literal(false) {}

    static ResolutionResult found(Value value, bool literal = false) {
        ResolutionResult result;
        result.resolved = true;
        result.is_literal = literal;
        result.value = std::move(value);
        return result;
    }

    static ResolutionResult unresolved(const std::string& message) {
        ResolutionResult result;
        result.error_message = message;
        return result;
    }
};

/**
 * @brief Sentinel bound in place of an unresolved input:
 *        {"$missing": "<reference>", "reason": "<why>"}
 */
Value make_missing_marker(const std::string& reference, const std::string& reason);

bool is_missing_marker(const Value& value);

/**
 * @brief Scope of a single run: declared inputs plus everything bound so far
 *
 * `cacm.inputs.<name>` resolves to the declaration's "value" member when the
 * declaration is an object with one, and to the declaration itself when it is
 * not an object. Deeper paths walk from the declaration object and fall back
 * to its "value" member, so both `cacm.inputs.p.value.id` and
 * `cacm.inputs.p.id` reach {"p": {"value": {"id": ...}}}.
 *
 * Resolution does not mutate the scope: resolving the same binding twice
 * without an intervening write() yields the same result.
 */
class BindingResolver {
public:
    explicit BindingResolver(const Value& inputs_document = Value::object());

    ResolutionResult resolve(const Value& binding) const;

    ResolutionResult resolve_reference(const Reference& reference) const;

    /**
     * @brief Write a value to an output or intermediate target
     *
     * Missing intermediate objects are created. Existing array elements may be
     * replaced by index.
     *
     * @throws BindingParseError if the target is malformed
     * @throws BindingWriteError if the target is read-only or a path node is
     *         neither an object nor an array
     */
    void write(const std::string& target, const Value& value);

    /**
     * @brief Whether a reference currently resolves to a value
     */
    bool contains(const std::string& reference) const;

    const Value& inputs() const { return inputs_; }
    const Value& outputs() const { return outputs_; }
    const Value& intermediate() const { return intermediate_; }

private:
    Value inputs_;
    Value outputs_;
    Value intermediate_;
};

} // namespace orchestrator
} // namespace cacm

#endif // CACM_ORCHESTRATOR_BINDING_RESOLVER_HPP
