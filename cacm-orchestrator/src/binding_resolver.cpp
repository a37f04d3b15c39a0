#include "binding_resolver.hpp"
#include <cctype>

namespace cacm {
namespace orchestrator {

namespace {

const char* const kMissingKey = "$missing";

const std::pair<const char*, BindingNamespace> kPrefixes[] = {
    {"cacm.inputs.", BindingNamespace::INPUTS},
    {"cacm.outputs.", BindingNamespace::OUTPUTS},
    {"intermediate.", BindingNamespace::INTERMEDIATE},
};

bool is_index(const std::string& segment) {
    if (segment.empty() || segment.size() > 9) {
        return false;
    }
    for (char c : segment) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

// Walks `segments[first..]` from `node`; on failure sets `failed_at`
const Value* walk(const Value& node, const std::vector<std::string>& segments,
                  size_t first, size_t& failed_at) {
    const Value* current = &node;
    for (size_t i = first; i < segments.size(); ++i) {
        const std::string& segment = segments[i];
        if (current->is_object()) {
            auto it = current->find(segment);
            if (it == current->end()) {
                failed_at = i;
                return nullptr;
            }
            current = &(*it);
        } else if (current->is_array() && is_index(segment)) {
            size_t index = static_cast<size_t>(std::stoul(segment));
            if (index >= current->size()) {
                failed_at = i;
                return nullptr;
            }
            current = &(*current)[index];
        } else {
            failed_at = i;
            return nullptr;
        }
    }
    return current;
}

std::string path_prefix(const Reference& reference, size_t count) {
    std::string result = namespace_prefix(reference.ns);
    for (size_t i = 0; i < count && i < reference.segments.size(); ++i) {
        if (i > 0) result += ".";
        result += reference.segments[i];
    }
    return result;
}

} // anonymous namespace

std::string namespace_prefix(BindingNamespace ns) {
    for (const auto& [prefix, value] : kPrefixes) {
        if (value == ns) {
            return prefix;
        }
    }
    return "";
}

std::string Reference::to_string() const {
    return path_prefix(*this, segments.size());
}

Reference parse_reference(const std::string& text) {
    for (const auto& [prefix, ns] : kPrefixes) {
        if (!starts_with(text, prefix)) {
            continue;
        }

        std::string path = text.substr(std::string(prefix).size());
        if (path.empty()) {
            throw BindingParseError("'" + text + "' has no path after the namespace");
        }

        std::vector<std::string> segments;
        size_t start = 0;
        while (true) {
            size_t dot = path.find('.', start);
            std::string segment = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
            if (segment.empty()) {
                throw BindingParseError("'" + text + "' contains an empty path segment");
            }
            segments.push_back(segment);
            if (dot == std::string::npos) {
                break;
            }
            start = dot + 1;
        }
        return Reference(ns, std::move(segments));
    }

    throw BindingParseError("'" + text + "' is not a cacm.inputs, cacm.outputs or intermediate reference");
}

BindingExpression parse_binding(const Value& binding) {
    if (!binding.is_string()) {
        return Literal(binding);
    }

    const std::string& text = binding.get_ref<const std::string&>();
    for (const auto& entry : kPrefixes) {
        if (starts_with(text, entry.first)) {
            return parse_reference(text);
        }
    }
    return Literal(binding);
}

Value make_missing_marker(const std::string& reference, const std::string& reason) {
    Value marker = Value::object();
    marker[kMissingKey] = reference;
    marker["reason"] = reason;
    return marker;
}

bool is_missing_marker(const Value& value) {
    return value.is_object() && value.contains(kMissingKey);
}

BindingResolver::BindingResolver(const Value& inputs_document)
    : inputs_(inputs_document.is_object() ? inputs_document : Value::object()),
      outputs_(Value::object()),
      intermediate_(Value::object()) {}

ResolutionResult BindingResolver::resolve(const Value& binding) const {
    BindingExpression expression;
    try {
        expression = parse_binding(binding);
    } catch (const BindingParseError& e) {
        return ResolutionResult::unresolved(e.what());
    }

    if (const auto* literal = std::get_if<Literal>(&expression)) {
        return ResolutionResult::found(literal->value, true);
    }
    return resolve_reference(std::get<Reference>(expression));
}

ResolutionResult BindingResolver::resolve_reference(const Reference& reference) const {
    const Value* root = nullptr;
    switch (reference.ns) {
        case BindingNamespace::INPUTS: root = &inputs_; break;
        case BindingNamespace::OUTPUTS: root = &outputs_; break;
        case BindingNamespace::INTERMEDIATE: root = &intermediate_; break;
    }

    if (reference.segments.empty()) {
        return ResolutionResult::unresolved("Reference '" + reference.to_string() + "' has no path");
    }

    const std::string& head = reference.segments.front();
    auto top = root->find(head);
    if (top == root->end()) {
        return ResolutionResult::unresolved(
            "'" + path_prefix(reference, 1) + "' is not bound");
    }

    if (reference.ns == BindingNamespace::INPUTS) {
        const Value& declaration = *top;
        bool has_value = declaration.is_object() && declaration.contains("value");

        if (reference.segments.size() == 1) {
            if (!declaration.is_object()) {
                return ResolutionResult::found(declaration);
            }
            if (!has_value) {
                return ResolutionResult::unresolved(
                    "Input '" + head + "' declares no value");
            }
            return ResolutionResult::found(declaration["value"]);
        }

        size_t failed_at = 0;
        if (const Value* found = walk(declaration, reference.segments, 1, failed_at)) {
            return ResolutionResult::found(*found);
        }
        if (has_value) {
            size_t value_failed_at = 0;
            if (const Value* found = walk(declaration["value"], reference.segments, 1, value_failed_at)) {
                return ResolutionResult::found(*found);
            }
        }
        return ResolutionResult::unresolved(
            "'" + path_prefix(reference, failed_at + 1) + "' not found");
    }

    size_t failed_at = 0;
    const Value* found = walk(*top, reference.segments, 1, failed_at);
    if (!found) {
        return ResolutionResult::unresolved(
            "'" + path_prefix(reference, failed_at + 1) + "' not found");
    }
    return ResolutionResult::found(*found);
}

void BindingResolver::write(const std::string& target, const Value& value) {
    Reference reference = parse_reference(target);

    Value* node = nullptr;
    switch (reference.ns) {
        case BindingNamespace::INPUTS:
            throw BindingWriteError("'" + target + "': workflow inputs are read-only");
        case BindingNamespace::OUTPUTS: node = &outputs_; break;
        case BindingNamespace::INTERMEDIATE: node = &intermediate_; break;
    }

    for (size_t i = 0; i < reference.segments.size(); ++i) {
        const std::string& segment = reference.segments[i];
        bool last = (i + 1 == reference.segments.size());

        if (node->is_null()) {
            *node = Value::object();
        }

        Value* next = nullptr;
        if (node->is_object()) {
            next = &(*node)[segment];
        } else if (node->is_array() && is_index(segment)
                   && std::stoul(segment) < node->size()) {
            next = &(*node)[static_cast<size_t>(std::stoul(segment))];
        } else {
            throw BindingWriteError("'" + target + "': '" + path_prefix(reference, i) +
                                    "' is a " + value_type_name(*node) + ", not an object");
        }

        if (last) {
            *next = value;
        } else {
            node = next;
        }
    }
}

bool BindingResolver::contains(const std::string& reference) const {
    try {
        return resolve_reference(parse_reference(reference)).resolved;
    } catch (const BindingParseError&) {
        return false;
    }
}

} // namespace orchestrator
} // namespace cacm
