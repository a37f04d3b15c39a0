#include "builtin_workers.hpp"
#include "worker_registry.hpp"
#include "skill_service.hpp"
#include "shared_context.hpp"

namespace cacm {

namespace {

std::string string_input(const Value& inputs, const char* key) {
    if (inputs.is_object() && inputs.contains(key) && inputs[key].is_string()) {
        return inputs[key].get<std::string>();
    }
    return "";
}

Value inputs_without(const Value& inputs, std::initializer_list<const char*> keys) {
    Value result = inputs.is_object() ? inputs : Value::object();
    for (const char* key : keys) {
        result.erase(key);
    }
    return result;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// EchoWorker

EchoWorker::EchoWorker(const std::string& name)
    : Worker(name, WorkerType::ECHO),
      invocation_count_(0) {}

WorkerResult EchoWorker::run(const std::string&, const Value& step_inputs, SharedContext&) {
    ++invocation_count_;

    Value fields = step_inputs.is_object() ? step_inputs : Value::object();
    if (step_inputs.is_object() && step_inputs.contains("in")) {
        fields["echo"] = step_inputs["in"];
    }
    fields["invocation"] = invocation_count_;
    return WorkerResult::success(fields);
}

// ---------------------------------------------------------------------------
// SkillWorker

SkillWorker::SkillWorker(const std::string& name, const std::string& default_skill)
    : Worker(name, WorkerType::SKILL, default_skill) {}

WorkerResult SkillWorker::run(const std::string&, const Value& step_inputs, SharedContext&) {
    if (!skills()) {
        return WorkerResult::error("Worker '" + name() + "' has no skill service");
    }

    std::string plugin = string_input(step_inputs, "plugin");
    if (plugin.empty()) {
        plugin = default_skill();
    }
    std::string function = string_input(step_inputs, "function");

    if (plugin.empty() || function.empty()) {
        return WorkerResult::error("Worker '" + name() + "' needs a skill plugin and a 'function' input");
    }

    Value arguments;
    if (step_inputs.is_object() && step_inputs.contains("arguments") && step_inputs["arguments"].is_object()) {
        arguments = step_inputs["arguments"];
    } else {
        arguments = inputs_without(step_inputs, {"plugin", "function", "arguments"});
    }

    try {
        Value result = skills()->invoke(plugin, function, arguments);
        return WorkerResult::success({{"result", result}}, plugin + "." + function);
    } catch (const SkillInvocationError& e) {
        return WorkerResult::error(e.what());
    }
}

// ---------------------------------------------------------------------------
// ContextStoreWorker

ContextStoreWorker::ContextStoreWorker(const std::string& name)
    : Worker(name, WorkerType::CONTEXT_STORE) {}

WorkerResult ContextStoreWorker::run(const std::string&, const Value& step_inputs, SharedContext& context) {
    std::string operation = string_input(step_inputs, "operation");
    if (operation.empty()) {
        operation = "set";
    }

    if (operation == "add_document") {
        std::string doc_type = string_input(step_inputs, "doc_type");
        std::string uri = string_input(step_inputs, "uri");
        if (doc_type.empty() || uri.empty()) {
            return WorkerResult::error("add_document needs string inputs 'doc_type' and 'uri'");
        }
        context.add_document_reference(doc_type, uri);
        return WorkerResult::success({{"doc_type", doc_type}, {"uri", uri}});
    }

    std::string key = string_input(step_inputs, "key");
    if (key.empty()) {
        return WorkerResult::error(operation + " needs a string input 'key'");
    }

    if (operation == "set" || operation == "set_global") {
        if (!step_inputs.contains("value")) {
            return WorkerResult::error(operation + " needs an input 'value'");
        }
        const Value& value = step_inputs["value"];
        if (operation == "set") {
            context.set_data(key, value);
        } else {
            context.set_global_parameter(key, value);
        }
        return WorkerResult::success({{"key", key}, {"value", value}});
    }

    if (operation == "get") {
        if (context.has_data(key)) {
            return WorkerResult::success({{"key", key}, {"value", context.get_data(key)}, {"found", true}});
        }
        if (step_inputs.contains("default")) {
            return WorkerResult::success({{"key", key}, {"value", step_inputs["default"]}, {"found", false}});
        }
        return WorkerResult::partial({{"key", key}, {"found", false}},
                                     {"Key '" + key + "' not found in data store"});
    }

    return WorkerResult::error("Unknown context_store operation '" + operation + "'");
}

// ---------------------------------------------------------------------------
// RelayWorker

RelayWorker::RelayWorker(const std::string& name, const std::string& default_target)
    : Worker(name, WorkerType::RELAY),
      default_target_(default_target) {}

WorkerResult RelayWorker::run(const std::string& task_description, const Value& step_inputs,
                              SharedContext& context) {
    std::string target = string_input(step_inputs, "target");
    if (target.empty()) {
        target = default_target_;
    }
    if (target.empty()) {
        return WorkerResult::error("Worker '" + name() + "' has no relay target", ErrorKind::DELEGATION);
    }

    Value peer_inputs;
    if (step_inputs.is_object() && step_inputs.contains("inputs") && step_inputs["inputs"].is_object()) {
        peer_inputs = step_inputs["inputs"];
    } else {
        peer_inputs = inputs_without(step_inputs, {"target"});
    }

    return delegate(target, task_description, peer_inputs, context);
}

void register_builtin_workers(WorkerRegistry& registry) {
    registry.register_worker(WorkerType::ECHO, [](const WorkerCreationContext& ctx) {
        return std::make_unique<EchoWorker>(ctx.name);
    });

    registry.register_worker(WorkerType::SKILL, [](const WorkerCreationContext& ctx) {
        return std::make_unique<SkillWorker>(ctx.name, ctx.default_skill());
    });

    registry.register_worker(WorkerType::CONTEXT_STORE, [](const WorkerCreationContext& ctx) {
        return std::make_unique<ContextStoreWorker>(ctx.name);
    });

    registry.register_worker(WorkerType::RELAY, [](const WorkerCreationContext& ctx) {
        std::string target;
        if (ctx.hints.contains("target") && ctx.hints["target"].is_string()) {
            target = ctx.hints["target"].get<std::string>();
        }
        return std::make_unique<RelayWorker>(ctx.name, target);
    });
}

} // namespace cacm
