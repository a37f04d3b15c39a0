#include "skill_service.hpp"

namespace cacm {

namespace {

double numeric_argument(const Value& arguments, const char* name) {
    if (!arguments.is_object() || !arguments.contains(name)) {
        throw std::invalid_argument(std::string("missing argument '") + name + "'");
    }
    const Value& value = arguments[name];
    if (!value.is_number()) {
        throw std::invalid_argument(std::string("argument '") + name + "' must be a number, got " +
                                    value_type_name(value));
    }
    return value.get<double>();
}

std::string trim(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(" \t\n\r");
    return text.substr(first, last - first + 1);
}

Value calculate_ratio(const Value& arguments) {
    double numerator = numeric_argument(arguments, "numerator");
    double denominator = numeric_argument(arguments, "denominator");
    if (denominator == 0.0) {
        throw std::invalid_argument("denominator cannot be zero");
    }
    return numerator / denominator;
}

Value simple_scorer(const Value& arguments) {
    double metric = numeric_argument(arguments, "financial_metric");
    double threshold = numeric_argument(arguments, "threshold");

    std::string op = ">";
    if (arguments.contains("operator")) {
        if (!arguments["operator"].is_string()) {
            throw std::invalid_argument("argument 'operator' must be a string");
        }
        op = trim(arguments["operator"].get<std::string>());
    }

    if (op == ">") return metric > threshold ? "Above Threshold" : "Below or Equal to Threshold";
    if (op == "<") return metric < threshold ? "Below Threshold" : "Above or Equal to Threshold";
    if (op == ">=") return metric >= threshold ? "Meets or Exceeds Threshold" : "Below Threshold";
    if (op == "<=") return metric <= threshold ? "Below or Meets Threshold" : "Exceeds Threshold";
    if (op == "==") return metric == threshold ? "Equals Threshold" : "Does Not Equal Threshold";
    if (op == "!=") return metric != threshold ? "Does Not Equal Threshold" : "Equals Threshold";

    throw std::invalid_argument("unsupported operator '" + op +
                                "', expected one of >, <, >=, <=, ==, !=");
}

} // anonymous namespace

SkillRegistry::SkillRegistry(bool register_builtins) {
    if (register_builtins) {
        register_basic_calculation_skills(*this);
    }
}

void SkillRegistry::register_function(const std::string& plugin_name,
                                      const std::string& function_name,
                                      SkillFunction function) {
    if (!function) {
        throw std::invalid_argument("Skill function cannot be empty: " + key(plugin_name, function_name));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    functions_[key(plugin_name, function_name)] = std::move(function);
}

Value SkillRegistry::invoke(const std::string& plugin_name,
                            const std::string& function_name,
                            const Value& arguments) {
    SkillFunction function;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = functions_.find(key(plugin_name, function_name));
        if (it == functions_.end()) {
            throw SkillInvocationError(plugin_name, function_name, "no such skill");
        }
        function = it->second;
    }

    try {
        return function(arguments);
    } catch (const SkillInvocationError&) {
        throw;
    } catch (const std::exception& e) {
        throw SkillInvocationError(plugin_name, function_name, e.what());
    }
}

bool SkillRegistry::has_function(const std::string& plugin_name,
                                 const std::string& function_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return functions_.count(key(plugin_name, function_name)) > 0;
}

std::vector<std::string> SkillRegistry::list_functions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(functions_.size());
    for (const auto& [name, function] : functions_) {
        names.push_back(name);
    }
    return names;
}

void register_basic_calculation_skills(SkillRegistry& registry) {
    registry.register_function("BasicCalculations", "calculate_ratio", calculate_ratio);
    registry.register_function("BasicCalculations", "simple_scorer", simple_scorer);
}

} // namespace cacm
