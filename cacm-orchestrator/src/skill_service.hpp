/**
 * @file skill_service.hpp
 * @brief Skill invocation layer used by workers
 *
 * Skills are named functions grouped into plugins ("BasicCalculations",
 * ...). Workers call them through the ISkillService handle injected by the
 * WorkerLifecycleManager; the orchestrator never calls skills directly.
 */

#ifndef CACM_SKILL_SERVICE_HPP
#define CACM_SKILL_SERVICE_HPP

#include "value.hpp"
#include <string>
#include <vector>
#include <map>
#include <functional>
#include <mutex>
#include <stdexcept>

namespace cacm {

/**
 * @brief Raised when a skill is unknown or fails
 *
 * Workers catch it and turn it into an ERROR result.
 */
class SkillInvocationError : public std::runtime_error {
public:
    SkillInvocationError(const std::string& plugin, const std::string& function,
                         const std::string& message)
        : std::runtime_error("Skill " + plugin + "." + function + " failed: " + message),
          plugin_(plugin), function_(function) {}

    const std::string& plugin() const { return plugin_; }
    const std::string& function() const { return function_; }

private:
    std::string plugin_;
    std::string function_;
};

/**
 * @brief Skill invocation seam
 */
class ISkillService {
public:
    virtual ~ISkillService() = default;

    /**
     * @brief Invoke plugin.function with named arguments
     *
     * @param arguments Object of argument name -> value
     * @throws SkillInvocationError on unknown skills or skill failures
     */
    virtual Value invoke(const std::string& plugin_name,
                         const std::string& function_name,
                         const Value& arguments) = 0;

    virtual bool has_function(const std::string& plugin_name,
                              const std::string& function_name) const = 0;

    /**
     * @brief "plugin.function" names
     */
    virtual std::vector<std::string> list_functions() const = 0;
};

/**
 * @brief In-process skill service backed by a function table
 */
class SkillRegistry : public ISkillService {
public:
    /**
     * @brief Skill implementation; throw std::invalid_argument for bad arguments
     */
    using SkillFunction = std::function<Value(const Value& arguments)>;

    /**
     * @param register_builtins Register the BasicCalculations plugin
     */
    explicit SkillRegistry(bool register_builtins = true);

    /**
     * @brief Register or replace a skill function
     */
    void register_function(const std::string& plugin_name,
                           const std::string& function_name,
                           SkillFunction function);

    Value invoke(const std::string& plugin_name,
                 const std::string& function_name,
                 const Value& arguments) override;

    bool has_function(const std::string& plugin_name,
                      const std::string& function_name) const override;

    std::vector<std::string> list_functions() const override;

private:
    static std::string key(const std::string& plugin_name, const std::string& function_name) {
        return plugin_name + "." + function_name;
    }

    mutable std::mutex mutex_;
    std::map<std::string, SkillFunction> functions_;
};

/**
 * @brief Register the BasicCalculations plugin
 *
 * - calculate_ratio(numerator, denominator) -> number
 * - simple_scorer(financial_metric, threshold, operator = ">") -> string
 */
void register_basic_calculation_skills(SkillRegistry& registry);

} // namespace cacm

#endif // CACM_SKILL_SERVICE_HPP
