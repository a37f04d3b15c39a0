/**
 * @file custom_worker_example.cpp
 * @brief Example registering a custom worker type and running a workflow with it
 *
 * This example shows how to:
 * - Implement a Worker that calls the skill service and delegates to a peer
 * - Register it with the orchestrator's WorkerRegistry
 * - Describe it in a capability catalog
 * - Run a workflow instance and inspect the run log and outputs
 *
 * Usage: custom_worker_example [workflow.json [catalog.json]]
 */

#include "../src/orchestrator.hpp"
#include "../src/config_parser.hpp"
#include "../src/logger.hpp"
#include <iostream>

using namespace cacm;
using namespace cacm::orchestrator;

namespace {

/**
 * Computes net debt / EBITDA and stores the leverage band in the shared context
 */
class LeverageWorker : public Worker {
public:
    LeverageWorker(const std::string& name, const std::string& default_skill)
        : Worker(name, "leverage", default_skill) {}

    WorkerResult run(const std::string& task, const Value& inputs, SharedContext& context) override {
        if (!skills()) {
            return WorkerResult::error("No skill service attached");
        }

        Value ratio;
        Value band;
        try {
            ratio = skills()->invoke(default_skill(), "calculate_ratio",
                                     {{"numerator", inputs.value("net_debt", Value())},
                                      {"denominator", inputs.value("ebitda", Value())}});
            band = skills()->invoke(default_skill(), "simple_scorer",
                                    {{"financial_metric", ratio}, {"threshold", 3.0}, {"operator", "<="}});
        } catch (const SkillInvocationError& e) {
            return WorkerResult::error(e.what());
        }

        // Record the band for later steps through a context_store peer
        WorkerResult stored = delegate("context_store", task,
                                       {{"key", "leverage_band"}, {"value", band}}, context,
                                       {{"worker_type", "context_store"}});
        if (!stored.ok()) {
            return WorkerResult::partial({{"leverage", ratio}, {"band", band}},
                                         {"Leverage band not stored: " + stored.message});
        }
        return WorkerResult::success({{"leverage", ratio}, {"band", band}});
    }
};

const char* kDefaultCatalog = R"({
  "computeCapabilities": [
    {"id": "leverage_calc", "name": "Leverage Calculator", "agentType": "leverage",
     "skillPlugin": "BasicCalculations",
     "inputs": ["net_debt", "ebitda"], "outputs": ["leverage", "band"]},
    {"id": "ratio_calc", "name": "Ratio Calculator", "agentType": "skill",
     "skillPlugin": "BasicCalculations"}
  ]
})";

const char* kDefaultWorkflow = R"({
  "cacmId": "leverage-review-001",
  "name": "Leverage Review",
  "inputs": {
    "financials": {"type": "object", "value": {"net_debt": 420.0, "ebitda": 150.0, "interest": 35.0}}
  },
  "outputs": {
    "leverage": {"type": "number"},
    "band": {"type": "string"},
    "coverage": {"type": "number"}
  },
  "workflow": [
    {"stepId": "s1_leverage", "computeCapabilityRef": "leverage_calc",
     "description": "Compute net debt to EBITDA",
     "inputBindings": {"net_debt": "cacm.inputs.financials.value.net_debt",
                       "ebitda": "cacm.inputs.financials.value.ebitda"},
     "outputBindings": {"leverage": "cacm.outputs.leverage", "band": "cacm.outputs.band"},
     "required": true},
    {"stepId": "s2_coverage", "computeCapabilityRef": "ratio_calc",
     "description": "Compute interest coverage",
     "inputBindings": {"function": "calculate_ratio",
                       "numerator": "cacm.inputs.financials.value.ebitda",
                       "denominator": "cacm.inputs.financials.value.interest"},
     "outputBindings": {"result": "cacm.outputs.coverage"}}
  ]
})";

} // anonymous namespace

int main(int argc, char* argv[]) {
    LoggerConfig log_config;
    log_config.min_level = LogLevel::DEBUG;
    log_config.enable_console = true;
    log_config.enable_json = false;
    Logger::get_instance().configure(log_config);

    try {
        Value document = argc > 1 ? load_json_document(argv[1]) : parse_json_document(kDefaultWorkflow);
        CapabilityCatalog catalog = argc > 2 ? CapabilityCatalog::load(argv[2])
                                             : CapabilityCatalog::load_from_string(kDefaultCatalog);

        OrchestratorConfig config;
        config.output_conflict_policy = OutputConflictPolicy::FAIL_STEP;

        Orchestrator orchestrator(catalog, config);
        orchestrator.worker_registry().register_worker("leverage", [](const WorkerCreationContext& ctx) {
            return std::make_unique<LeverageWorker>(ctx.name, ctx.default_skill());
        });

        RunResult result = orchestrator.run(document);

        std::cout << "\n=== Run log (" << run_state_to_string(result.state) << ") ===\n";
        for (const auto& line : result.logs.lines()) {
            std::cout << line << "\n";
        }

        std::cout << "\n=== Outputs ===\n" << dump_value(result.outputs, 2) << "\n";

        if (result.context) {
            std::cout << "\n=== Shared context ===\n" << result.context->summarize() << "\n";
        }

        std::cout << "\n=== Worker statistics ===\n";
        for (const auto& [name, stats] : orchestrator.get_worker_stats()) {
            std::cout << name << ": " << stats.total_runs() << " run(s), "
                      << stats.average_execution_time_ms << " ms average\n";
        }

        Logger::get_instance().flush();
        return result.success ? 0 : 1;
    } catch (const ConfigParseError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
