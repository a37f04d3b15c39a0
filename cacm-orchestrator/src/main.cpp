#include <iostream>
#include <fstream>
#include <string>
#include "orchestrator.hpp"
#include "config_parser.hpp"
#include "capability_catalog.hpp"
#include "validator.hpp"
#include "logger.hpp"

using namespace cacm;
using namespace cacm::orchestrator;

namespace {

struct CLIArgs {
    std::string command;
    std::string workflow_path;
    std::string catalog_path;
    std::string config_path;
    std::string output_path;
    std::string log_level;
    bool plain_logs = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "CACM Orchestrator v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " <command> [options]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  validate                    Validate a workflow instance\n";
    std::cerr << "  run                         Execute a workflow instance\n";
    std::cerr << "  catalog                     List the capabilities of a catalog\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --workflow <path>           Workflow instance JSON (validate, run)\n";
    std::cerr << "  --catalog <path>            Capability catalog JSON (run, catalog)\n";
    std::cerr << "  --config <path>             Orchestrator configuration JSON (run)\n";
    std::cerr << "  --output <path>             Write outputs JSON here (default: stdout)\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR\n";
    std::cerr << "  --plain-logs                Plain-text process logs instead of JSON lines\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n";
    std::cerr << "  " << program_name << " validate --workflow workflow.json\n";
    std::cerr << "  " << program_name << " run --workflow workflow.json --catalog catalog.json \\\n";
    std::cerr << "      --output outputs.json\n";
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--workflow" && i + 1 < argc) {
            args.workflow_path = argv[++i];
        } else if (arg == "--catalog" && i + 1 < argc) {
            args.catalog_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--plain-logs") {
            args.plain_logs = true;
        } else if (args.command.empty() && !arg.empty() && arg[0] != '-') {
            args.command = arg;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

int command_validate(const CLIArgs& args) {
    if (args.workflow_path.empty()) {
        std::cerr << "Error: validate requires --workflow <path>\n";
        return 1;
    }

    Value document = load_json_document(args.workflow_path);
    SchemaValidator validator;
    ValidationReport report = validator.validate(document);

    if (report.is_valid()) {
        std::cout << "Workflow instance is valid: " << args.workflow_path << "\n";
        return 0;
    }

    std::cout << "Workflow instance is invalid: " << args.workflow_path << "\n";
    for (const auto& issue : report.errors) {
        std::cout << "  - " << issue.to_string() << "\n";
    }
    return 1;
}

int command_catalog(const CLIArgs& args) {
    if (args.catalog_path.empty()) {
        std::cerr << "Error: catalog requires --catalog <path>\n";
        return 1;
    }

    CapabilityCatalog catalog = CapabilityCatalog::load(args.catalog_path);
    if (catalog.has_load_error()) {
        std::cerr << "Error: " << catalog.load_error() << "\n";
        return 1;
    }

    std::cout << catalog.size() << " capabilities in " << args.catalog_path << "\n";
    for (const auto& id : catalog.list_ids()) {
        auto descriptor = catalog.lookup(id);
        std::cout << "  " << id << "  [" << (descriptor->worker_type.empty() ? "?" : descriptor->worker_type) << "]";
        if (!descriptor->default_skill.empty()) {
            std::cout << "  skill=" << descriptor->default_skill;
        }
        if (!descriptor->name.empty()) {
            std::cout << "  " << descriptor->name;
        }
        std::cout << "\n";
    }
    return 0;
}

int command_run(const CLIArgs& args) {
    if (args.workflow_path.empty()) {
        std::cerr << "Error: run requires --workflow <path>\n";
        return 1;
    }

    OrchestratorConfig config;
    if (!args.config_path.empty()) {
        config = parse_orchestrator_config_from_file(args.config_path);
    }
    if (!args.catalog_path.empty()) {
        config.catalog_path = args.catalog_path;
    }
    if (!args.log_level.empty()) {
        config.logging.min_level = string_to_level(args.log_level);
    }
    if (args.plain_logs) {
        config.logging.enable_json = false;
    }

    Logger::get_instance().configure(config.logging);

    Value document = load_json_document(args.workflow_path);

    Orchestrator orchestrator(config);
    RunResult result = orchestrator.run(document);

    for (const auto& line : result.logs.lines()) {
        std::cerr << line << "\n";
    }

    std::string outputs = dump_value(result.outputs, 2);
    if (args.output_path.empty()) {
        std::cout << outputs << std::endl;
    } else {
        std::ofstream out(args.output_path);
        if (!out.is_open()) {
            std::cerr << "Error: Failed to open output file: " << args.output_path << "\n";
            return 1;
        }
        out << outputs << std::endl;
    }

    Logger::get_instance().flush();
    return result.success ? 0 : 1;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help || args.command.empty()) {
        print_usage(argv[0]);
        return args.help ? 0 : 1;
    }

    try {
        if (args.command == "validate") {
            return command_validate(args);
        } else if (args.command == "run") {
            return command_run(args);
        } else if (args.command == "catalog") {
            return command_catalog(args);
        }

        std::cerr << "Error: Unknown command: " << args.command << "\n\n";
        print_usage(argv[0]);
        return 1;
    } catch (const ConfigParseError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
