/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger and ExecutionLog
 */

#include <catch2/catch.hpp>
#include "../src/logger.hpp"
#include "../src/execution_log.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <vector>

using namespace cacm;
using json = nlohmann::json;

namespace {

LoggerConfig file_config(const std::string& path, LogLevel level = LogLevel::INFO) {
    std::filesystem::remove(path);
    LoggerConfig config;
    config.min_level = level;
    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = path;
    return config;
}

std::vector<std::string> read_lines(const std::string& path) {
    std::vector<std::string> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

json read_first_json(const std::string& path) {
    auto lines = read_lines(path);
    REQUIRE_FALSE(lines.empty());
    return json::parse(lines.front());
}

void quiet() {
    LoggerConfig config;
    config.enable_console = false;
    Logger::get_instance().configure(config);
}

} // anonymous namespace

TEST_CASE("Logger Configuration", "[logger]") {
    Logger& logger = Logger::get_instance();

    SECTION("Default configuration") {
        LoggerConfig config;

        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
        REQUIRE(config.enable_value_dump == false);
        REQUIRE(config.max_value_dump_bytes == 1024);
    }

    SECTION("Custom configuration") {
        LoggerConfig config = file_config("test_config.log", LogLevel::DEBUG);
        logger.configure(config);

        REQUIRE(logger.get_min_level() == LogLevel::DEBUG);

        quiet();
        std::filesystem::remove("test_config.log");
    }

    SECTION("Level names") {
        REQUIRE(string_to_level("DEBUG") == LogLevel::DEBUG);
        REQUIRE(string_to_level("WARNING") == LogLevel::WARN);
        REQUIRE(string_to_level("ERROR") == LogLevel::ERROR);
        REQUIRE(string_to_level("bogus") == LogLevel::INFO);
        REQUIRE(level_to_string(LogLevel::WARN) == "WARN");
    }
}

TEST_CASE("Logger Level Filtering", "[logger]") {
    Logger& logger = Logger::get_instance();
    logger.configure(file_config("test_filtering.log", LogLevel::WARN));

    LogContext ctx("session-1", "s1");
    logger.log_info(ctx, "filtered out");
    logger.log_warning(ctx, "kept");
    logger.flush();

    auto lines = read_lines("test_filtering.log");
    REQUIRE(lines.size() == 1);
    REQUIRE(json::parse(lines[0])["warning"] == "kept");

    quiet();
    std::filesystem::remove("test_filtering.log");
}

TEST_CASE("Logger Step Events", "[logger]") {
    Logger& logger = Logger::get_instance();
    LogContext ctx("session-1", "s1_calc");
    ctx.worker_name = "ratio_calc";

    SECTION("Step start") {
        logger.configure(file_config("test_step_start.log"));
        logger.log_step_start(ctx, "ratio_calc", 3);
        logger.flush();

        json line = read_first_json("test_step_start.log");
        REQUIRE(line["event"] == "step_start");
        REQUIRE(line["level"] == "INFO");
        REQUIRE(line["session_id"] == "session-1");
        REQUIRE(line["step_id"] == "s1_calc");
        REQUIRE(line["capability_ref"] == "ratio_calc");
        REQUIRE(line["input_count"] == "3");
        REQUIRE(line.contains("timestamp"));

        std::filesystem::remove("test_step_start.log");
    }

    SECTION("Step complete - error") {
        logger.configure(file_config("test_step_error.log"));
        WorkerResult result = WorkerResult::error("Denominator cannot be zero", ErrorKind::WORKER_EXECUTION);
        logger.log_step_complete(ctx, result);
        logger.flush();

        json line = read_first_json("test_step_error.log");
        REQUIRE(line["event"] == "step_complete");
        REQUIRE(line["level"] == "ERROR");
        REQUIRE(line["status"] == "error");
        REQUIRE(line["error"] == "Denominator cannot be zero");
        REQUIRE(line["error_kind"] == "WorkerExecutionError");

        std::filesystem::remove("test_step_error.log");
    }

    SECTION("Step complete - partial with warnings") {
        logger.configure(file_config("test_step_partial.log"));
        WorkerResult result = WorkerResult::partial({{"a", 1}}, {"field b unavailable"});
        logger.log_step_complete(ctx, result);
        logger.flush();

        json line = read_first_json("test_step_partial.log");
        REQUIRE(line["status"] == "partial");
        REQUIRE(line["warning_count"] == "1");
        REQUIRE(line["warning_0"] == "field b unavailable");

        std::filesystem::remove("test_step_partial.log");
    }

    SECTION("Unresolved binding") {
        logger.configure(file_config("test_unresolved.log"));
        logger.log_binding_unresolved(ctx, "score", "cacm.outputs.missingKey", "not bound");
        logger.flush();

        json line = read_first_json("test_unresolved.log");
        REQUIRE(line["event"] == "binding_unresolved");
        REQUIRE(line["level"] == "WARN");
        REQUIRE(line["reference"] == "cacm.outputs.missingKey");

        std::filesystem::remove("test_unresolved.log");
    }

    quiet();
}

TEST_CASE("Logger Worker Events", "[logger]") {
    Logger& logger = Logger::get_instance();
    logger.configure(file_config("test_worker_events.log"));

    WorkerInfo info;
    info.name = "ratio_calc";
    info.worker_type = "skill";
    info.default_skill = "BasicCalculations";

    logger.log_worker_created(info, true);
    logger.log_delegation("relay", "echo", 1);
    logger.log_context_update("session-1", "data_store", "rating", "string");
    logger.flush();

    auto lines = read_lines("test_worker_events.log");
    REQUIRE(lines.size() == 3);

    json created = json::parse(lines[0]);
    REQUIRE(created["event"] == "worker_created");
    REQUIRE(created["worker_type"] == "skill");
    REQUIRE(created["default_skill"] == "BasicCalculations");
    REQUIRE(created["from_catalog"] == "true");

    json delegation = json::parse(lines[1]);
    REQUIRE(delegation["event"] == "delegation");
    REQUIRE(delegation["requester"] == "relay");
    REQUIRE(delegation["peer"] == "echo");
    REQUIRE(delegation["depth"] == "1");

    json update = json::parse(lines[2]);
    REQUIRE(update["event"] == "context_update");
    REQUIRE(update["level"] == "INFO");
    REQUIRE(update["key"] == "rating");

    quiet();
    std::filesystem::remove("test_worker_events.log");
}

TEST_CASE("Logger State Transitions", "[logger]") {
    Logger& logger = Logger::get_instance();
    logger.configure(file_config("test_states.log", LogLevel::DEBUG));

    LogContext ctx("session-1", "s2");
    logger.log_state_transition(ctx, "step", "Pending", "ResolvingInputs");
    logger.flush();

    json line = read_first_json("test_states.log");
    REQUIRE(line["event"] == "state_transition");
    REQUIRE(line["level"] == "DEBUG");
    REQUIRE(line["machine"] == "step");
    REQUIRE(line["old_state"] == "Pending");
    REQUIRE(line["new_state"] == "ResolvingInputs");

    quiet();
    std::filesystem::remove("test_states.log");
}

TEST_CASE("Logger Value Dumping", "[logger]") {
    Logger& logger = Logger::get_instance();
    LogContext ctx("session-1", "s1");

    SECTION("Disabled by default") {
        logger.configure(file_config("test_values_off.log", LogLevel::DEBUG));
        logger.log_value(ctx, "step_inputs", Value{{"in", "hello"}});
        logger.flush();

        REQUIRE(read_lines("test_values_off.log").empty());
        std::filesystem::remove("test_values_off.log");
    }

    SECTION("Truncated to the configured size") {
        LoggerConfig config = file_config("test_values.log", LogLevel::DEBUG);
        config.enable_value_dump = true;
        config.max_value_dump_bytes = 8;
        logger.configure(config);

        logger.log_value(ctx, "step_inputs", Value{{"text", "a long string value"}});
        logger.flush();

        json line = read_first_json("test_values.log");
        REQUIRE(line["event"] == "value_dump");
        REQUIRE(line["value_type"] == "object");
        REQUIRE(line["truncated"] == "true");
        REQUIRE(line["value"].get<std::string>().size() == 8);

        std::filesystem::remove("test_values.log");
    }

    quiet();
}

TEST_CASE("Logger JSON Escaping", "[logger]") {
    Logger& logger = Logger::get_instance();
    logger.configure(file_config("test_escape.log"));

    LogContext ctx("session-1", "s1");
    logger.log_warning(ctx, "Quote \" backslash \\ newline \n tab \t");
    logger.flush();

    json line = read_first_json("test_escape.log");
    REQUIRE(line["warning"] == "Quote \" backslash \\ newline \n tab \t");

    quiet();
    std::filesystem::remove("test_escape.log");
}

TEST_CASE("Logger Plain Text Output", "[logger]") {
    Logger& logger = Logger::get_instance();
    LoggerConfig config = file_config("test_plain.log");
    config.enable_json = false;
    logger.configure(config);

    logger.log_catalog_loaded("catalog.json", 4);
    logger.flush();

    auto lines = read_lines("test_plain.log");
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("[INFO] Capability catalog loaded") != std::string::npos);
    REQUIRE(lines[0].find("capability_count=4") != std::string::npos);

    quiet();
    std::filesystem::remove("test_plain.log");
}

TEST_CASE("ExecutionLog", "[logger]") {
    ExecutionLog log;
    log.info("Orchestrator", "CACM instance is valid.");
    log.warn("BindingResolver", "input 'x' unresolved");
    log.error("Orchestrator", "Step 's2' failed");

    REQUIRE(log.size() == 3);
    REQUIRE(log.count(LogLevel::WARN) == 1);
    REQUIRE(log.lines()[0] == "INFO: Orchestrator: CACM instance is valid.");
    REQUIRE(log.entries()[1].source == "BindingResolver");
    REQUIRE(log.contains("Step 's2' failed"));
    REQUIRE_FALSE(log.contains("Step 's3'"));
}
