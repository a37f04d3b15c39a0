/**
 * @file logger.hpp
 * @brief Structured logging for the orchestrator with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Context tracking (session ID, step ID, worker name, phase)
 * - Debug mode with resolved input value dumps
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef CACM_LOGGER_HPP
#define CACM_LOGGER_HPP

#include "worker_interface.hpp"
#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <fstream>

namespace cacm {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< State transitions, resolved input values
    INFO,    ///< Step start/end, worker creation, context updates
    WARN,    ///< Unresolved bindings, output conflicts, partial results
    ERROR    ///< Failed steps, catalog load failures
};

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string (defaults to INFO)
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN" || level_str == "WARNING") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Where in a run a log event happened
 */
struct LogContext {
    std::string session_id;     ///< SharedContext session of the run
    std::string step_id;        ///< Workflow step, empty outside the step loop
    std::string worker_name;    ///< Worker (capability ref or peer name)
    std::string phase;          ///< validate, resolve, dispatch, capture, ...

    LogContext() = default;

    LogContext(const std::string& session, const std::string& step)
        : session_id(session), step_id(step) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)
    bool enable_value_dump;          ///< Dump resolved step inputs at DEBUG level (WARNING: large output)
    size_t max_value_dump_bytes;     ///< Maximum serialized bytes per dumped value

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("orchestrator.log"),
          enable_json(true),
          enable_value_dump(false),
          max_value_dump_bytes(1024) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "orchestrator.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   LogContext ctx(context.get_session_id(), "s1_calc_score");
 *   logger.log_step_start(ctx, "model:CreditScoringModel_v1", 3);
 *   @endcode
 */
class Logger {
public:
    static Logger& get_instance();

    void configure(const LoggerConfig& config);

    void log_catalog_loaded(const std::string& path, size_t capability_count);

    void log_catalog_error(const std::string& path, const std::string& error_message);

    void log_worker_created(const WorkerInfo& info, bool from_catalog);

    void log_worker_construction_failed(const std::string& name, const std::string& error_message);

    void log_step_start(const LogContext& ctx, const std::string& capability_ref, size_t input_count);

    void log_step_complete(const LogContext& ctx, const WorkerResult& result);

    /**
     * @brief Log an input binding that could not be resolved
     *
     * @param ctx Step context
     * @param binding_name Input name in the step's inputBindings
     * @param reference Reference text that failed
     * @param reason Why resolution failed
     */
    void log_binding_unresolved(
        const LogContext& ctx,
        const std::string& binding_name,
        const std::string& reference,
        const std::string& reason
    );

    void log_output_conflict(const LogContext& ctx, const std::string& target, const std::string& policy);

    void log_delegation(const std::string& requester, const std::string& peer, size_t depth);

    void log_state_transition(
        const LogContext& ctx,
        const std::string& machine,
        const std::string& old_state,
        const std::string& new_state
    );

    void log_context_update(
        const std::string& session_id,
        const std::string& store,
        const std::string& key,
        const std::string& value_type
    );

    /**
     * @brief Dump a value (debug mode only, truncated)
     */
    void log_value(const LogContext& ctx, const std::string& name, const Value& value);

    void log_info(const LogContext& ctx, const std::string& message);

    void log_warning(const LogContext& ctx, const std::string& warning_message);

    void log_error(const LogContext& ctx, const std::string& error_message);

    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }

    LogLevel get_min_level() const { return config_.min_level; }

    const LoggerConfig& get_config() const { return config_; }

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    std::mutex write_mutex_;

    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    void add_context_fields(const LogContext& ctx, std::map<std::string, std::string>& fields) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    void write_output(const std::string& output);
};

} // namespace cacm

#endif // CACM_LOGGER_HPP
