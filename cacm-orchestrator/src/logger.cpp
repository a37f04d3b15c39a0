/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <algorithm>

namespace cacm {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    config_ = config;

    file_stream_.reset();
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_catalog_loaded(const std::string& path, size_t capability_count) {
    std::map<std::string, std::string> fields;
    fields["event"] = "catalog_loaded";
    fields["catalog_path"] = path;
    fields["capability_count"] = std::to_string(capability_count);

    log(LogLevel::INFO, "Capability catalog loaded", fields);
}

void Logger::log_catalog_error(const std::string& path, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "catalog_load_error";
    fields["catalog_path"] = path;
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Capability catalog unavailable, continuing with an empty catalog", fields);
}

void Logger::log_worker_created(const WorkerInfo& info, bool from_catalog) {
    std::map<std::string, std::string> fields;
    fields["event"] = "worker_created";
    fields["worker_name"] = info.name;
    fields["worker_type"] = info.worker_type;
    fields["default_skill"] = info.default_skill.empty() ? "N/A" : info.default_skill;
    fields["from_catalog"] = from_catalog ? "true" : "false";

    log(LogLevel::INFO, "Worker created", fields);
}

void Logger::log_worker_construction_failed(const std::string& name, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "worker_construction_failed";
    fields["worker_name"] = name;
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Worker construction failed", fields);
}

void Logger::log_step_start(const LogContext& ctx, const std::string& capability_ref, size_t input_count) {
    std::map<std::string, std::string> fields;
    fields["event"] = "step_start";
    add_context_fields(ctx, fields);
    fields["capability_ref"] = capability_ref;
    fields["input_count"] = std::to_string(input_count);

    log(LogLevel::INFO, "Starting step", fields);
}

void Logger::log_step_complete(const LogContext& ctx, const WorkerResult& result) {
    std::map<std::string, std::string> fields;
    fields["event"] = "step_complete";
    add_context_fields(ctx, fields);
    fields["status"] = status_to_string(result.status);
    fields["execution_time_ms"] = std::to_string(result.execution_time_ms);
    fields["field_count"] = std::to_string(result.fields.size());

    if (!result.warnings.empty()) {
        fields["warning_count"] = std::to_string(result.warnings.size());
        for (size_t i = 0; i < std::min(result.warnings.size(), size_t(5)); ++i) {
            fields["warning_" + std::to_string(i)] = result.warnings[i];
        }
    }

    if (!result.ok()) {
        fields["error"] = result.message;
        fields["error_kind"] = error_kind_to_string(result.error_kind);
    }

    log(result.ok() ? LogLevel::INFO : LogLevel::ERROR, "Step completed", fields);
}

void Logger::log_binding_unresolved(
    const LogContext& ctx,
    const std::string& binding_name,
    const std::string& reference,
    const std::string& reason
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "binding_unresolved";
    add_context_fields(ctx, fields);
    fields["binding"] = binding_name;
    fields["reference"] = reference;
    fields["reason"] = reason;

    log(LogLevel::WARN, "Unresolved input binding", fields);
}

void Logger::log_output_conflict(const LogContext& ctx, const std::string& target, const std::string& policy) {
    std::map<std::string, std::string> fields;
    fields["event"] = "output_conflict";
    add_context_fields(ctx, fields);
    fields["target"] = target;
    fields["policy"] = policy;

    log(LogLevel::WARN, "Output target already bound", fields);
}

void Logger::log_delegation(const std::string& requester, const std::string& peer, size_t depth) {
    std::map<std::string, std::string> fields;
    fields["event"] = "delegation";
    fields["requester"] = requester;
    fields["peer"] = peer;
    fields["depth"] = std::to_string(depth);

    log(LogLevel::INFO, "Worker delegating to peer", fields);
}

void Logger::log_state_transition(
    const LogContext& ctx,
    const std::string& machine,
    const std::string& old_state,
    const std::string& new_state
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "state_transition";
    add_context_fields(ctx, fields);
    fields["machine"] = machine;
    fields["old_state"] = old_state;
    fields["new_state"] = new_state;

    log(LogLevel::DEBUG, "State transition", fields);
}

void Logger::log_context_update(
    const std::string& session_id,
    const std::string& store,
    const std::string& key,
    const std::string& value_type
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "context_update";
    fields["session_id"] = session_id;
    fields["store"] = store;
    fields["key"] = key;
    fields["value_type"] = value_type;

    log(LogLevel::INFO, "Shared context updated", fields);
}

void Logger::log_value(const LogContext& ctx, const std::string& name, const Value& value) {
    if (!config_.enable_value_dump) {
        return;
    }

    std::map<std::string, std::string> fields;
    fields["event"] = "value_dump";
    add_context_fields(ctx, fields);
    fields["name"] = name;
    fields["value_type"] = value_type_name(value);

    std::string serialized = dump_value(value);
    fields["serialized_size"] = std::to_string(serialized.size());
    if (serialized.size() > config_.max_value_dump_bytes) {
        serialized.resize(config_.max_value_dump_bytes);
        fields["truncated"] = "true";
    }
    fields["value"] = serialized;

    log(LogLevel::DEBUG, "Value dump", fields);
}

void Logger::log_info(const LogContext& ctx, const std::string& message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "info";
    add_context_fields(ctx, fields);

    log(LogLevel::INFO, message, fields);
}

void Logger::log_warning(const LogContext& ctx, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    add_context_fields(ctx, fields);
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::log_error(const LogContext& ctx, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    add_context_fields(ctx, fields);
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Orchestration error", fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

void Logger::add_context_fields(const LogContext& ctx, std::map<std::string, std::string>& fields) const {
    if (!ctx.session_id.empty()) fields["session_id"] = ctx.session_id;
    if (!ctx.step_id.empty()) fields["step_id"] = ctx.step_id;
    if (!ctx.worker_name.empty()) fields["worker_name"] = ctx.worker_name;
    if (!ctx.phase.empty()) fields["phase"] = ctx.phase;
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    Value line = Value::object();
    for (const auto& [key, value] : fields) {
        line[key] = value;
    }
    return dump_value(line);
}

void Logger::write_output(const std::string& output) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace cacm
