#ifndef CACM_EXECUTION_LOG_HPP
#define CACM_EXECUTION_LOG_HPP

#include "logger.hpp"
#include <string>
#include <vector>

namespace cacm {

/**
 * @brief One tagged entry of a run's execution log
 */
struct LogEntry {
    LogLevel level;
    std::string source;      ///< Component that produced the entry ("Orchestrator", "Validator", ...)
    std::string message;

    LogEntry(LogLevel level_, const std::string& source_, const std::string& message_)
        : level(level_), source(source_), message(message_) {}

    /**
     * @brief Text form: "LEVEL: Source: message"
     */
    std::string to_string() const;
};

/**
 * @brief Ordered log of one orchestrator run, returned to the caller
 *
 * Unlike the process-wide Logger, the execution log is owned by the run
 * result and always records INFO/WARN/ERROR entries regardless of the
 * logger's configured level.
 */
class ExecutionLog {
public:
    void add(LogLevel level, const std::string& source, const std::string& message);

    void info(const std::string& source, const std::string& message) {
        add(LogLevel::INFO, source, message);
    }

    void warn(const std::string& source, const std::string& message) {
        add(LogLevel::WARN, source, message);
    }

    void error(const std::string& source, const std::string& message) {
        add(LogLevel::ERROR, source, message);
    }

    const std::vector<LogEntry>& entries() const { return entries_; }

    std::vector<std::string> lines() const;

    size_t size() const { return entries_.size(); }

    size_t count(LogLevel level) const;

    /**
     * @brief Check whether any entry's text form contains a fragment
     */
    bool contains(const std::string& fragment) const;

private:
    std::vector<LogEntry> entries_;
};

} // namespace cacm

#endif // CACM_EXECUTION_LOG_HPP
