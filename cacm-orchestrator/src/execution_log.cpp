#include "execution_log.hpp"
#include <algorithm>

namespace cacm {

std::string LogEntry::to_string() const {
    return level_to_string(level) + ": " + source + ": " + message;
}

void ExecutionLog::add(LogLevel level, const std::string& source, const std::string& message) {
    entries_.emplace_back(level, source, message);
}

std::vector<std::string> ExecutionLog::lines() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.to_string());
    }
    return result;
}

size_t ExecutionLog::count(LogLevel level) const {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [level](const LogEntry& entry) { return entry.level == level; }));
}

bool ExecutionLog::contains(const std::string& fragment) const {
    for (const auto& entry : entries_) {
        if (entry.to_string().find(fragment) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace cacm
