/**
 * @file shared_context.cpp
 * @brief Implementation of SharedContext
 */

#include "shared_context.hpp"
#include <random>
#include <sstream>
#include <iomanip>

namespace cacm {

SharedContext::SharedContext(
    const std::string& cacm_id,
    const std::string& session_id,
    Logger* logger
)
    : session_id_(session_id.empty() ? generate_session_id() : session_id),
      cacm_id_(cacm_id),
      logger_(logger),
      global_parameters_(Value::object()),
      data_store_(Value::object()) {

    if (!logger_) {
        logger_ = &Logger::get_instance();
    }

    LogContext ctx;
    ctx.session_id = session_id_;
    logger_->log_info(ctx, "SharedContext initialized for CACM ID '" + cacm_id_ + "'");
}

void SharedContext::add_document_reference(const std::string& doc_type, const std::string& doc_uri) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        document_references_[doc_type] = doc_uri;
    }
    logger_->log_context_update(session_id_, "document_references", doc_type, "uri");
}

std::optional<std::string> SharedContext::get_document_reference(const std::string& doc_type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = document_references_.find(doc_type);
    if (it == document_references_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, std::string> SharedContext::get_all_document_references() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return document_references_;
}

bool SharedContext::add_knowledge_base_reference(const std::string& kb_uri) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& existing : knowledge_base_references_) {
            if (existing == kb_uri) {
                return false;
            }
        }
        knowledge_base_references_.push_back(kb_uri);
    }
    logger_->log_context_update(session_id_, "knowledge_base_references", kb_uri, "uri");
    return true;
}

std::vector<std::string> SharedContext::get_all_knowledge_base_references() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return knowledge_base_references_;
}

void SharedContext::set_global_parameter(const std::string& key, const Value& value) {
    bool overwritten = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        overwritten = global_parameters_.contains(key);
        global_parameters_[key] = value;
    }

    if (overwritten) {
        LogContext ctx;
        ctx.session_id = session_id_;
        logger_->log_warning(ctx, "Global parameter '" + key + "' overwritten");
    }
    logger_->log_context_update(session_id_, "global_parameters", key, value_type_name(value));
}

std::optional<Value> SharedContext::get_global_parameter(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = global_parameters_.find(key);
    if (it == global_parameters_.end()) {
        return std::nullopt;
    }
    return *it;
}

Value SharedContext::get_all_global_parameters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return global_parameters_;
}

void SharedContext::set_data(const std::string& key, const Value& value) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        data_store_[key] = value;
    }
    logger_->log_context_update(session_id_, "data_store", key, value_type_name(value));
}

Value SharedContext::get_data(const std::string& key, const Value& default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_store_.find(key);
    if (it == data_store_.end()) {
        return default_value;
    }
    return *it;
}

bool SharedContext::has_data(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_store_.contains(key);
}

bool SharedContext::erase_data(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_store_.erase(key) > 0;
}

std::vector<std::string> SharedContext::data_keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    keys.reserve(data_store_.size());
    for (auto it = data_store_.begin(); it != data_store_.end(); ++it) {
        keys.push_back(it.key());
    }
    return keys;
}

std::string SharedContext::summarize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;

    oss << "--- SharedContext Summary (Session: " << session_id_
        << ", CACM: " << cacm_id_ << ") ---\n";

    oss << "Document References: ";
    if (document_references_.empty()) {
        oss << "None\n";
    } else {
        Value docs(document_references_);
        oss << dump_value(docs, 2) << "\n";
    }

    oss << "Knowledge Base Refs: ";
    if (knowledge_base_references_.empty()) {
        oss << "None\n";
    } else {
        for (size_t i = 0; i < knowledge_base_references_.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << knowledge_base_references_[i];
        }
        oss << "\n";
    }

    oss << "Global Parameters: "
        << (global_parameters_.empty() ? std::string("None") : dump_value(global_parameters_, 2)) << "\n";

    oss << "Data Store Keys: ";
    if (data_store_.empty()) {
        oss << "None (empty)\n";
    } else {
        bool first = true;
        for (auto it = data_store_.begin(); it != data_store_.end(); ++it) {
            if (!first) oss << ", ";
            oss << it.key();
            first = false;
        }
        oss << "\n";
    }

    oss << "--- End of Summary ---";
    return oss.str();
}

Value SharedContext::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Value snapshot = Value::object();
    snapshot["sessionId"] = session_id_;
    snapshot["cacmId"] = cacm_id_;
    snapshot["documentReferences"] = Value(document_references_);
    snapshot["knowledgeBaseReferences"] = Value(knowledge_base_references_);
    snapshot["globalParameters"] = global_parameters_;
    snapshot["dataStore"] = data_store_;
    return snapshot;
}

std::string SharedContext::generate_session_id() {
    static thread_local std::mt19937_64 generator{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> distribution;

    uint64_t high = distribution(generator);
    uint64_t low = distribution(generator);

    // Version 4, variant 10xx
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << static_cast<uint32_t>(high >> 32) << "-"
        << std::setw(4) << static_cast<uint32_t>((high >> 16) & 0xFFFF) << "-"
        << std::setw(4) << static_cast<uint32_t>(high & 0xFFFF) << "-"
        << std::setw(4) << static_cast<uint32_t>(low >> 48) << "-"
        << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

} // namespace cacm
