/**
 * @file shared_context.hpp
 * @brief Per-run mutable state shared by every worker of a workflow run
 *
 * The SharedContext is created once per run, keyed by a session ID, and
 * passed by reference to every worker invocation. It carries side-channel
 * state that does not flow through explicit bindings:
 * - data store: free-form key/value scratch space, read/write by any worker
 * - document references: document type -> URI (unique keys)
 * - knowledge base references: ordered, de-duplicated URIs
 * - global parameters: key/value, write-once-read-many by convention
 *
 * Writes are immediately visible to later steps and to delegated peers.
 * Access is serialized by an internal mutex; set_data() is last-writer-wins.
 */

#ifndef CACM_SHARED_CONTEXT_HPP
#define CACM_SHARED_CONTEXT_HPP

#include "value.hpp"
#include "logger.hpp"
#include <string>
#include <map>
#include <vector>
#include <optional>
#include <mutex>

namespace cacm {

class SharedContext {
public:
    /**
     * @brief Create a context for one run
     *
     * @param cacm_id Identifier of the workflow instance being executed
     * @param session_id Session ID (generated when empty)
     * @param logger Logger instance (optional, uses default if nullptr)
     */
    explicit SharedContext(
        const std::string& cacm_id,
        const std::string& session_id = "",
        Logger* logger = nullptr
    );

    SharedContext(const SharedContext&) = delete;
    SharedContext& operator=(const SharedContext&) = delete;

    const std::string& get_session_id() const { return session_id_; }
    const std::string& get_cacm_id() const { return cacm_id_; }

    void add_document_reference(const std::string& doc_type, const std::string& doc_uri);
    std::optional<std::string> get_document_reference(const std::string& doc_type) const;
    std::map<std::string, std::string> get_all_document_references() const;

    /**
     * @brief Append a knowledge base URI unless already present
     *
     * @return true if the URI was added
     */
    bool add_knowledge_base_reference(const std::string& kb_uri);
    std::vector<std::string> get_all_knowledge_base_references() const;

    /**
     * @brief Set a global parameter
     *
     * Overwriting an existing parameter is allowed but logged as a warning.
     */
    void set_global_parameter(const std::string& key, const Value& value);
    std::optional<Value> get_global_parameter(const std::string& key) const;
    Value get_all_global_parameters() const;

    void set_data(const std::string& key, const Value& value);

    /**
     * @brief Read from the data store
     *
     * @return Stored value, or default_value when the key is absent
     */
    Value get_data(const std::string& key, const Value& default_value = Value()) const;

    bool has_data(const std::string& key) const;
    bool erase_data(const std::string& key);
    std::vector<std::string> data_keys() const;

    /**
     * @brief Multi-line diagnostic summary (not a stable format)
     */
    std::string summarize() const;

    /**
     * @brief Snapshot of the whole context as JSON
     */
    Value to_json() const;

    /**
     * @brief Generate a random RFC 4122 version 4 UUID string
     */
    static std::string generate_session_id();

private:
    std::string session_id_;
    std::string cacm_id_;
    Logger* logger_;

    mutable std::mutex mutex_;
    std::map<std::string, std::string> document_references_;
    std::vector<std::string> knowledge_base_references_;
    Value global_parameters_;
    Value data_store_;
};

} // namespace cacm

#endif // CACM_SHARED_CONTEXT_HPP
