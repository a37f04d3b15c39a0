/**
 * @file worker_interface.cpp
 * @brief Worker base class: metadata and peer access
 */

#include "worker_interface.hpp"
#include "worker_lifecycle.hpp"

namespace cacm {

Worker::Worker(
    const std::string& name,
    const std::string& worker_type,
    const std::string& default_skill
)
    : name_(name),
      worker_type_(worker_type),
      default_skill_(default_skill),
      manager_(nullptr),
      skills_(nullptr) {}

WorkerInfo Worker::get_info() const {
    WorkerInfo info;
    info.name = name_;
    info.worker_type = worker_type_;
    info.default_skill = default_skill_;
    return info;
}

void Worker::attach(WorkerLifecycleManager* manager, ISkillService* skills) {
    manager_ = manager;
    skills_ = skills;
}

WorkerResult Worker::delegate(
    const std::string& peer_name,
    const std::string& task_description,
    const Value& inputs,
    SharedContext& context,
    const Value& creation_hints
) {
    if (!manager_) {
        return WorkerResult::error(
            "Worker '" + name_ + "' has no lifecycle manager; cannot delegate to '" + peer_name + "'",
            ErrorKind::DELEGATION
        );
    }
    return manager_->invoke(peer_name, task_description, inputs, context, creation_hints);
}

} // namespace cacm
