/**
 * @file test_worker_lifecycle.cpp
 * @brief Unit tests for WorkerRegistry and WorkerLifecycleManager
 */

#include <catch2/catch.hpp>
#include "../src/worker_lifecycle.hpp"
#include "../src/shared_context.hpp"
#include "../src/skill_service.hpp"
#include "../src/builtin_workers.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using namespace cacm;

namespace {

void quiet() {
    LoggerConfig config;
    config.enable_console = false;
    Logger::get_instance().configure(config);
}

// Delegates to a fixed peer, or reports the active chain when it has none
class PeerWorker : public Worker {
public:
    PeerWorker(const std::string& name, const std::string& type, const std::string& peer,
               const Value& peer_hints = Value::object())
        : Worker(name, type), peer_(peer), peer_hints_(peer_hints) {}

    WorkerResult run(const std::string& task, const Value& inputs, SharedContext& context) override {
        if (peer_.empty()) {
            return WorkerResult::success({{"chain", WorkerLifecycleManager::active_chain()}});
        }
        return delegate(peer_, task, inputs, context, peer_hints_);
    }

private:
    std::string peer_;
    Value peer_hints_;
};

// hop1 -> hop2 -> ... -> hop<last>
void register_hops(WorkerRegistry& registry, int last) {
    registry.register_worker("hop", [last](const WorkerCreationContext& ctx) {
        int n = std::stoi(ctx.name.substr(3));
        std::string peer = n < last ? "hop" + std::to_string(n + 1) : "";
        return std::make_unique<PeerWorker>(ctx.name, "hop", peer, Value{{"worker_type", "hop"}});
    });
}

class SlowWorker : public Worker {
public:
    SlowWorker(const std::string& name, std::atomic<bool>& finished)
        : Worker(name, "slow"), finished_(finished) {}

    WorkerResult run(const std::string&, const Value&, SharedContext&) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        finished_ = true;
        return WorkerResult::success({{"done", true}});
    }

private:
    std::atomic<bool>& finished_;
};

// Sleeps for inputs.sleep_ms and records the highest number of overlapping runs
class OverlapTrackingWorker : public Worker {
public:
    OverlapTrackingWorker(const std::string& name, std::atomic<int>& peak)
        : Worker(name, "overlap"), peak_(peak), active_(0), runs_(0) {}

    WorkerResult run(const std::string&, const Value& inputs, SharedContext&) override {
        int now = ++active_;
        int seen = peak_.load();
        while (now > seen && !peak_.compare_exchange_weak(seen, now)) {
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(inputs.value("sleep_ms", 0)));
        size_t run_number = ++runs_;
        --active_;
        return WorkerResult::success({{"runs", run_number}});
    }

private:
    std::atomic<int>& peak_;
    std::atomic<int> active_;
    size_t runs_;
};

class ThrowingWorker : public Worker {
public:
    ThrowingWorker(const std::string& name, bool domain_error)
        : Worker(name, "throwing"), domain_error_(domain_error) {}

    WorkerResult run(const std::string&, const Value&, SharedContext&) override {
        if (domain_error_) {
            throw WorkerExecutionError("ledger unavailable");
        }
        throw std::runtime_error("index out of range");
    }

private:
    bool domain_error_;
};

CapabilityCatalog test_catalog() {
    return CapabilityCatalog::load_from_string(R"({
      "computeCapabilities": [
        {"id": "ratio_calc", "agentType": "skill", "skillPlugin": "BasicCalculations"},
        {"id": "echo_cap", "agentType": "echo"},
        {"id": "quantum_cap", "agentType": "quantum"}
      ]
    })");
}

} // anonymous namespace

TEST_CASE("WorkerRegistry", "[lifecycle]") {
    WorkerRegistry registry;

    SECTION("Built-in types") {
        REQUIRE(registry.is_registered(WorkerType::ECHO));
        REQUIRE(registry.is_registered(WorkerType::SKILL));
        REQUIRE(registry.is_registered(WorkerType::CONTEXT_STORE));
        REQUIRE(registry.is_registered(WorkerType::RELAY));
        REQUIRE(registry.list_worker_types().size() == 4);
    }

    SECTION("Empty registry") {
        WorkerRegistry empty(false);
        REQUIRE(empty.list_worker_types().empty());
        REQUIRE_THROWS_AS(empty.create_worker("echo", WorkerCreationContext("e")), WorkerConstructionError);
    }

    SECTION("Registration errors") {
        auto factory = [](const WorkerCreationContext& ctx) { return std::make_unique<EchoWorker>(ctx.name); };
        REQUIRE_THROWS_AS(registry.register_worker("echo", factory), ConfigurationError);
        REQUIRE_THROWS_AS(registry.register_worker("", factory), ConfigurationError);
    }

    SECTION("Factory failures become construction errors") {
        registry.register_worker("broken", [](const WorkerCreationContext&) -> std::unique_ptr<Worker> {
            throw std::runtime_error("missing credentials");
        });
        registry.register_worker("null", [](const WorkerCreationContext&) -> std::unique_ptr<Worker> {
            return nullptr;
        });

        REQUIRE_THROWS_AS(registry.create_worker("broken", WorkerCreationContext("b")), WorkerConstructionError);
        REQUIRE_THROWS_AS(registry.create_worker("null", WorkerCreationContext("n")), WorkerConstructionError);
    }

    SECTION("Default skill comes from descriptor, then hints") {
        WorkerCreationContext ctx("analyst");
        ctx.hints = {{"default_skill", "Hinted"}};
        REQUIRE(ctx.default_skill() == "Hinted");

        CapabilityDescriptor descriptor;
        descriptor.default_skill = "BasicCalculations";
        ctx.descriptor = descriptor;
        REQUIRE(ctx.default_skill() == "BasicCalculations");
    }
}

TEST_CASE("Worker Creation and Caching", "[lifecycle]") {
    quiet();
    CapabilityCatalog catalog = test_catalog();
    WorkerRegistry registry;
    SkillRegistry skills;
    WorkerLifecycleManager manager(catalog, registry, &skills);

    SECTION("Catalog capability") {
        WorkerHandle first = manager.get_or_create("ratio_calc");
        REQUIRE(first.ok());
        REQUIRE(first.created);
        REQUIRE(first.worker->worker_type() == "skill");
        REQUIRE(first.worker->default_skill() == "BasicCalculations");
        REQUIRE(first.worker->is_attached());

        WorkerHandle second = manager.get_or_create("ratio_calc");
        REQUIRE(second.ok());
        REQUIRE_FALSE(second.created);
        REQUIRE(second.worker == first.worker);
        REQUIRE(manager.worker_count() == 1);
    }

    SECTION("Registered type used by name") {
        WorkerHandle handle = manager.get_or_create("echo");
        REQUIRE(handle.ok());
        REQUIRE(handle.worker->worker_type() == "echo");
        REQUIRE(manager.has_worker("echo"));
    }

    SECTION("Worker type from creation hints") {
        WorkerHandle handle = manager.get_or_create("scratch_store", {{"worker_type", "context_store"}});
        REQUIRE(handle.ok());
        REQUIRE(handle.worker->worker_type() == "context_store");
    }

    SECTION("Unknown capability") {
        WorkerHandle handle = manager.get_or_create("credit_oracle");
        REQUIRE_FALSE(handle.ok());
        REQUIRE(handle.error_kind == ErrorKind::CAPABILITY_NOT_FOUND);
        REQUIRE(handle.error_message.find("credit_oracle") != std::string::npos);
        REQUIRE(manager.worker_count() == 0);
    }

    SECTION("Catalog entry with an unregistered worker type") {
        WorkerHandle handle = manager.get_or_create("quantum_cap");
        REQUIRE_FALSE(handle.ok());
        REQUIRE(handle.error_kind == ErrorKind::WORKER_CONSTRUCTION);
        REQUIRE_FALSE(manager.has_worker("quantum_cap"));
    }

    SECTION("Invoke reuses the instance") {
        SharedContext context("cacm-1", "s");
        WorkerResult first = manager.invoke("echo_cap", "Echo", {{"in", "a"}}, context);
        WorkerResult second = manager.invoke("echo_cap", "Echo", {{"in", "b"}}, context);

        REQUIRE(first.status == ResultStatus::SUCCESS);
        REQUIRE(first.fields["invocation"] == 1);
        REQUIRE(second.fields["invocation"] == 2);
        REQUIRE(second.fields["echo"] == "b");
        REQUIRE(manager.list_workers().size() == 1);
    }

    SECTION("Invoke of an unknown capability") {
        SharedContext context("cacm-1", "s");
        WorkerResult result = manager.invoke("credit_oracle", "Score", Value::object(), context);
        REQUIRE(result.status == ResultStatus::ERROR);
        REQUIRE(result.error_kind == ErrorKind::CAPABILITY_NOT_FOUND);
    }
}

TEST_CASE("Lifecycle Config Validation", "[lifecycle]") {
    CapabilityCatalog catalog;
    WorkerRegistry registry;

    LifecycleConfig zero_depth;
    zero_depth.max_delegation_depth = 0;
    REQUIRE_THROWS_AS(WorkerLifecycleManager(catalog, registry, nullptr, zero_depth), ConfigurationError);

    LifecycleConfig negative_timeout;
    negative_timeout.timeout_ms = -5;
    REQUIRE_THROWS_AS(WorkerLifecycleManager(catalog, registry, nullptr, negative_timeout), ConfigurationError);
}

TEST_CASE("Delegation Guards", "[lifecycle]") {
    quiet();
    CapabilityCatalog catalog;
    WorkerRegistry registry;
    SharedContext context("cacm-1", "s");

    SECTION("Chain within the depth limit") {
        register_hops(registry, 3);
        WorkerLifecycleManager manager(catalog, registry, nullptr);

        WorkerResult result = manager.invoke("hop1", "Walk", Value::object(), context, {{"worker_type", "hop"}});
        REQUIRE(result.status == ResultStatus::SUCCESS);
        REQUIRE(result.fields["chain"] == Value::array({"hop1", "hop2", "hop3"}));
        REQUIRE(WorkerLifecycleManager::active_chain().empty());
    }

    SECTION("Depth limit") {
        register_hops(registry, 10);
        LifecycleConfig config;
        config.max_delegation_depth = 3;
        WorkerLifecycleManager manager(catalog, registry, nullptr, config);

        WorkerResult result = manager.invoke("hop1", "Walk", Value::object(), context, {{"worker_type", "hop"}});
        REQUIRE(result.status == ResultStatus::ERROR);
        REQUIRE(result.error_kind == ErrorKind::DELEGATION);
        REQUIRE(result.message == "Delegation depth limit (3) exceeded: hop1 -> hop2 -> hop3 -> hop4");
        REQUIRE_FALSE(manager.has_worker("hop4"));
    }

    SECTION("Cycle") {
        registry.register_worker("ping", [](const WorkerCreationContext& ctx) {
            return std::make_unique<PeerWorker>(ctx.name, "ping", "pong");
        });
        registry.register_worker("pong", [](const WorkerCreationContext& ctx) {
            return std::make_unique<PeerWorker>(ctx.name, "pong", "ping");
        });
        WorkerLifecycleManager manager(catalog, registry, nullptr);

        WorkerResult result = manager.invoke("ping", "Bounce", Value::object(), context);
        REQUIRE(result.status == ResultStatus::ERROR);
        REQUIRE(result.error_kind == ErrorKind::DELEGATION);
        REQUIRE(result.message == "Delegation cycle detected: ping -> pong -> ping");
        REQUIRE(manager.get_stats("ping").failed_runs == 2);
    }
}

TEST_CASE("Worker Exceptions Become Error Results", "[lifecycle]") {
    quiet();
    CapabilityCatalog catalog;
    WorkerRegistry registry;
    registry.register_worker("domain_failure", [](const WorkerCreationContext& ctx) {
        return std::make_unique<ThrowingWorker>(ctx.name, true);
    });
    registry.register_worker("unexpected_failure", [](const WorkerCreationContext& ctx) {
        return std::make_unique<ThrowingWorker>(ctx.name, false);
    });
    WorkerLifecycleManager manager(catalog, registry, nullptr);
    SharedContext context("cacm-1", "s");

    WorkerResult domain = manager.invoke("domain_failure", "t", Value::object(), context);
    REQUIRE(domain.status == ResultStatus::ERROR);
    REQUIRE(domain.error_kind == ErrorKind::WORKER_EXECUTION);
    REQUIRE(domain.message == "Execution failed: ledger unavailable");

    WorkerResult unexpected = manager.invoke("unexpected_failure", "t", Value::object(), context);
    REQUIRE(unexpected.status == ResultStatus::ERROR);
    REQUIRE(unexpected.message.find("index out of range") != std::string::npos);

    // A failed run leaves the cached instance usable
    REQUIRE(manager.has_worker("domain_failure"));
}

TEST_CASE("Step Timeout", "[lifecycle]") {
    quiet();
    CapabilityCatalog catalog;
    WorkerRegistry registry;
    std::atomic<bool> finished(false);
    registry.register_worker("slow", [&finished](const WorkerCreationContext& ctx) {
        return std::make_unique<SlowWorker>(ctx.name, finished);
    });

    LifecycleConfig config;
    config.timeout_ms = 50;
    WorkerLifecycleManager manager(catalog, registry, nullptr, config);
    SharedContext context("cacm-1", "s");

    SECTION("Slow worker is abandoned") {
        WorkerResult result = manager.invoke("slow", "Wait", Value::object(), context);
        REQUIRE(result.status == ResultStatus::ERROR);
        REQUIRE(result.error_kind == ErrorKind::TIMEOUT);
        REQUIRE(result.message == "Execution timeout after 50 ms");

        WorkerStats stats = manager.get_stats("slow");
        REQUIRE(stats.timeout_count == 1);
        REQUIRE(stats.failed_runs == 1);

        REQUIRE(manager.drain_abandoned() == 1);
        REQUIRE(finished);
        REQUIRE(manager.drain_abandoned() == 0);
    }

    SECTION("Fast worker completes under the timeout") {
        WorkerResult result = manager.invoke("echo", "Echo", {{"in", "x"}}, context);
        REQUIRE(result.status == ResultStatus::SUCCESS);
        REQUIRE(result.fields["echo"] == "x");
        REQUIRE(manager.drain_abandoned() == 0);
    }
}

TEST_CASE("Timed-Out Worker Is Not Re-entered", "[lifecycle]") {
    quiet();
    CapabilityCatalog catalog;
    WorkerRegistry registry;
    std::atomic<int> peak(0);
    registry.register_worker("overlap", [&peak](const WorkerCreationContext& ctx) {
        return std::make_unique<OverlapTrackingWorker>(ctx.name, peak);
    });

    LifecycleConfig config;
    config.timeout_ms = 50;
    WorkerLifecycleManager manager(catalog, registry, nullptr, config);
    SharedContext context("cacm-1", "s");

    WorkerResult first = manager.invoke("overlap", "Slow", {{"sleep_ms", 400}}, context);
    REQUIRE(first.error_kind == ErrorKind::TIMEOUT);
    REQUIRE(first.message == "Execution timeout after 50 ms");

    // The abandoned run still holds the cached instance
    WorkerResult second = manager.invoke("overlap", "Fast", {{"sleep_ms", 0}}, context);
    REQUIRE(second.status == ResultStatus::ERROR);
    REQUIRE(second.error_kind == ErrorKind::TIMEOUT);
    REQUIRE(second.message == "Worker 'overlap' is still running a timed-out invocation");
    REQUIRE(manager.worker_count() == 1);

    REQUIRE(manager.drain_abandoned() == 1);

    WorkerResult third = manager.invoke("overlap", "Fast", {{"sleep_ms", 0}}, context);
    REQUIRE(third.status == ResultStatus::SUCCESS);
    REQUIRE(third.fields["runs"] == 2);
    REQUIRE(peak == 1);

    WorkerStats stats = manager.get_stats("overlap");
    REQUIRE(stats.timeout_count == 2);
    REQUIRE(stats.successful_runs == 1);
}

TEST_CASE("Worker Statistics", "[lifecycle]") {
    quiet();
    CapabilityCatalog catalog = test_catalog();
    WorkerRegistry registry;
    WorkerLifecycleManager manager(catalog, registry, nullptr);
    SharedContext context("cacm-1", "s");

    REQUIRE(manager.get_stats("echo_cap").total_runs() == 0);

    manager.invoke("echo_cap", "Echo", {{"in", 1}}, context);
    manager.invoke("echo_cap", "Echo", {{"in", 2}}, context);
    manager.invoke("context_store", "Read", {{"operation", "get"}, {"key", "absent"}}, context);

    WorkerStats echo_stats = manager.get_stats("echo_cap");
    REQUIRE(echo_stats.successful_runs == 2);
    REQUIRE(echo_stats.total_runs() == 2);
    REQUIRE(echo_stats.average_execution_time_ms >= 0.0);

    REQUIRE(manager.get_stats("context_store").partial_runs == 1);
    REQUIRE(manager.get_all_stats().size() == 2);
}
