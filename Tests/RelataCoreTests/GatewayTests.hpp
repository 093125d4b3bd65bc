#pragma once

#include <RelataCore.hpp>
#include <nlohmann/json.hpp>
#include "TestSupport.hpp"
#include <algorithm>
#include <cassert>
#include <iostream>
#include <stdexcept>

namespace gateway_tests {

// Gateway that never declares an adapter identifier
class anonymous_gateway : public relata::gateway {
public:
    std::shared_ptr<relata::dataset> dataset(const std::string& name) override {
        return storage_.create_dataset(name);
    }
    bool dataset_exists(const std::string& name) const override { return storage_.key(name); }

private:
    relata::memory::storage storage_;
};

// Gateway whose constructor takes the setup arguments
class recording_gateway : public anonymous_gateway {
public:
    explicit recording_gateway(const nlohmann::json& args) : args_(args) {}

    std::optional<std::string> declared_adapter() const override { return std::string("recording"); }

    const nlohmann::json& args() const { return args_; }

private:
    nlohmann::json args_;
};

// ============================================================================
// test_setup_with_adapter_id: resolves built-ins on first use
// ============================================================================

void test_setup_with_adapter_id() {
    std::cout << "  test_setup_with_adapter_id..." << std::flush;

    auto gw = relata::gateway::setup(relata::adapter_id{"memory"});
    assert(gw != nullptr);
    assert(gw->adapter() == "memory");
    assert(dynamic_cast<relata::memory::gateway*>(gw.get()) != nullptr);
    assert(relata::adapter_registry::instance().key("memory"));

    // Default-constructed adapters ignore arguments
    auto with_args = relata::gateway::setup(relata::adapter_id{"memory"}, nlohmann::json::array({1, "two"}));
    assert(with_args->adapter() == "memory");
    assert(with_args != gw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_setup_missing_adapter: unresolvable ids are adapter load errors
// ============================================================================

void test_setup_missing_adapter() {
    std::cout << "  test_setup_missing_adapter..." << std::flush;

    bool threw = false;
    try {
        relata::gateway::setup(relata::adapter_id{"missing_adapter"});
    } catch (const relata::adapter_load_error& e) {
        threw = true;
        assert(std::string(e.what()).find("relata/missing_adapter") != std::string::npos);
    }
    assert(threw);

    // Also a configuration error
    threw = false;
    try {
        relata::gateway::setup(relata::adapter_id{"missing_adapter"});
    } catch (const relata::configuration_error&) {
        threw = true;
    }
    assert(threw);

    auto& registry = relata::adapter_registry::instance();

    registry.register_loader("broken", [](relata::adapter_registry&) {
        throw std::runtime_error("module not found");
    });
    threw = false;
    try {
        relata::gateway::setup(relata::adapter_id{"broken"});
    } catch (const relata::adapter_load_error& e) {
        threw = true;
        assert(std::string(e.what()).find("module not found") != std::string::npos);
    }
    assert(threw);

    // Loader that runs but registers nothing
    registry.register_loader("silent", [](relata::adapter_registry&) {});
    threw = false;
    try {
        relata::gateway::setup(relata::adapter_id{"silent"});
    } catch (const relata::adapter_load_error&) {
        threw = true;
    }
    assert(threw);
    assert(!registry.key("silent"));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_setup_with_instance: instances pass through, extra args are rejected
// ============================================================================

void test_setup_with_instance() {
    std::cout << "  test_setup_with_instance..." << std::flush;

    std::shared_ptr<relata::gateway> existing = std::make_shared<relata::memory::gateway>();
    auto same = relata::gateway::setup(existing);
    assert(same == existing);

    bool threw = false;
    try {
        relata::gateway::setup(existing, nlohmann::json::array({"extra"}));
    } catch (const relata::invalid_argument_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_setup_rejects_connection_string: no scheme inference
// ============================================================================

void test_setup_rejects_connection_string() {
    std::cout << "  test_setup_rejects_connection_string..." << std::flush;

    bool threw = false;
    try {
        relata::gateway::setup(std::string("sqlite::memory"));
    } catch (const relata::invalid_argument_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        relata::gateway::setup("memory");
    } catch (const relata::invalid_argument_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_adapter_identifier: declared ids are stable, missing ids throw
// ============================================================================

void test_adapter_identifier() {
    std::cout << "  test_adapter_identifier..." << std::flush;

    anonymous_gateway anonymous;
    bool threw = false;
    try {
        anonymous.adapter();
    } catch (const relata::missing_adapter_identifier_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        anonymous.adapter();
    } catch (const relata::configuration_error&) {
        threw = true;
    }
    assert(threw);

    recording_gateway declared(nlohmann::json::array());
    assert(declared.adapter() == "recording");
    assert(declared.adapter() == "recording");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_registered_adapter_arguments: JSON constructors receive the args
// ============================================================================

void test_registered_adapter_arguments() {
    std::cout << "  test_registered_adapter_arguments..." << std::flush;

    auto& registry = relata::adapter_registry::instance();
    registry.register_adapter<recording_gateway>("recording");
    assert(registry.key("recording"));

    auto gw = relata::gateway::setup(relata::adapter_id{"recording"}, nlohmann::json::array({"db", 3}));
    auto* recording = dynamic_cast<recording_gateway*>(gw.get());
    assert(recording != nullptr);
    assert(recording->args().size() == 2);
    assert(recording->args()[0] == "db");
    assert(recording->args()[1] == 3);

    // Factories registered directly
    std::size_t built = 0;
    registry.register_factory("counted", [&](const nlohmann::json&) -> std::shared_ptr<relata::gateway> {
        ++built;
        return std::make_shared<relata::memory::gateway>();
    });
    relata::gateway::setup(relata::adapter_id{"counted"});
    relata::gateway::setup(relata::adapter_id{"counted"});
    assert(built == 2);

    auto names = registry.names();
    assert(std::find(names.begin(), names.end(), "recording") != names.end());

    // clear() drops factories; built-in loaders still resolve
    registry.clear();
    assert(!registry.key("memory"));
    assert(!registry.key("counted"));
    assert(relata::gateway::setup(relata::adapter_id{"memory"})->adapter() == "memory");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_extension_point_defaults: base hooks are safe no-ops
// ============================================================================

void test_extension_point_defaults() {
    std::cout << "  test_extension_point_defaults..." << std::flush;

    anonymous_gateway gw;
    assert(gw.logger() == nullptr);
    gw.use_logger([](relata::log_level, const std::string&) {});
    assert(gw.logger() == nullptr);

    assert(gw.schema().empty());
    assert(gw.infer_attributes("users").empty());
    assert(gw.connection() == nullptr);

    relata::command_class klass{"CreateUser", "users", {}};
    auto extended = gw.extend_command_class(klass, *gw.dataset("users"));
    assert(extended.name == "CreateUser");
    assert(extended.relation == "users");

    gw.disconnect();
    assert(gw.dataset_exists("users"));

    assert(&gw.transaction_runner(nlohmann::json::object()) == &relata::no_op_transaction_runner::instance());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_log_level: one process-wide level shared by every translation unit
// ============================================================================

void test_log_level() {
    std::cout << "  test_log_level..." << std::flush;

    auto previous = relata::get_log_level();
    relata::set_log_level(relata::log_level::warn);
    assert(relata::get_log_level() == relata::log_level::warn);
    assert(&relata::current_log_level() == &relata::current_log_level());
    assert(relata::current_log_level().load() == relata::log_level::warn);

    // Below the threshold nothing is written, above it the macro still runs
    LOG_INFO("test", "suppressed %d", 1);
    LOG_ERROR("test", "expected error output %s", "from test_log_level");

    relata::set_log_level(previous);
    assert(relata::get_log_level() == previous);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_no_op_transaction: yields once and returns the block's value
// ============================================================================

void test_no_op_transaction() {
    std::cout << "  test_no_op_transaction..." << std::flush;

    auto gw = relata::gateway::setup(relata::adapter_id{"memory"});

    int calls = 0;
    auto result = gw->transaction([&](relata::transaction&) {
        ++calls;
        return 42;
    });
    assert(calls == 1);
    assert(result.has_value() && *result == 42);

    // Rollback requests are ignored: no atomicity here
    auto users = gw->dataset("users");
    calls = 0;
    auto kept = gw->transaction(nlohmann::json{{"mode", "immediate"}}, [&](relata::transaction& t) {
        ++calls;
        users->insert({{"id", test_support::val(1)}});
        t.rollback();
        return std::string("done");
    });
    assert(calls == 1);
    assert(kept.has_value() && *kept == "done");
    assert(users->size() == 1);

    // Blocks without a transaction parameter, and void blocks
    calls = 0;
    auto plain = gw->transaction([&] { ++calls; return 7; });
    assert(plain && *plain == 7);
    bool committed = gw->transaction([&](relata::transaction&) { ++calls; });
    assert(committed);
    assert(calls == 2);

    // Exceptions from the block propagate unchanged
    bool threw = false;
    try {
        gw->transaction([&](relata::transaction&) -> int {
            ++calls;
            throw std::logic_error("boom");
        });
    } catch (const std::logic_error& e) {
        threw = std::string(e.what()) == "boom";
    }
    assert(threw);
    assert(calls == 3);

    std::cout << " OK" << std::endl;
}

} // namespace gateway_tests
