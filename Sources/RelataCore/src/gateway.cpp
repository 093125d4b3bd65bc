#include "relata/gateway.hpp"
#include "relata/memory.hpp"
#include "relata/sqlite.hpp"
#include "relata/log.hpp"
#include <algorithm>

namespace relata {

// ============================================================================
// Transactions
// ============================================================================

no_op_transaction_runner& no_op_transaction_runner::instance() {
    static no_op_transaction_runner runner;
    return runner;
}

transaction_result no_op_transaction_runner::run(const nlohmann::json&, const block_t& block) {
    relata::transaction t;
    block(t);
    if (t.rollback_requested()) {
        LOG_WARN("transaction", "Rollback requested but this gateway has no transaction support; ignored");
    }
    return transaction_result::committed;
}

// ============================================================================
// gateway
// ============================================================================

std::shared_ptr<gateway> gateway::setup(const adapter_id& adapter, const nlohmann::json& args) {
    auto factory = adapter_registry::instance().resolve(adapter.name);
    LOG_INFO("gateway", "Setting up %s gateway", adapter.name.c_str());
    return factory(args.is_null() ? nlohmann::json::array() : args);
}

std::shared_ptr<gateway> gateway::setup(std::shared_ptr<gateway> instance, const nlohmann::json& args) {
    if (!args.is_null() && !args.empty()) {
        throw invalid_argument_error("Can't accept arguments when passing an instance");
    }
    if (!instance) {
        throw invalid_argument_error("gateway instance is null");
    }
    return instance;
}

std::shared_ptr<gateway> gateway::setup(const std::string& connection, const nlohmann::json&) {
    LOG_ERROR("gateway", "Rejected connection string without adapter: %s", connection.c_str());
    throw invalid_argument_error(
        "URIs without an explicit scheme are not supported anymore; "
        "use gateway::setup(adapter_id{...}, args) instead (got \"" + connection + "\")");
}

std::string gateway::adapter() const {
    auto declared = declared_adapter();
    if (!declared) {
        throw missing_adapter_identifier_error("gateway class is missing the adapter identifier");
    }
    return *declared;
}

relation gateway::relation_for(const std::shared_ptr<relation_definition>& definition) {
    if (!definition) {
        throw invalid_argument_error("relation definition is null");
    }
    definition->finalize(*this);
    return definition->build(dataset(definition->dataset_name()));
}

relata::transaction_runner& gateway::transaction_runner(const nlohmann::json&) {
    return no_op_transaction_runner::instance();
}

// ============================================================================
// adapter_registry
// ============================================================================

adapter_registry& adapter_registry::instance() {
    static adapter_registry registry;
    return registry;
}

adapter_registry::adapter_registry() {
    // Built-in adapters register themselves on first use
    loaders_["memory"] = [](adapter_registry& registry) {
        registry.register_adapter<memory::gateway>("memory");
    };
    loaders_["sqlite"] = [](adapter_registry& registry) {
        registry.register_adapter<sqlite::gateway>("sqlite");
    };
}

void adapter_registry::register_factory(const std::string& id, factory_fn factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    adapters_[id] = std::move(factory);
    LOG_DEBUG("adapter", "Registered adapter %s", id.c_str());
}

void adapter_registry::register_loader(const std::string& id, loader_fn loader) {
    std::lock_guard<std::mutex> lock(mutex_);
    loaders_[id] = std::move(loader);
}

bool adapter_registry::key(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return adapters_.count(id) != 0;
}

std::vector<std::string> adapter_registry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(adapters_.size());
    for (const auto& [id, _] : adapters_) {
        result.push_back(id);
    }
    std::sort(result.begin(), result.end());
    return result;
}

adapter_registry::factory_fn adapter_registry::resolve(const std::string& id) {
    loader_fn loader;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = adapters_.find(id);
        if (it != adapters_.end()) {
            return it->second;
        }
        auto loader_it = loaders_.find(id);
        if (loader_it != loaders_.end()) {
            loader = loader_it->second;
        }
    }

    if (!loader) {
        LOG_ERROR("adapter", "No adapter or loader registered for %s", id.c_str());
        throw adapter_load_error("Failed to load adapter relata/" + id);
    }

    // Loader registers through register_factory, so run it unlocked
    try {
        loader(*this);
    } catch (const std::exception& e) {
        LOG_ERROR("adapter", "Loader for %s failed: %s", id.c_str(), e.what());
        throw adapter_load_error("Failed to load adapter relata/" + id + ": " + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = adapters_.find(id);
    if (it == adapters_.end()) {
        throw adapter_load_error("Failed to load adapter relata/" + id + ": loader did not register it");
    }
    return it->second;
}

void adapter_registry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    adapters_.clear();
}

} // namespace relata
