#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "schema.hpp"
#include "dataset.hpp"
#include "transaction.hpp"
#include "relation.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace relata {

// Symbolic adapter identifier, e.g. adapter_id{"memory"}.
// Plain strings passed to gateway::setup are treated as legacy connection URIs.
struct adapter_id {
    std::string name;

    explicit adapter_id(std::string n) : name(std::move(n)) {}
};

// Command class description handed to gateway::extend_command_class
struct command_class {
    std::string name;
    std::string relation;
    std::vector<std::string> extensions;
};

// ============================================================================
// Gateway
// ============================================================================
//
// Owns the connection to a backend and hands out its datasets. Concrete
// gateways declare their adapter identifier by overriding declared_adapter().

class gateway {
public:
    virtual ~gateway() = default;

    /// Resolve an adapter and construct its gateway with `args`
    /// (a JSON array; adapters with only a default constructor ignore it).
    /// Throws adapter_load_error if the adapter cannot be resolved.
    static std::shared_ptr<gateway> setup(const adapter_id& adapter,
                                          const nlohmann::json& args = nlohmann::json::array());

    /// Returns `instance` unchanged. Throws invalid_argument_error if `args` is not empty.
    static std::shared_ptr<gateway> setup(std::shared_ptr<gateway> instance,
                                          const nlohmann::json& args = nlohmann::json::array());

    /// URIs without an explicit adapter are not supported. Always throws invalid_argument_error.
    [[noreturn]] static std::shared_ptr<gateway> setup(const std::string& connection,
                                                       const nlohmann::json& args = nlohmann::json::array());

    /// Class-level adapter identifier. Throws missing_adapter_identifier_error if undeclared.
    std::string adapter() const;

    /// Adapter identifier declared by the concrete gateway class
    virtual std::optional<std::string> declared_adapter() const { return std::nullopt; }

    /// Opaque backend handle (type varies by adapter)
    const std::shared_ptr<void>& connection() const { return connection_; }

    // Datasets
    virtual std::shared_ptr<relata::dataset> dataset(const std::string& name) = 0;
    virtual bool dataset_exists(const std::string& name) const = 0;

    /// Finalize `definition` against this gateway and build a relation over its dataset
    relation relation_for(const std::shared_ptr<relation_definition>& definition);

    // Extension points. Base implementations are safe no-ops.
    virtual void use_logger(log_sink) {}
    virtual const log_sink* logger() const { return nullptr; }
    virtual command_class extend_command_class(command_class klass, const relata::dataset&) const { return klass; }

    /// Schema inference hook: names of datasets the backend knows about
    virtual std::vector<std::string> schema() const { return {}; }

    /// Attributes of a dataset, for inferred schemas
    virtual std::vector<attribute> infer_attributes(const std::string&) const { return {}; }

    virtual void disconnect() {}

    /// Runner used by transaction(); no_op_transaction_runner unless overridden
    virtual relata::transaction_runner& transaction_runner(const nlohmann::json& options);

    /// Run `block` inside a transaction. Returns the block's result, or
    /// std::nullopt if the runner rolled back (bool for blocks returning void).
    template<typename F>
    auto transaction(const nlohmann::json& options, F&& block);

    template<typename F>
    auto transaction(F&& block) {
        return transaction(nlohmann::json::object(), std::forward<F>(block));
    }

protected:
    std::shared_ptr<void> connection_;
};

// ============================================================================
// Adapter Registry
// ============================================================================
//
// Process-wide map of adapter identifier -> gateway factory. Populated at
// startup (register_adapter) or on first lookup (register_loader); read-only
// thereafter.

class adapter_registry {
public:
    using factory_fn = std::function<std::shared_ptr<gateway>(const nlohmann::json& args)>;
    using loader_fn = std::function<void(adapter_registry&)>;

    static adapter_registry& instance();

    template<typename G>
    void register_adapter(const std::string& id);

    void register_factory(const std::string& id, factory_fn factory);

    /// Deferred registration, run the first time `id` is resolved
    void register_loader(const std::string& id, loader_fn loader);

    bool key(const std::string& id) const;
    std::vector<std::string> names() const;

    /// Factory for `id`, running its loader if needed. Throws adapter_load_error.
    factory_fn resolve(const std::string& id);

    /// Drop registered factories (loaders are kept)
    void clear();

private:
    adapter_registry();

    mutable std::mutex mutex_;
    std::unordered_map<std::string, factory_fn> adapters_;
    std::unordered_map<std::string, loader_fn> loaders_;
};

// ============================================================================
// Template implementations
// ============================================================================

template<typename F>
auto gateway::transaction(const nlohmann::json& options, F&& block) {
    auto& runner = transaction_runner(options);

    if constexpr (std::is_invocable_v<F&, relata::transaction&>) {
        using result_t = std::invoke_result_t<F&, relata::transaction&>;
        if constexpr (std::is_void_v<result_t>) {
            auto outcome = runner.run(options, [&](relata::transaction& t) { block(t); });
            return outcome == transaction_result::committed;
        } else {
            std::optional<result_t> result;
            auto outcome = runner.run(options, [&](relata::transaction& t) { result.emplace(block(t)); });
            if (outcome == transaction_result::rolled_back) {
                return std::optional<result_t>{};
            }
            return result;
        }
    } else {
        return transaction(options, [&](relata::transaction&) { return block(); });
    }
}

template<typename G>
void adapter_registry::register_adapter(const std::string& id) {
    static_assert(std::is_base_of_v<gateway, G>, "adapters must derive from relata::gateway");

    if constexpr (std::is_constructible_v<G, const nlohmann::json&>) {
        register_factory(id, [](const nlohmann::json& args) -> std::shared_ptr<gateway> {
            return std::make_shared<G>(args);
        });
    } else {
        static_assert(std::is_default_constructible_v<G>,
                      "adapter gateways need a default or a JSON-arguments constructor");
        register_factory(id, [](const nlohmann::json&) -> std::shared_ptr<gateway> {
            return std::make_shared<G>();
        });
    }
}

} // namespace relata

#endif // __cplusplus
