#pragma once

#ifdef __cplusplus

#include <functional>
#include <nlohmann/json.hpp>

namespace relata {

// Handle passed to a transaction block
class transaction {
public:
    /// Ask the runner to roll back once the block returns.
    /// Runners without transactional semantics (no_op_transaction_runner) ignore this.
    void rollback() { rollback_requested_ = true; }
    bool rollback_requested() const { return rollback_requested_; }

private:
    bool rollback_requested_ = false;
};

// Outcome reported by a runner. Rollback is a result, not an exception.
enum class transaction_result {
    committed,
    rolled_back
};

// ============================================================================
// Transaction Runner Interface
// ============================================================================
//
// Adapter-specific begin/commit/rollback. Isolation, nesting and retry are
// whatever the implementation makes them; relata imposes none.
//
// Implementations: no_op_transaction_runner, sqlite::transaction_runner.

class transaction_runner {
public:
    virtual ~transaction_runner() = default;

    using block_t = std::function<void(transaction&)>;

    /// Run `block` once. Exceptions from the block propagate to the caller.
    virtual transaction_result run(const nlohmann::json& options, const block_t& block) = 0;
};

// Default runner: yields once, never rolls back, provides no atomicity.
class no_op_transaction_runner : public transaction_runner {
public:
    static no_op_transaction_runner& instance();

    transaction_result run(const nlohmann::json& options, const block_t& block) override;
};

} // namespace relata

#endif // __cplusplus
