#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace relata {

// ============================================================================
// Dataset Interface
// ============================================================================
//
// The raw tuple collection behind a relation. This is the entire surface a
// relation relies on; adapters with richer native operations expose them on
// their own dataset subclasses.
//
// Implementations: memory::dataset, sqlite::dataset.

class dataset {
public:
    virtual ~dataset() = default;

    using visitor = std::function<void(const tuple_t&)>;

    /// Snapshot of all tuples in dataset order. Each call re-reads the backing store.
    virtual std::shared_ptr<const tuple_list_t> read() const = 0;

    /// Append a tuple. No deduplication.
    virtual void insert(tuple_t tuple) = 0;

    virtual std::size_t size() const = 0;

    // Derived datasets (the receiver is never modified)
    virtual std::shared_ptr<dataset> restrict(const restriction_t& criteria) const = 0;
    virtual std::shared_ptr<dataset> project(const std::vector<std::string>& names) const = 0;
    virtual std::shared_ptr<dataset> order(const std::vector<std::string>& names) const = 0;

    /// Delete every tuple matching the criteria. Returns the number removed.
    virtual std::size_t remove(const restriction_t& criteria) = 0;

    void each(const visitor& fn) const {
        auto tuples = read();
        for (const auto& tuple : *tuples) {
            fn(tuple);
        }
    }
};

/// True if `tuple` satisfies every criterion (field value is one of the listed values)
bool matches_restriction(const tuple_t& tuple, const restriction_t& criteria);

} // namespace relata

#endif // __cplusplus
