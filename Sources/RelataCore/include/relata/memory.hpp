#pragma once

#ifdef __cplusplus

#include "dataset.hpp"
#include "gateway.hpp"
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace relata {
namespace memory {

// ============================================================================
// In-memory dataset
// ============================================================================
//
// Insertion-ordered tuples. Appends take the write lock; reads copy a
// snapshot under the read lock, so a visitor may insert while iterating.

class dataset : public relata::dataset {
public:
    dataset() = default;
    explicit dataset(tuple_list_t tuples) : tuples_(std::move(tuples)) {}

    std::shared_ptr<const tuple_list_t> read() const override;
    void insert(tuple_t tuple) override;
    std::size_t size() const override;

    std::shared_ptr<relata::dataset> restrict(const restriction_t& criteria) const override;
    std::shared_ptr<relata::dataset> project(const std::vector<std::string>& names) const override;
    std::shared_ptr<relata::dataset> order(const std::vector<std::string>& names) const override;
    std::size_t remove(const restriction_t& criteria) override;

private:
    mutable std::shared_mutex mutex_;
    tuple_list_t tuples_;
};

// ============================================================================
// Storage - named datasets of one memory gateway
// ============================================================================

class storage {
public:
    /// Register a fresh, empty dataset under `name`, replacing any prior one
    std::shared_ptr<dataset> create_dataset(const std::string& name);

    /// Dataset registered under `name`, created if absent. Lookup and
    /// creation happen under one lock, so racing callers share one dataset.
    std::shared_ptr<dataset> fetch_or_create(const std::string& name);

    /// nullptr if absent
    std::shared_ptr<dataset> operator[](const std::string& name) const;

    bool key(const std::string& name) const;
    std::size_t size() const;

    /// Dataset names, sorted
    std::vector<std::string> names() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<dataset>> datasets_;
};

// ============================================================================
// Memory gateway
// ============================================================================

class gateway : public relata::gateway {
public:
    gateway();

    std::optional<std::string> declared_adapter() const override { return std::string("memory"); }

    /// Existing dataset, or a new empty one registered under `name`
    std::shared_ptr<relata::dataset> dataset(const std::string& name) override;
    bool dataset_exists(const std::string& name) const override;

    std::vector<std::string> schema() const override { return storage_->names(); }

    memory::storage& storage() { return *storage_; }

private:
    std::shared_ptr<memory::storage> storage_;
};

} // namespace memory
} // namespace relata

#endif // __cplusplus
