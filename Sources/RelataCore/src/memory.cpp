#include "relata/memory.hpp"
#include "relata/log.hpp"
#include <algorithm>

namespace relata {
namespace memory {

namespace {

// Orders values by storage class first (null < integer < real < text < blob)
bool value_less(const value_t& lhs, const value_t& rhs) {
    if (lhs.index() != rhs.index()) {
        return lhs.index() < rhs.index();
    }
    return std::visit([&](auto&& l) -> bool {
        using T = std::decay_t<decltype(l)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return false;
        } else {
            return l < std::get<T>(rhs);
        }
    }, lhs);
}

const value_t& field_or_null(const tuple_t& tuple, const std::string& name) {
    static const value_t null_value = nullptr;
    auto it = tuple.find(name);
    return it == tuple.end() ? null_value : it->second;
}

} // namespace

// ============================================================================
// dataset
// ============================================================================

std::shared_ptr<const tuple_list_t> dataset::read() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return std::make_shared<const tuple_list_t>(tuples_);
}

void dataset::insert(tuple_t tuple) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    tuples_.push_back(std::move(tuple));
}

std::size_t dataset::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tuples_.size();
}

std::shared_ptr<relata::dataset> dataset::restrict(const restriction_t& criteria) const {
    tuple_list_t result;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& tuple : tuples_) {
            if (matches_restriction(tuple, criteria)) {
                result.push_back(tuple);
            }
        }
    }
    return std::make_shared<dataset>(std::move(result));
}

std::shared_ptr<relata::dataset> dataset::project(const std::vector<std::string>& names) const {
    tuple_list_t result;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        result.reserve(tuples_.size());
        for (const auto& tuple : tuples_) {
            tuple_t projected;
            for (const auto& name : names) {
                auto it = tuple.find(name);
                if (it != tuple.end()) {
                    projected.emplace(it->first, it->second);
                }
            }
            result.push_back(std::move(projected));
        }
    }
    return std::make_shared<dataset>(std::move(result));
}

std::shared_ptr<relata::dataset> dataset::order(const std::vector<std::string>& names) const {
    tuple_list_t result = *read();
    std::stable_sort(result.begin(), result.end(), [&](const tuple_t& a, const tuple_t& b) {
        for (const auto& name : names) {
            const auto& lhs = field_or_null(a, name);
            const auto& rhs = field_or_null(b, name);
            if (value_less(lhs, rhs)) return true;
            if (value_less(rhs, lhs)) return false;
        }
        return false;
    });
    return std::make_shared<dataset>(std::move(result));
}

std::size_t dataset::remove(const restriction_t& criteria) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto before = tuples_.size();
    tuples_.erase(std::remove_if(tuples_.begin(), tuples_.end(),
                                 [&](const tuple_t& tuple) { return matches_restriction(tuple, criteria); }),
                  tuples_.end());
    return before - tuples_.size();
}

// ============================================================================
// storage
// ============================================================================

std::shared_ptr<dataset> storage::create_dataset(const std::string& name) {
    auto created = std::make_shared<dataset>();
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = datasets_.insert_or_assign(name, created);
    if (!inserted) {
        LOG_DEBUG("memory", "Replaced dataset %s with an empty one", name.c_str());
    } else {
        LOG_DEBUG("memory", "Created dataset %s", name.c_str());
    }
    return it->second;
}

std::shared_ptr<dataset> storage::fetch_or_create(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = datasets_.find(name);
    if (it == datasets_.end()) {
        it = datasets_.emplace(name, std::make_shared<dataset>()).first;
        LOG_DEBUG("memory", "Created dataset %s", name.c_str());
    }
    return it->second;
}

std::shared_ptr<dataset> storage::operator[](const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = datasets_.find(name);
    if (it == datasets_.end()) {
        return nullptr;
    }
    return it->second;
}

bool storage::key(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return datasets_.count(name) != 0;
}

std::size_t storage::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return datasets_.size();
}

std::vector<std::string> storage::names() const {
    std::vector<std::string> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(datasets_.size());
        for (const auto& [name, _] : datasets_) {
            result.push_back(name);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

// ============================================================================
// gateway
// ============================================================================

gateway::gateway() : storage_(std::make_shared<memory::storage>()) {
    connection_ = storage_;
}

std::shared_ptr<relata::dataset> gateway::dataset(const std::string& name) {
    return storage_->fetch_or_create(name);
}

bool gateway::dataset_exists(const std::string& name) const {
    return storage_->key(name);
}

} // namespace memory
} // namespace relata
