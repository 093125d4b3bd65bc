#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <string>
#include <vector>
#include <map>

namespace relata {

enum class association_kind {
    one_to_many,   // users -> tasks (tasks.user_id = users.id)
    many_to_one    // tasks -> user  (users.id = tasks.user_id)
};

// Named relationship between two relations.
// Resolution (which relation a target name maps to) is left to the caller;
// this only describes the keys to join on.
struct association {
    std::string name;
    association_kind kind = association_kind::one_to_many;
    std::string source;       // relation the association is declared on
    std::string target;       // relation being associated
    std::string source_key;   // key read from source tuples
    std::string target_key;   // key matched in target tuples

    /// Key-equality rule: does `child` (a target tuple) belong to `parent` (a source tuple)?
    bool matches(const tuple_t& parent, const tuple_t& child) const;
};

class association_set {
public:
    association_set() = default;
    explicit association_set(std::vector<association> associations);

    /// Throws association_not_found_error if absent
    const association& operator[](const std::string& name) const;
    const association* find(const std::string& name) const;

    bool key(const std::string& name) const { return associations_.count(name) != 0; }
    std::size_t size() const { return associations_.size(); }
    bool empty() const { return associations_.empty(); }
    std::vector<std::string> names() const;

    void add(association assoc);

private:
    std::map<std::string, association> associations_;
};

} // namespace relata

#endif // __cplusplus
