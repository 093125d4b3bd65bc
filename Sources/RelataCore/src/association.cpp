#include "relata/association.hpp"
#include "relata/errors.hpp"

namespace relata {

bool association::matches(const tuple_t& parent, const tuple_t& child) const {
    auto p = parent.find(source_key);
    auto c = child.find(target_key);
    if (p == parent.end() || c == child.end()) {
        return false;
    }
    // NULL never joins
    if (is_null(p->second)) {
        return false;
    }
    return p->second == c->second;
}

association_set::association_set(std::vector<association> associations) {
    for (auto& assoc : associations) {
        add(std::move(assoc));
    }
}

const association& association_set::operator[](const std::string& name) const {
    auto* assoc = find(name);
    if (!assoc) {
        throw association_not_found_error("Association not defined: " + name);
    }
    return *assoc;
}

const association* association_set::find(const std::string& name) const {
    auto it = associations_.find(name);
    if (it == associations_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> association_set::names() const {
    std::vector<std::string> result;
    result.reserve(associations_.size());
    for (const auto& [name, _] : associations_) {
        result.push_back(name);
    }
    return result;
}

void association_set::add(association assoc) {
    std::string name = assoc.name;
    associations_[name] = std::move(assoc);
}

} // namespace relata
