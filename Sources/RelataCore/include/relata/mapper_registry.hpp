#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace relata {

class loaded;

// Output transform applied to a materialized relation
using mapper_t = std::function<tuple_list_t(const loaded&)>;

class mapper_registry {
public:
    mapper_registry() = default;
    explicit mapper_registry(std::map<std::string, mapper_t> mappers) : mappers_(std::move(mappers)) {}

    void register_mapper(const std::string& name, mapper_t mapper);

    /// Throws invalid_argument_error for unknown names
    const mapper_t& operator[](const std::string& name) const;

    bool key(const std::string& name) const { return mappers_.count(name) != 0; }
    std::size_t size() const { return mappers_.size(); }
    bool empty() const { return mappers_.empty(); }
    std::vector<std::string> names() const;

private:
    std::map<std::string, mapper_t> mappers_;
};

} // namespace relata

#endif // __cplusplus
