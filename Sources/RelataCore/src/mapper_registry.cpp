#include "relata/mapper_registry.hpp"
#include "relata/errors.hpp"

namespace relata {

void mapper_registry::register_mapper(const std::string& name, mapper_t mapper) {
    mappers_[name] = std::move(mapper);
}

const mapper_t& mapper_registry::operator[](const std::string& name) const {
    auto it = mappers_.find(name);
    if (it == mappers_.end()) {
        throw invalid_argument_error("Mapper not registered: " + name);
    }
    return it->second;
}

std::vector<std::string> mapper_registry::names() const {
    std::vector<std::string> result;
    result.reserve(mappers_.size());
    for (const auto& [name, _] : mappers_) {
        result.push_back(name);
    }
    return result;
}

} // namespace relata
