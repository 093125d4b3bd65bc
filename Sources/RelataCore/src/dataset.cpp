#include "relata/dataset.hpp"
#include <algorithm>

namespace relata {

bool matches_restriction(const tuple_t& tuple, const restriction_t& criteria) {
    for (const auto& [field, allowed] : criteria) {
        auto it = tuple.find(field);
        if (it == tuple.end()) {
            return false;
        }
        if (std::find(allowed.begin(), allowed.end(), it->second) == allowed.end()) {
            return false;
        }
    }
    return true;
}

} // namespace relata
