#include "relata/schema.hpp"
#include "relata/errors.hpp"
#include "relata/log.hpp"
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <unordered_set>

namespace relata {

namespace {

value_t coerce_to_integer(const value_t& value) {
    if (auto* d = std::get_if<double>(&value)) {
        // [-2^63, 2^63) is exactly the range that converts without overflow
        constexpr double lower = -9223372036854775808.0;
        constexpr double upper = 9223372036854775808.0;
        if (std::isfinite(*d) && *d >= lower && *d < upper) {
            return static_cast<int64_t>(*d);
        }
        return value;
    }
    if (auto* s = std::get_if<std::string>(&value)) {
        int64_t result = 0;
        const char* first = s->data();
        const char* last = s->data() + s->size();
        auto [ptr, ec] = std::from_chars(first, last, result);
        if (ec == std::errc() && ptr == last && !s->empty()) {
            return result;
        }
    }
    return value;
}

value_t coerce_to_real(const value_t& value) {
    if (auto* i = std::get_if<int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    if (auto* s = std::get_if<std::string>(&value)) {
        if (!s->empty()) {
            char* end = nullptr;
            double result = std::strtod(s->c_str(), &end);
            if (end == s->c_str() + s->size()) {
                return result;
            }
        }
    }
    return value;
}

value_t coerce_to_string(const value_t& value) {
    if (std::holds_alternative<int64_t>(value) || std::holds_alternative<double>(value)) {
        return value_to_string(value);
    }
    return value;
}

} // namespace

// ============================================================================
// Reference types
// ============================================================================

namespace types {

const attribute_type& integer() {
    static const attribute_type t{"Integer", value_kind::integer, nullptr};
    return t;
}

const attribute_type& real() {
    static const attribute_type t{"Real", value_kind::real, nullptr};
    return t;
}

const attribute_type& string() {
    static const attribute_type t{"String", value_kind::text, nullptr};
    return t;
}

const attribute_type& blob() {
    static const attribute_type t{"Blob", value_kind::blob, nullptr};
    return t;
}

const attribute_type& any() {
    static const attribute_type t{"Any", value_kind::any, nullptr};
    return t;
}

namespace coercible {

const attribute_type& integer() {
    static const attribute_type t{"Coercible::Integer", value_kind::integer, &coerce_to_integer};
    return t;
}

const attribute_type& real() {
    static const attribute_type t{"Coercible::Real", value_kind::real, &coerce_to_real};
    return t;
}

const attribute_type& string() {
    static const attribute_type t{"Coercible::String", value_kind::text, &coerce_to_string};
    return t;
}

} // namespace coercible

const attribute_type& for_kind(value_kind kind) {
    switch (kind) {
        case value_kind::integer: return integer();
        case value_kind::real: return real();
        case value_kind::text: return string();
        case value_kind::blob: return blob();
        case value_kind::any:
        default:
            return any();
    }
}

} // namespace types

// ============================================================================
// schema
// ============================================================================

schema::schema(std::string name, std::vector<attribute> attributes, association_set associations)
    : name_(std::move(name)), associations_(std::move(associations)) {
    set_attributes(std::move(attributes));
}

schema schema::infer(std::string name, association_set associations) {
    schema s(std::move(name), {}, std::move(associations));
    s.inferred_ = true;
    s.finalized_ = false;
    return s;
}

void schema::set_attributes(std::vector<attribute> attributes) {
    std::unordered_set<std::string> seen;
    for (const auto& attr : attributes) {
        if (!seen.insert(attr.name).second) {
            throw invalid_argument_error("Duplicate attribute in schema " + name_ + ": " + attr.name);
        }
    }
    attributes_ = std::move(attributes);
}

schema& schema::finalize(std::vector<attribute> inferred) {
    if (finalized_) {
        return *this;
    }
    set_attributes(std::move(inferred));
    finalized_ = true;
    LOG_DEBUG("schema", "Finalized inferred schema %s with %zu attributes", name_.c_str(), attributes_.size());
    return *this;
}

void schema::require_finalized(const char* operation) const {
    if (!finalized_) {
        throw configuration_error(std::string(operation) + " called on schema " + name_ +
                                  " before inference was finalized");
    }
}

bool schema::any_read() const {
    for (const auto& attr : attributes_) {
        if (attr.read()) return true;
    }
    return false;
}

const attribute& schema::operator[](const std::string& name) const {
    auto* attr = find(name);
    if (!attr) {
        throw attribute_not_found_error("Attribute not defined in schema " + name_ + ": " + name);
    }
    return *attr;
}

const attribute* schema::find(const std::string& name) const {
    for (const auto& attr : attributes_) {
        if (attr.name == name) return &attr;
    }
    return nullptr;
}

std::vector<std::string> schema::attribute_names() const {
    std::vector<std::string> names;
    names.reserve(attributes_.size());
    for (const auto& attr : attributes_) {
        names.push_back(attr.name);
    }
    return names;
}

std::vector<std::string> schema::primary_key() const {
    std::vector<std::string> keys;
    for (const auto& attr : attributes_) {
        if (attr.primary_key) keys.push_back(attr.name);
    }
    return keys;
}

tuple_fn schema::to_command_hash() const {
    require_finalized("to_command_hash");
    auto attributes = attributes_;
    return [attributes](const tuple_t& input) {
        tuple_t output;
        for (const auto& attr : attributes) {
            auto it = input.find(attr.name);
            if (it == input.end()) continue;
            output.emplace(attr.name, attr.type(it->second));
        }
        return output;
    };
}

tuple_fn schema::to_relation_hash() const {
    require_finalized("to_relation_hash");
    std::vector<attribute> readers;
    for (const auto& attr : attributes_) {
        if (attr.read()) readers.push_back(attr);
    }
    return [readers](const tuple_t& input) {
        tuple_t output = input;
        for (const auto& attr : readers) {
            auto it = output.find(attr.name);
            if (it == output.end()) continue;
            it->second = (*attr.read_type)(it->second);
        }
        return output;
    };
}

schema schema::project(const std::vector<std::string>& names) const {
    require_finalized("project");
    std::vector<attribute> projected;
    projected.reserve(names.size());
    for (const auto& name : names) {
        projected.push_back((*this)[name]);
    }
    return schema(name_, std::move(projected), associations_);
}

schema schema::rename(std::string name) const {
    schema copy = *this;
    copy.name_ = std::move(name);
    return copy;
}

} // namespace relata
