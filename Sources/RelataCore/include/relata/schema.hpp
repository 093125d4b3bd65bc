#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "association.hpp"
#include <string>
#include <vector>
#include <functional>
#include <optional>

namespace relata {

// Storage class of an attribute type
enum class value_kind {
    integer,
    real,
    text,
    blob,
    any
};

// Attribute type: a name plus the coercion it applies to a value.
// Nominal types have no coercion and pass values through untouched.
struct attribute_type {
    std::string name;
    value_kind kind = value_kind::any;
    std::function<value_t(const value_t&)> coerce;

    value_t operator()(const value_t& value) const {
        return coerce ? coerce(value) : value;
    }

    bool operator==(const attribute_type& other) const { return name == other.name; }
    bool operator!=(const attribute_type& other) const { return name != other.name; }
};

namespace types {
    const attribute_type& integer();
    const attribute_type& real();
    const attribute_type& string();
    const attribute_type& blob();
    const attribute_type& any();

    // Coercible types convert compatible values (e.g. "1" -> 1) and leave
    // anything they cannot convert unchanged.
    namespace coercible {
        const attribute_type& integer();
        const attribute_type& real();
        const attribute_type& string();
    }

    // Reference type for a storage class (used by schema inference)
    const attribute_type& for_kind(value_kind kind);
} // namespace types

struct attribute {
    std::string name;
    attribute_type type;
    std::optional<attribute_type> read_type;    // decode-time type, if distinct
    std::optional<std::string> source;          // relation this attribute was taken from
    bool primary_key = false;
    std::optional<std::string> foreign_key;     // referenced relation

    bool read() const { return read_type.has_value(); }
};

// Declarative set of typed attributes. Produces the write-path (command hash)
// and read-path (relation hash) coercion functions used by relation.
//
// An explicit schema is finalized on construction. An inferred schema
// (schema::infer) stays empty until finalize() supplies its attributes;
// after that it never changes.
class schema {
public:
    schema() = default;
    schema(std::string name, std::vector<attribute> attributes, association_set associations = {});

    static schema infer(std::string name, association_set associations = {});

    const std::string& name() const { return name_; }
    bool empty() const { return attributes_.empty(); }
    std::size_t size() const { return attributes_.size(); }
    bool any_read() const;

    bool inferred() const { return inferred_; }
    bool finalized() const { return finalized_; }

    /// Complete inference. No-op for explicit or already-finalized schemas.
    schema& finalize(std::vector<attribute> inferred = {});

    /// Throws attribute_not_found_error if absent
    const attribute& operator[](const std::string& name) const;
    const attribute* find(const std::string& name) const;

    std::vector<attribute>::const_iterator begin() const { return attributes_.begin(); }
    std::vector<attribute>::const_iterator end() const { return attributes_.end(); }

    std::vector<std::string> attribute_names() const;
    std::vector<std::string> primary_key() const;

    const association_set& associations() const { return associations_; }

    // Write path: declared attributes only, each coerced by its type
    tuple_fn to_command_hash() const;

    // Read path: read types applied, every other field passed through
    tuple_fn to_relation_hash() const;

    /// Derived schema with only the named attributes, in the given order.
    /// Throws attribute_not_found_error for unknown names.
    schema project(const std::vector<std::string>& names) const;

    /// Same attributes under another name (views that keep every attribute)
    schema rename(std::string name) const;

private:
    std::string name_;
    std::vector<attribute> attributes_;
    association_set associations_;
    bool inferred_ = false;
    bool finalized_ = true;

    void set_attributes(std::vector<attribute> attributes);
    void require_finalized(const char* operation) const;
};

} // namespace relata

#endif // __cplusplus
