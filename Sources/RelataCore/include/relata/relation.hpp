#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"
#include "schema.hpp"
#include "association.hpp"
#include "dataset.hpp"
#include "mapper_registry.hpp"
#include <nlohmann/json_fwd.hpp>
#include <cstddef>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace relata {

class gateway;
class loaded;
class relation;
class curried;
class composite;
class graph;
class relation_definition;
struct view_definition;

using loaded_ptr = std::shared_ptr<const loaded>;

// Result of applying arguments to a view: the invoked relation once the
// view's arity is reached, otherwise a curried view holding them.
using applied_view = std::variant<relation, curried>;

// Positional view argument: a value, a list of values, or a loaded parent
// (the latter is what graph nodes receive).
using argument_t = std::variant<value_t, value_list_t, loaded_ptr>;
using arguments_t = std::vector<argument_t>;

/// Values carried by an argument. Throws invalid_argument_error for a loaded parent.
value_list_t argument_values(const argument_t& arg);

/// Loaded parent carried by an argument. Throws invalid_argument_error otherwise.
const loaded& argument_loaded(const argument_t& arg);

using schema_map = std::map<std::string, std::shared_ptr<const schema>>;

// ============================================================================
// Materializable - capability shared by every relation shape
// ============================================================================
//
// relation, curried, composite, graph and loaded all implement it. Generic
// code branches on is_curried()/is_graph() instead of inspecting types.

class materializable {
public:
    virtual ~materializable() = default;

    /// Force full materialization
    virtual loaded call() const = 0;

    /// Evaluate as a graph node against the parent's loaded tuples (as a whole).
    /// Relations that don't depend on the parent just call().
    virtual loaded call_with(const loaded& parent) const;

    virtual bool is_curried() const { return false; }
    virtual bool is_graph() const { return false; }

    virtual const std::string& name() const = 0;

    virtual std::shared_ptr<const materializable> clone() const = 0;

    tuple_list_t to_a() const;
};

// Pipeline composition. Nothing is evaluated until the composite is called.
composite operator>>(const materializable& left, mapper_t right);
composite operator>>(const materializable& left, const curried& right);

// ============================================================================
// Loaded - immutable materialized snapshot
// ============================================================================

class loaded : public materializable {
public:
    loaded();
    explicit loaded(tuple_list_t collection,
                    std::shared_ptr<const relation> source = nullptr,
                    std::vector<loaded> nodes = {});
    loaded(std::shared_ptr<const tuple_list_t> collection,
           std::shared_ptr<const relation> source,
           std::vector<loaded> nodes = {});

    loaded call() const override { return *this; }
    loaded call_with(const loaded&) const override { return *this; }
    const std::string& name() const override { return name_; }
    std::shared_ptr<const materializable> clone() const override;

    const tuple_list_t& collection() const { return *collection_; }
    const std::shared_ptr<const tuple_list_t>& shared_collection() const { return collection_; }

    /// Relation this was loaded from. Informational only, never re-read.
    const std::shared_ptr<const relation>& source() const { return source_; }

    // Child results when produced by a graph, in node order
    const std::vector<loaded>& nodes() const { return nodes_; }
    const loaded& node(const std::string& name) const;

    tuple_list_t::const_iterator begin() const { return collection_->begin(); }
    tuple_list_t::const_iterator end() const { return collection_->end(); }

    void for_each(const dataset::visitor& fn) const;

    std::size_t size() const { return collection_->size(); }
    bool empty() const { return collection_->empty(); }

    /// nullopt when empty; throws tuple_count_mismatch_error for more than one tuple
    std::optional<tuple_t> one() const;

    /// Exactly one tuple or tuple_count_mismatch_error
    tuple_t one_or_throw() const;

    value_list_t pluck(const std::string& key) const;

    /// Values of the source schema's primary key
    value_list_t primary_keys() const;

    nlohmann::json to_json() const;

private:
    std::shared_ptr<const tuple_list_t> collection_;
    std::shared_ptr<const relation> source_;
    std::string name_;
    std::vector<loaded> nodes_;
};

// ============================================================================
// Tuple sequence - lazy, restartable iteration over a relation
// ============================================================================
//
// Every begin() re-reads the dataset; tuples are decoded as they are reached.

class tuple_sequence {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = tuple_t;
        using difference_type = std::ptrdiff_t;
        using pointer = const tuple_t*;
        using reference = const tuple_t&;

        iterator() = default;
        iterator(std::shared_ptr<const tuple_list_t> raw, std::shared_ptr<const tuple_fn> read);

        reference operator*() const;
        pointer operator->() const { return &**this; }
        iterator& operator++();
        iterator operator++(int);

        bool operator==(const iterator& other) const;
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        std::shared_ptr<const tuple_list_t> raw_;
        std::shared_ptr<const tuple_fn> read_;
        std::size_t pos_ = 0;
        mutable std::optional<tuple_t> current_;

        bool at_end() const { return !raw_ || pos_ >= raw_->size(); }
    };

    tuple_sequence(std::shared_ptr<const dataset> source, std::shared_ptr<const tuple_fn> read);

    iterator begin() const;
    iterator end() const { return iterator(); }

    tuple_list_t to_a() const;

private:
    std::shared_ptr<const dataset> source_;
    std::shared_ptr<const tuple_fn> read_;
};

// ============================================================================
// Relation
// ============================================================================

struct relation_options {
    std::shared_ptr<const relata::schema> schema;
    std::shared_ptr<const mapper_registry> mappers;
    tuple_fn schema_hash;   // write coercion
    tuple_fn read_schema;   // read coercion
    std::shared_ptr<const relation_definition> definition;
};

// Options merged over an existing set by relation::new_with / relation::with.
// Unset members keep the current value.
struct relation_overrides {
    std::shared_ptr<const relata::schema> schema;
    std::shared_ptr<const mapper_registry> mappers;
    tuple_fn schema_hash;
    tuple_fn read_schema;
    std::shared_ptr<const relation_definition> definition;

    bool empty() const {
        return !schema && !mappers && !schema_hash && !read_schema && !definition;
    }
};

class relation : public materializable {
public:
    using read_fn_ptr = tuple_t (*)(const tuple_t&);

    /// Read coercion used when no attribute declares a read type
    static tuple_t noop_read_schema(const tuple_t& tuple) { return tuple; }

    explicit relation(std::shared_ptr<relata::dataset> dataset, relation_options opts = {});

    loaded call() const override;
    const std::string& name() const override { return name_; }
    std::shared_ptr<const materializable> clone() const override;

    const std::shared_ptr<relata::dataset>& dataset() const { return dataset_; }
    const relata::schema& schema() const { return *options_.schema; }
    const relation_options& options() const { return options_; }
    const mapper_registry& mappers() const { return *options_.mappers; }
    const tuple_fn& schema_hash() const { return options_.schema_hash; }
    const tuple_fn& read_schema() const { return options_.read_schema; }

    /// Attribute type lookup. Throws attribute_not_found_error.
    const attribute_type& operator[](const std::string& name) const;
    const attribute_type& attribute(const std::string& name) const { return (*this)[name]; }

    /// Lazy, restartable sequence of decoded tuples
    tuple_sequence each() const;

    /// Eager iteration of decoded tuples
    void for_each(const relata::dataset::visitor& fn) const;

    tuple_sequence::iterator begin() const { return each().begin(); }
    tuple_sequence::iterator end() const { return tuple_sequence::iterator(); }

    tuple_list_t to_a() const;

    /// Graph with this relation as root. No data is accessed.
    template<typename... Nodes>
    graph combine(const Nodes&... nodes) const;
    graph combine_nodes(std::vector<std::shared_ptr<const materializable>> nodes) const;

    /// Same options (or overrides merged over them) with another dataset
    relation new_with(std::shared_ptr<relata::dataset> dataset, const relation_overrides& overrides = {}) const;
    relation with(const relation_overrides& overrides) const;

    bool has_schema() const { return !options_.schema->empty(); }

    /// Base and view schemas of the relation definition
    const schema_map& schemas() const { return *schemas_; }

    const association_set& associations() const { return options_.schema->associations(); }

    // Dataset operations (write coercion applies to inserts)
    relation& insert(const tuple_t& tuple);
    relation& operator<<(const tuple_t& tuple) { return insert(tuple); }
    relation restrict(const restriction_t& criteria) const;
    relation project(const std::vector<std::string>& names) const;
    relation order(const std::vector<std::string>& names) const;
    std::size_t remove(const restriction_t& criteria);
    std::size_t count() const;

    /// Invoke a named view and project the result through the view schema.
    /// Throws invalid_argument_error for unknown views or missing arguments.
    relation view(const std::string& name, arguments_t args = {}) const;

    /// Named view awaiting (more) arguments
    curried curry(const std::string& name, arguments_t args = {}) const;

    /// Invoke the view if `args` reach its arity, otherwise curry them
    applied_view apply(const std::string& name, arguments_t args = {}) const;

    /// Tuples whose target key is one of the parents' source key values
    relation restrict_by(const association& assoc, const loaded& parents) const;

    composite map_with(const std::string& mapper) const;
    composite map_with(const std::vector<std::string>& mappers) const;

    bool operator==(const relation& other) const { return dataset_ == other.dataset_; }

private:
    std::shared_ptr<relata::dataset> dataset_;
    relation_options options_;
    std::shared_ptr<const schema_map> schemas_;
    std::shared_ptr<const tuple_fn> read_fn_;
    std::string name_;

    const view_definition& find_view(const std::string& name) const;
};

// ============================================================================
// Curried - view awaiting its remaining arguments
// ============================================================================

class curried : public materializable {
public:
    curried(relation source, std::string view, std::size_t arity, arguments_t args = {});

    /// Supply the remaining arguments and invoke the view.
    /// Throws invalid_argument_error if arguments are still missing.
    relation operator()(arguments_t args = {}) const;

    /// Add arguments: the invoked view once the arity is reached, else a new curried
    applied_view apply(arguments_t args) const;

    /// Accumulate arguments without invoking
    curried curry(arguments_t args) const;

    /// Load the view if every argument is present.
    /// Throws invalid_argument_error while arguments are missing.
    loaded call() const override;

    bool complete() const { return args_.size() >= arity_; }

    /// Invoke with the parent appended as the last argument
    loaded call_with(const loaded& parent) const override;

    bool is_curried() const override { return true; }
    const std::string& name() const override { return source_.name(); }
    std::shared_ptr<const materializable> clone() const override;

    const relation& source() const { return source_; }
    const std::string& view() const { return view_; }
    std::size_t arity() const { return arity_; }
    const arguments_t& arguments() const { return args_; }

private:
    relation source_;
    std::string view_;
    std::size_t arity_;
    arguments_t args_;
};

// ============================================================================
// Composite - left relation piped through a right transform
// ============================================================================

class composite : public materializable {
public:
    composite(std::shared_ptr<const materializable> left, mapper_t right);
    composite(std::shared_ptr<const materializable> left, curried right);

    loaded call() const override;
    loaded call_with(const loaded& parent) const override;
    const std::string& name() const override { return left_->name(); }
    std::shared_ptr<const materializable> clone() const override;

    const materializable& left() const { return *left_; }

private:
    std::shared_ptr<const materializable> left_;
    std::variant<mapper_t, curried> right_;

    loaded apply(const loaded& input) const;
};

// ============================================================================
// Graph - root combined with child nodes, loaded root-first
// ============================================================================
//
// Each node is evaluated once against the root's whole loaded set, never
// once per root tuple.

class graph : public materializable {
public:
    using node_ptr = std::shared_ptr<const materializable>;

    graph(node_ptr root, std::vector<node_ptr> nodes);

    loaded call() const override;
    loaded call_with(const loaded& parent) const override;
    bool is_graph() const override { return true; }
    const std::string& name() const override { return root_->name(); }
    std::shared_ptr<const materializable> clone() const override;

    const materializable& root() const { return *root_; }
    const std::vector<node_ptr>& nodes() const { return nodes_; }

private:
    node_ptr root_;
    std::vector<node_ptr> nodes_;

    loaded evaluate(const loaded& root) const;
};

// ============================================================================
// Relation definition - data-driven relation "class"
// ============================================================================

using view_body = std::function<relation(const relation&, const arguments_t&)>;

using schema_inferrer = std::function<std::vector<attribute>(const std::string& dataset)>;

struct view_definition {
    std::string name;
    std::vector<std::string> projection;   // empty keeps every base attribute
    std::size_t arity = 0;
    view_body body;
};

// Describes a relation: its dataset, base schema and named views. Instances
// are produced by build(). Must be owned by a shared_ptr (std::make_shared).
class relation_definition : public std::enable_shared_from_this<relation_definition> {
public:
    explicit relation_definition(std::string name, relata::schema base = {});

    /// Dataset name (defaults to the relation name)
    relation_definition& use_dataset(std::string name);

    relation_definition& view(std::string name,
                              std::vector<std::string> projection,
                              view_body body,
                              std::size_t arity = 0);

    /// Custom inferrer; takes precedence over the gateway's
    relation_definition& infer_with(schema_inferrer inferrer);

    /// Finalize an explicit schema (or one with a custom inferrer) and compute view schemas
    relation_definition& finalize();

    /// Finalize, inferring attributes through the gateway when needed
    relation_definition& finalize(const gateway& gw);

    bool finalized() const { return finalized_; }

    const std::string& name() const { return name_; }
    const std::string& dataset_name() const { return dataset_name_; }
    std::shared_ptr<const relata::schema> base_schema() const { return schema_; }
    std::shared_ptr<const schema_map> schemas() const { return schemas_; }
    const std::map<std::string, view_definition>& views() const { return views_; }
    const view_definition* find_view(const std::string& name) const;

    /// Throws configuration_error before finalize()
    relation build(std::shared_ptr<relata::dataset> data,
                   std::shared_ptr<const mapper_registry> mappers = nullptr) const;

private:
    std::string name_;
    std::string dataset_name_;
    std::shared_ptr<relata::schema> schema_;
    std::map<std::string, view_definition> views_;
    std::shared_ptr<const schema_map> schemas_;
    schema_inferrer inferrer_;
    bool finalized_ = false;

    void finalize_with(std::vector<attribute> inferred);
};

// ============================================================================
// Template implementations
// ============================================================================

template<typename... Nodes>
graph relation::combine(const Nodes&... nodes) const {
    return combine_nodes({nodes.clone()...});
}

} // namespace relata

#endif // __cplusplus
