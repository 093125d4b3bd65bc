#include "relata/relation.hpp"
#include "relata/log.hpp"
#include <nlohmann/json.hpp>

namespace relata {

// ============================================================================
// View arguments
// ============================================================================

value_list_t argument_values(const argument_t& arg) {
    if (auto* value = std::get_if<value_t>(&arg)) {
        return {*value};
    }
    if (auto* values = std::get_if<value_list_t>(&arg)) {
        return *values;
    }
    throw invalid_argument_error("expected a value argument, got a loaded relation");
}

const loaded& argument_loaded(const argument_t& arg) {
    auto* parent = std::get_if<loaded_ptr>(&arg);
    if (!parent || !*parent) {
        throw invalid_argument_error("expected a loaded relation argument");
    }
    return **parent;
}

// ============================================================================
// materializable
// ============================================================================

loaded materializable::call_with(const loaded&) const {
    return call();
}

tuple_list_t materializable::to_a() const {
    return call().collection();
}

// ============================================================================
// loaded
// ============================================================================

loaded::loaded()
    : collection_(std::make_shared<const tuple_list_t>()) {}

loaded::loaded(tuple_list_t collection,
               std::shared_ptr<const relation> source,
               std::vector<loaded> nodes)
    : loaded(std::make_shared<const tuple_list_t>(std::move(collection)), std::move(source), std::move(nodes)) {}

loaded::loaded(std::shared_ptr<const tuple_list_t> collection,
               std::shared_ptr<const relation> source,
               std::vector<loaded> nodes)
    : collection_(collection ? std::move(collection) : std::make_shared<const tuple_list_t>())
    , source_(std::move(source))
    , nodes_(std::move(nodes)) {
    if (source_) {
        name_ = source_->name();
    }
}

std::shared_ptr<const materializable> loaded::clone() const {
    return std::make_shared<loaded>(*this);
}

const loaded& loaded::node(const std::string& name) const {
    for (const auto& child : nodes_) {
        if (child.name() == name) return child;
    }
    throw invalid_argument_error("Node not found in loaded relation " + name_ + ": " + name);
}

void loaded::for_each(const dataset::visitor& fn) const {
    for (const auto& tuple : *collection_) {
        fn(tuple);
    }
}

std::optional<tuple_t> loaded::one() const {
    if (collection_->size() > 1) {
        throw tuple_count_mismatch_error("The relation consists of more than one tuple");
    }
    if (collection_->empty()) {
        return std::nullopt;
    }
    return collection_->front();
}

tuple_t loaded::one_or_throw() const {
    auto tuple = one();
    if (!tuple) {
        throw tuple_count_mismatch_error("The relation does not contain any tuples");
    }
    return *tuple;
}

value_list_t loaded::pluck(const std::string& key) const {
    value_list_t values;
    values.reserve(collection_->size());
    for (const auto& tuple : *collection_) {
        auto it = tuple.find(key);
        values.push_back(it == tuple.end() ? value_t(nullptr) : it->second);
    }
    return values;
}

value_list_t loaded::primary_keys() const {
    if (!source_) {
        throw invalid_argument_error("loaded relation has no source to read a primary key from");
    }
    auto keys = source_->schema().primary_key();
    if (keys.empty()) {
        throw invalid_argument_error("relation " + name_ + " has no primary key");
    }
    return pluck(keys.front());
}

nlohmann::json loaded::to_json() const {
    nlohmann::json result = nlohmann::json::object();
    result["relation"] = name_;
    result["tuples"] = relata::to_json(*collection_);
    if (!nodes_.empty()) {
        nlohmann::json children = nlohmann::json::array();
        for (const auto& child : nodes_) {
            children.push_back(child.to_json());
        }
        result["nodes"] = std::move(children);
    }
    return result;
}

// ============================================================================
// tuple_sequence
// ============================================================================

tuple_sequence::iterator::iterator(std::shared_ptr<const tuple_list_t> raw, std::shared_ptr<const tuple_fn> read)
    : raw_(std::move(raw)), read_(std::move(read)) {}

tuple_sequence::iterator::reference tuple_sequence::iterator::operator*() const {
    if (!current_) {
        current_ = (*read_)((*raw_)[pos_]);
    }
    return *current_;
}

tuple_sequence::iterator& tuple_sequence::iterator::operator++() {
    ++pos_;
    current_.reset();
    return *this;
}

tuple_sequence::iterator tuple_sequence::iterator::operator++(int) {
    iterator previous = *this;
    ++(*this);
    return previous;
}

bool tuple_sequence::iterator::operator==(const iterator& other) const {
    if (at_end() || other.at_end()) {
        return at_end() == other.at_end();
    }
    return raw_ == other.raw_ && pos_ == other.pos_;
}

tuple_sequence::tuple_sequence(std::shared_ptr<const dataset> source, std::shared_ptr<const tuple_fn> read)
    : source_(std::move(source)), read_(std::move(read)) {}

tuple_sequence::iterator tuple_sequence::begin() const {
    return iterator(source_->read(), read_);
}

tuple_list_t tuple_sequence::to_a() const {
    tuple_list_t result;
    for (auto it = begin(); it != end(); ++it) {
        result.push_back(*it);
    }
    return result;
}

// ============================================================================
// relation
// ============================================================================

namespace {

tuple_t pass_through_hash(const tuple_t& tuple) {
    return tuple;
}

} // namespace

relation::relation(std::shared_ptr<relata::dataset> dataset, relation_options opts)
    : dataset_(std::move(dataset)), options_(std::move(opts)) {
    if (!dataset_) {
        throw invalid_argument_error("relation requires a dataset");
    }
    if (!options_.mappers) {
        options_.mappers = std::make_shared<const mapper_registry>();
    }
    if (!options_.schema) {
        options_.schema = options_.definition
            ? options_.definition->base_schema()
            : std::make_shared<const relata::schema>();
    }
    if (!options_.schema_hash) {
        if (has_schema()) {
            options_.schema_hash = options_.schema->to_command_hash();
        } else {
            options_.schema_hash = &pass_through_hash;
        }
    }
    if (!options_.read_schema) {
        if (options_.schema->any_read()) {
            options_.read_schema = options_.schema->to_relation_hash();
        } else {
            options_.read_schema = &relation::noop_read_schema;
        }
    }
    read_fn_ = std::make_shared<const tuple_fn>(options_.read_schema);

    if (options_.definition) {
        name_ = options_.definition->name();
        schemas_ = options_.definition->schemas();
    } else {
        name_ = options_.schema->name();
    }
    if (!schemas_) {
        auto schemas = std::make_shared<schema_map>();
        if (!name_.empty()) {
            (*schemas)[name_] = options_.schema;
        }
        schemas_ = std::move(schemas);
    }
}

loaded relation::call() const {
    return loaded(to_a(), std::make_shared<const relation>(*this));
}

std::shared_ptr<const materializable> relation::clone() const {
    return std::make_shared<relation>(*this);
}

const attribute_type& relation::operator[](const std::string& name) const {
    return options_.schema->operator[](name).type;
}

tuple_sequence relation::each() const {
    return tuple_sequence(dataset_, read_fn_);
}

void relation::for_each(const relata::dataset::visitor& fn) const {
    const auto& read = *read_fn_;
    dataset_->each([&](const tuple_t& tuple) {
        fn(read(tuple));
    });
}

tuple_list_t relation::to_a() const {
    return each().to_a();
}

graph relation::combine_nodes(std::vector<std::shared_ptr<const materializable>> nodes) const {
    return graph(clone(), std::move(nodes));
}

relation relation::new_with(std::shared_ptr<relata::dataset> dataset, const relation_overrides& overrides) const {
    if (overrides.empty()) {
        return relation(std::move(dataset), options_);
    }

    relation_options merged = options_;
    if (overrides.schema) {
        merged.schema = overrides.schema;
        // Coercion is derived from the schema; rebuild unless given explicitly
        merged.schema_hash = nullptr;
        merged.read_schema = nullptr;
    }
    if (overrides.mappers) merged.mappers = overrides.mappers;
    if (overrides.schema_hash) merged.schema_hash = overrides.schema_hash;
    if (overrides.read_schema) merged.read_schema = overrides.read_schema;
    if (overrides.definition) merged.definition = overrides.definition;

    return relation(std::move(dataset), std::move(merged));
}

relation relation::with(const relation_overrides& overrides) const {
    return new_with(dataset_, overrides);
}

relation& relation::insert(const tuple_t& tuple) {
    dataset_->insert(options_.schema_hash(tuple));
    return *this;
}

relation relation::restrict(const restriction_t& criteria) const {
    return new_with(dataset_->restrict(criteria));
}

relation relation::project(const std::vector<std::string>& names) const {
    return new_with(dataset_->project(names));
}

relation relation::order(const std::vector<std::string>& names) const {
    return new_with(dataset_->order(names));
}

std::size_t relation::remove(const restriction_t& criteria) {
    return dataset_->remove(criteria);
}

std::size_t relation::count() const {
    return dataset_->size();
}

const view_definition& relation::find_view(const std::string& name) const {
    const view_definition* view = options_.definition ? options_.definition->find_view(name) : nullptr;
    if (!view) {
        throw invalid_argument_error("View not defined on relation " + name_ + ": " + name);
    }
    return *view;
}

relation relation::view(const std::string& name, arguments_t args) const {
    const auto& definition = find_view(name);
    if (args.size() < definition.arity) {
        throw invalid_argument_error("view " + name_ + "." + name + " expects " +
                                     std::to_string(definition.arity) + " argument(s), got " +
                                     std::to_string(args.size()));
    }

    relation result = definition.body(*this, args);

    // Auto-project through the view schema
    auto it = schemas_->find(name);
    if (it == schemas_->end()) {
        return result;
    }
    const auto& view_schema = it->second;
    relation_overrides overrides;
    overrides.schema = view_schema;
    return result.new_with(result.dataset()->project(view_schema->attribute_names()), overrides);
}

curried relation::curry(const std::string& name, arguments_t args) const {
    const auto& definition = find_view(name);
    return curried(*this, name, definition.arity, std::move(args));
}

applied_view relation::apply(const std::string& name, arguments_t args) const {
    return curry(name).apply(std::move(args));
}

relation relation::restrict_by(const association& assoc, const loaded& parents) const {
    return restrict({{assoc.target_key, parents.pluck(assoc.source_key)}});
}

composite relation::map_with(const std::string& mapper) const {
    return *this >> mappers()[mapper];
}

composite relation::map_with(const std::vector<std::string>& names) const {
    if (names.empty()) {
        throw invalid_argument_error("map_with requires at least one mapper name");
    }
    composite result = map_with(names.front());
    for (std::size_t i = 1; i < names.size(); ++i) {
        result = result >> mappers()[names[i]];
    }
    return result;
}

} // namespace relata
