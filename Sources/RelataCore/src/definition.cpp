#include "relata/relation.hpp"
#include "relata/gateway.hpp"
#include "relata/log.hpp"

namespace relata {

relation_definition::relation_definition(std::string name, relata::schema base)
    : name_(std::move(name))
    , dataset_name_(name_)
    , schema_(std::make_shared<relata::schema>(std::move(base))) {}

relation_definition& relation_definition::use_dataset(std::string name) {
    dataset_name_ = std::move(name);
    return *this;
}

relation_definition& relation_definition::view(std::string name,
                                               std::vector<std::string> projection,
                                               view_body body,
                                               std::size_t arity) {
    if (finalized_) {
        throw configuration_error("cannot add view " + name + " to finalized relation " + name_);
    }
    if (!body) {
        throw invalid_argument_error("view " + name_ + "." + name + " has no relation body");
    }
    view_definition definition{name, std::move(projection), arity, std::move(body)};
    views_[name] = std::move(definition);
    return *this;
}

relation_definition& relation_definition::infer_with(schema_inferrer inferrer) {
    inferrer_ = std::move(inferrer);
    return *this;
}

relation_definition& relation_definition::finalize() {
    if (finalized_) {
        return *this;
    }
    if (!schema_->finalized()) {
        if (!inferrer_) {
            throw configuration_error("relation " + name_ + " has an inferred schema but no inferrer; "
                                      "finalize it through a gateway");
        }
        finalize_with(inferrer_(dataset_name_));
    } else {
        finalize_with({});
    }
    return *this;
}

relation_definition& relation_definition::finalize(const gateway& gw) {
    if (finalized_) {
        return *this;
    }
    if (!schema_->finalized()) {
        finalize_with(inferrer_ ? inferrer_(dataset_name_) : gw.infer_attributes(dataset_name_));
    } else {
        finalize_with({});
    }
    return *this;
}

void relation_definition::finalize_with(std::vector<attribute> inferred) {
    schema_->finalize(std::move(inferred));

    auto schemas = std::make_shared<schema_map>();
    (*schemas)[schema_->name().empty() ? name_ : schema_->name()] = schema_;

    for (const auto& [view_name, definition] : views_) {
        relata::schema view_schema = definition.projection.empty()
            ? schema_->rename(view_name)
            : schema_->project(definition.projection).rename(view_name);
        (*schemas)[view_name] = std::make_shared<const relata::schema>(std::move(view_schema));
    }

    schemas_ = std::move(schemas);
    finalized_ = true;
    LOG_DEBUG("relation", "Finalized relation %s (%zu attributes, %zu views)",
              name_.c_str(), schema_->size(), views_.size());
}

const view_definition* relation_definition::find_view(const std::string& name) const {
    auto it = views_.find(name);
    if (it == views_.end()) {
        return nullptr;
    }
    return &it->second;
}

relation relation_definition::build(std::shared_ptr<relata::dataset> data,
                                    std::shared_ptr<const mapper_registry> mappers) const {
    if (!finalized_) {
        throw configuration_error("relation " + name_ + " must be finalized before use");
    }
    relation_options opts;
    opts.schema = schema_;
    opts.mappers = std::move(mappers);
    opts.definition = shared_from_this();
    return relation(std::move(data), std::move(opts));
}

} // namespace relata
