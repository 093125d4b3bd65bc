#include "relata/relation.hpp"
#include "relata/log.hpp"

namespace relata {

// ============================================================================
// Pipeline operators
// ============================================================================

composite operator>>(const materializable& left, mapper_t right) {
    return composite(left.clone(), std::move(right));
}

composite operator>>(const materializable& left, const curried& right) {
    return composite(left.clone(), right);
}

// ============================================================================
// curried
// ============================================================================

curried::curried(relation source, std::string view, std::size_t arity, arguments_t args)
    : source_(std::move(source)), view_(std::move(view)), arity_(arity), args_(std::move(args)) {}

relation curried::operator()(arguments_t args) const {
    auto applied = apply(std::move(args));
    if (auto* pending = std::get_if<curried>(&applied)) {
        throw invalid_argument_error("curried view " + source_.name() + "." + view_ + " is missing " +
                                     std::to_string(arity_ - pending->args_.size()) + " argument(s)");
    }
    return std::get<relation>(std::move(applied));
}

applied_view curried::apply(arguments_t args) const {
    curried next = curry(std::move(args));
    if (!next.complete()) {
        return next;
    }
    return source_.view(view_, std::move(next.args_));
}

curried curried::curry(arguments_t args) const {
    arguments_t all = args_;
    all.insert(all.end(), std::make_move_iterator(args.begin()), std::make_move_iterator(args.end()));
    return curried(source_, view_, arity_, std::move(all));
}

loaded curried::call() const {
    if (!complete()) {
        throw invalid_argument_error("curried view " + source_.name() + "." + view_ + " cannot be loaded: " +
                                     std::to_string(arity_ - args_.size()) + " argument(s) missing");
    }
    return source_.view(view_, args_).call();
}

loaded curried::call_with(const loaded& parent) const {
    return (*this)({std::make_shared<const loaded>(parent)}).call();
}

std::shared_ptr<const materializable> curried::clone() const {
    return std::make_shared<curried>(*this);
}

// ============================================================================
// composite
// ============================================================================

composite::composite(std::shared_ptr<const materializable> left, mapper_t right)
    : left_(std::move(left)), right_(std::move(right)) {}

composite::composite(std::shared_ptr<const materializable> left, curried right)
    : left_(std::move(left)), right_(std::move(right)) {}

loaded composite::apply(const loaded& input) const {
    if (auto* mapper = std::get_if<mapper_t>(&right_)) {
        return loaded((*mapper)(input), input.source());
    }
    return std::get<curried>(right_).call_with(input);
}

loaded composite::call() const {
    return apply(left_->call());
}

loaded composite::call_with(const loaded& parent) const {
    return apply(left_->call_with(parent));
}

std::shared_ptr<const materializable> composite::clone() const {
    return std::make_shared<composite>(*this);
}

// ============================================================================
// graph
// ============================================================================

graph::graph(node_ptr root, std::vector<node_ptr> nodes)
    : root_(std::move(root)), nodes_(std::move(nodes)) {
    if (!root_) {
        throw invalid_argument_error("graph requires a root relation");
    }
    for (const auto& node : nodes_) {
        if (!node) {
            throw invalid_argument_error("graph " + root_->name() + " was given a null node");
        }
    }
}

loaded graph::evaluate(const loaded& root) const {
    std::vector<loaded> children;
    children.reserve(nodes_.size());
    for (const auto& node : nodes_) {
        LOG_DEBUG("graph", "Evaluating node %s against %zu %s tuple(s)",
                  node->name().c_str(), root.size(), root.name().c_str());
        children.push_back(node->call_with(root));
    }
    return loaded(root.shared_collection(), root.source(), std::move(children));
}

loaded graph::call() const {
    return evaluate(root_->call());
}

loaded graph::call_with(const loaded& parent) const {
    return evaluate(root_->call_with(parent));
}

std::shared_ptr<const materializable> graph::clone() const {
    return std::make_shared<graph>(*this);
}

} // namespace relata
