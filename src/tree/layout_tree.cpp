#include <sapling/tree/layout_tree.h>

#include <string>
#include <utility>

namespace sapling::tree {

namespace {

constexpr const char* kModule = "tree";

std::string describe(Node node, NodeId id) {
    return "node " + std::to_string(node.value) + " (id " + std::to_string(id) + ")";
}

} // namespace

LayoutTree::LayoutTree() : LayoutTree(Options{}) {}

LayoutTree::LayoutTree(const Options& options)
    : forest_(options.node_capacity),
      diagnostics_(options.diagnostic_event_limit) {
    handles_.reserve(options.node_capacity);
    ids_.reserve(options.node_capacity);
    diagnostics_.set_min_severity(options.min_severity);
}

template<typename Fn>
auto LayoutTree::guarded(const char* stage, Fn&& fn) const -> decltype(fn()) {
    try {
        return fn();
    } catch (const TreeError& e) {
        fail(stage, e);
        throw;
    }
}

void LayoutTree::fail(const char* stage, const TreeError& error) const {
    diagnostics_.emit(core::Severity::Error, kModule, stage, error.what());
}

Node LayoutTree::register_node(NodeId id, const char* stage) {
    Node node{next_handle_++};
    handles_.push_back(node);
    ids_.emplace(node, id);
    if (diagnostics_.min_severity() <= core::Severity::Debug) {
        diagnostics_.emit(core::Severity::Debug, kModule, stage, "created " + describe(node, id));
    }
    return node;
}

NodeId LayoutTree::lookup(Node node, TreeErrorKind kind, const char* stage) const {
    auto it = ids_.find(node);
    if (it == ids_.end()) {
        TreeError error(kind, "handle " + std::to_string(node.value));
        fail(stage, error);
        throw error;
    }
    return it->second;
}

std::vector<NodeId> LayoutTree::lookup_all(const std::vector<Node>& nodes,
                                           const char* stage) const {
    std::vector<NodeId> ids;
    ids.reserve(nodes.size());
    for (Node n : nodes) {
        ids.push_back(lookup(n, TreeErrorKind::InvalidChildNode, stage));
    }
    return ids;
}

std::vector<Node> LayoutTree::to_handles(const std::vector<NodeId>& ids) const {
    std::vector<Node> nodes;
    nodes.reserve(ids.size());
    for (NodeId id : ids) {
        nodes.push_back(handles_[id]);
    }
    return nodes;
}

Node LayoutTree::new_leaf(style::FlexboxLayout style) {
    NodeId id = forest_.new_leaf(std::move(style));
    return register_node(id, "create");
}

Node LayoutTree::new_leaf_with_measure(style::FlexboxLayout style, layout::MeasureFunc measure) {
    NodeId id = forest_.new_leaf_with_measure(std::move(style), std::move(measure));
    return register_node(id, "create");
}

Node LayoutTree::new_with_children(style::FlexboxLayout style, const std::vector<Node>& children) {
    std::vector<NodeId> child_ids = lookup_all(children, "create");
    NodeId id = forest_.new_with_children(std::move(style), std::move(child_ids));
    return register_node(id, "create");
}

void LayoutTree::clear() {
    forest_.clear();
    handles_.clear();
    ids_.clear();
    diagnostics_.emit(core::Severity::Debug, kModule, "clear", "removed all nodes");
}

Node LayoutTree::remove(Node node) {
    NodeId id = lookup(node, TreeErrorKind::InvalidNode, "remove");
    std::vector<NodeId> former_parents = forest_.parents(id);

    std::optional<NodeId> moved = forest_.swap_remove(id);
    if (moved) {
        Node relocated = handles_[*moved];
        handles_[id] = relocated;
        ids_[relocated] = id;
        diagnostics_.emit(core::Severity::Info, kModule, "remap",
                          "node " + std::to_string(relocated.value) + " moved from id " +
                          std::to_string(*moved) + " to " + std::to_string(id));
    }
    handles_.pop_back();
    ids_.erase(node);
    if (diagnostics_.min_severity() <= core::Severity::Debug) {
        diagnostics_.emit(core::Severity::Debug, kModule, "remove", "removed " + describe(node, id));
    }

    // The parents lost a child, so their cached sizes are stale.
    for (NodeId parent : former_parents) {
        if (parent == id) continue;
        if (moved && parent == *moved) parent = id;
        forest_.mark_dirty(parent);
    }
    return node;
}

void LayoutTree::set_measure(Node node, layout::MeasureFunc measure) {
    NodeId id = lookup(node, TreeErrorKind::InvalidNode, "set_measure");
    forest_.node(id).measure = std::move(measure);
    forest_.mark_dirty(id);
}

void LayoutTree::add_child(Node parent, Node child) {
    NodeId parent_id = lookup(parent, TreeErrorKind::InvalidParentNode, "add_child");
    NodeId child_id = lookup(child, TreeErrorKind::InvalidChildNode, "add_child");
    forest_.add_child(parent_id, child_id);
}

void LayoutTree::set_children(Node parent, const std::vector<Node>& children) {
    NodeId parent_id = lookup(parent, TreeErrorKind::InvalidParentNode, "set_children");
    std::vector<NodeId> child_ids = lookup_all(children, "set_children");
    forest_.set_children(parent_id, std::move(child_ids));
}

Node LayoutTree::remove_child(Node parent, Node child) {
    NodeId parent_id = lookup(parent, TreeErrorKind::InvalidParentNode, "remove_child");
    NodeId child_id = lookup(child, TreeErrorKind::InvalidChildNode, "remove_child");
    guarded("remove_child", [&] { return forest_.remove_child(parent_id, child_id); });
    return child;
}

Node LayoutTree::remove_child_at_index(Node parent, std::size_t index) {
    NodeId parent_id = lookup(parent, TreeErrorKind::InvalidParentNode, "remove_child_at_index");
    NodeId child_id = guarded("remove_child_at_index",
                              [&] { return forest_.remove_child_at_index(parent_id, index); });
    return handles_[child_id];
}

Node LayoutTree::replace_child_at_index(Node parent, std::size_t index, Node new_child) {
    NodeId parent_id = lookup(parent, TreeErrorKind::InvalidParentNode, "replace_child_at_index");
    NodeId child_id = lookup(new_child, TreeErrorKind::InvalidChildNode, "replace_child_at_index");
    NodeId old_id = guarded("replace_child_at_index", [&] {
        return forest_.replace_child_at_index(parent_id, index, child_id);
    });
    return handles_[old_id];
}

Node LayoutTree::child_at_index(Node parent, std::size_t index) const {
    NodeId parent_id = lookup(parent, TreeErrorKind::InvalidParentNode, "child_at_index");
    NodeId child_id = guarded("child_at_index",
                              [&] { return forest_.child_at_index(parent_id, index); });
    return handles_[child_id];
}

std::vector<Node> LayoutTree::children(Node parent) const {
    NodeId id = lookup(parent, TreeErrorKind::InvalidParentNode, "children");
    return to_handles(forest_.children(id));
}

std::vector<Node> LayoutTree::parents(Node node) const {
    NodeId id = lookup(node, TreeErrorKind::InvalidNode, "parents");
    return to_handles(forest_.parents(id));
}

std::size_t LayoutTree::child_count(Node parent) const {
    NodeId id = lookup(parent, TreeErrorKind::InvalidParentNode, "child_count");
    return forest_.child_count(id);
}

void LayoutTree::set_style(Node node, style::FlexboxLayout style) {
    NodeId id = lookup(node, TreeErrorKind::InvalidNode, "set_style");
    forest_.node(id).style = std::move(style);
    forest_.mark_dirty(id);
}

const style::FlexboxLayout& LayoutTree::style(Node node) const {
    return forest_.node(lookup(node, TreeErrorKind::InvalidNode, "style")).style;
}

const layout::Layout& LayoutTree::layout(Node node) const {
    return forest_.node(lookup(node, TreeErrorKind::InvalidNode, "layout")).layout;
}

void LayoutTree::mark_dirty(Node node) {
    forest_.mark_dirty(lookup(node, TreeErrorKind::InvalidNode, "mark_dirty"));
}

bool LayoutTree::dirty(Node node) const {
    return forest_.node(lookup(node, TreeErrorKind::InvalidNode, "dirty")).is_dirty;
}

bool LayoutTree::contains(Node node) const {
    return ids_.find(node) != ids_.end();
}

NodeId LayoutTree::id_of(Node node) const {
    return lookup(node, TreeErrorKind::InvalidNode, "id_of");
}

Node LayoutTree::node_at(NodeId id) const {
    if (id >= handles_.size()) {
        TreeError error = TreeError::invalid_node(id);
        fail("node_at", error);
        throw error;
    }
    return handles_[id];
}

} // namespace sapling::tree
