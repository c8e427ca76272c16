#include <sapling/tree/forest.h>
#include <sapling/core/config.h>
#include <sapling/tree/tree_error.h>

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace sapling::tree {

namespace {

// Removes every occurrence of `value`. Order of the remaining entries is not
// preserved: the last entry fills each hole.
void swap_remove_all(std::vector<NodeId>& list, NodeId value) {
    std::size_t pos = 0;
    while (pos < list.size()) {
        if (list[pos] == value) {
            list[pos] = list.back();
            list.pop_back();
        } else {
            ++pos;
        }
    }
}

// Removes a single occurrence of `value`, keeping the others.
void remove_one(std::vector<NodeId>& list, NodeId value) {
    auto it = std::find(list.begin(), list.end(), value);
    if (it != list.end()) {
        list.erase(it);
    }
}

void replace_all(std::vector<NodeId>& list, NodeId from, NodeId to) {
    std::replace(list.begin(), list.end(), from, to);
}

std::vector<NodeId> new_parent_list() {
    std::vector<NodeId> parents;
    parents.reserve(core::config::kParentListReserve);
    return parents;
}

} // namespace

// ---------------------------------------------------------------------------
// NodeData
// ---------------------------------------------------------------------------

NodeData::NodeData(style::FlexboxLayout s) : style(std::move(s)) {}

NodeData::NodeData(style::FlexboxLayout s, layout::MeasureFunc m)
    : style(std::move(s)), measure(std::move(m)) {}

void NodeData::mark_dirty() {
    main_size_layout_cache.reset();
    other_layout_cache.reset();
    is_dirty = true;
}

void NodeData::store_caches(std::optional<layout::LayoutCache> main_size,
                            std::optional<layout::LayoutCache> other) {
    main_size_layout_cache = std::move(main_size);
    other_layout_cache = std::move(other);
    is_dirty = false;
}

// ---------------------------------------------------------------------------
// Forest
// ---------------------------------------------------------------------------

Forest::Forest(std::size_t capacity) {
    nodes_.reserve(capacity);
    children_.reserve(capacity);
    parents_.reserve(capacity);
}

NodeId Forest::push_node(NodeData data, std::vector<NodeId> children) {
    NodeId id = nodes_.size();
    std::vector<NodeId> parents = new_parent_list();
    // Grow all three first so the pushes below cannot fail halfway.
    std::size_t grown = std::max(id + 1, nodes_.capacity() * 2);
    if (nodes_.capacity() <= id) nodes_.reserve(grown);
    if (children_.capacity() <= id) children_.reserve(grown);
    if (parents_.capacity() <= id) parents_.reserve(grown);
    nodes_.push_back(std::move(data));
    children_.push_back(std::move(children));
    parents_.push_back(std::move(parents));
    return id;
}

NodeId Forest::new_leaf(style::FlexboxLayout style) {
    return push_node(NodeData(std::move(style)), {});
}

NodeId Forest::new_leaf_with_measure(style::FlexboxLayout style, layout::MeasureFunc measure) {
    return push_node(NodeData(std::move(style), std::move(measure)), {});
}

NodeId Forest::new_with_children(style::FlexboxLayout style, std::vector<NodeId> children) {
    for (NodeId child : children) {
        check_child(child);
    }
    // Link only once the node exists, so a failed push leaves no dangling
    // parent ids behind.
    NodeId id = push_node(NodeData(std::move(style)), std::move(children));
    for (NodeId child : children_[id]) {
        parents_[child].push_back(id);
    }
    return id;
}

void Forest::add_child(NodeId parent, NodeId child) {
    check_parent(parent);
    check_child(child);
    parents_[child].push_back(parent);
    children_[parent].push_back(child);
    mark_dirty(parent);
}

void Forest::set_children(NodeId parent, std::vector<NodeId> children) {
    check_parent(parent);
    for (NodeId child : children) {
        check_child(child);
    }

    for (NodeId old_child : children_[parent]) {
        remove_one(parents_[old_child], parent);
    }
    for (NodeId child : children) {
        parents_[child].push_back(parent);
    }
    children_[parent] = std::move(children);
    mark_dirty(parent);
}

NodeId Forest::remove_child(NodeId parent, NodeId child) {
    check_parent(parent);
    check_child(child);
    const auto& list = children_[parent];
    auto it = std::find(list.begin(), list.end(), child);
    if (it == list.end()) {
        throw TreeError::child_not_found(parent, child);
    }
    return remove_child_at_index(parent, static_cast<std::size_t>(it - list.begin()));
}

NodeId Forest::remove_child_at_index(NodeId parent, std::size_t index) {
    check_parent(parent);
    check_child_index(parent, index);

    auto& list = children_[parent];
    NodeId child = list[index];
    list.erase(list.begin() + static_cast<std::ptrdiff_t>(index));
    // One edge gone, so one back-reference goes with it.
    remove_one(parents_[child], parent);
    mark_dirty(parent);
    return child;
}

NodeId Forest::replace_child_at_index(NodeId parent, std::size_t index, NodeId new_child) {
    check_parent(parent);
    check_child(new_child);
    check_child_index(parent, index);

    NodeId old_child = children_[parent][index];
    remove_one(parents_[old_child], parent);
    children_[parent][index] = new_child;
    parents_[new_child].push_back(parent);
    mark_dirty(parent);
    return old_child;
}

std::optional<NodeId> Forest::swap_remove(NodeId node) {
    check_node(node);

    if (node + 1 != nodes_.size()) {
        nodes_[node] = std::move(nodes_.back());
    }
    nodes_.pop_back();

    if (nodes_.empty()) {
        children_.clear();
        parents_.clear();
        return std::nullopt;
    }

    // children_[node] and parents_[node] still describe the deleted node.
    for (NodeId child : children_[node]) {
        swap_remove_all(parents_[child], node);
    }
    for (NodeId parent : parents_[node]) {
        swap_remove_all(children_[parent], node);
    }

    NodeId last = nodes_.size();
    std::optional<NodeId> moved;

    if (last != node) {
        // The former last node now lives at `node`; rewrite its neighbours.
        for (NodeId child : children_[last]) {
            replace_all(parents_[child], last, node);
        }
        for (NodeId parent : parents_[last]) {
            replace_all(children_[parent], last, node);
        }
        children_[node] = std::move(children_[last]);
        parents_[node] = std::move(parents_[last]);
        moved = last;
    }
    children_.pop_back();
    parents_.pop_back();

    return moved;
}

void Forest::clear() {
    nodes_.clear();
    children_.clear();
    parents_.clear();
}

void Forest::mark_dirty(NodeId node) {
    check_node(node);

    // Iterative upward walk; a shared ancestor is marked once even when it
    // is reachable through several paths, and a cycle cannot loop forever.
    std::unordered_set<NodeId> visited;
    std::vector<NodeId> pending{node};
    while (!pending.empty()) {
        NodeId id = pending.back();
        pending.pop_back();
        if (!visited.insert(id).second) continue;

        nodes_[id].mark_dirty();
        for (NodeId parent : parents_[id]) {
            if (visited.count(parent) == 0) {
                pending.push_back(parent);
            }
        }
    }
}

NodeData& Forest::node(NodeId id) {
    check_node(id);
    return nodes_[id];
}

const NodeData& Forest::node(NodeId id) const {
    check_node(id);
    return nodes_[id];
}

const std::vector<NodeId>& Forest::children(NodeId id) const {
    check_node(id);
    return children_[id];
}

const std::vector<NodeId>& Forest::parents(NodeId id) const {
    check_node(id);
    return parents_[id];
}

std::size_t Forest::child_count(NodeId id) const {
    return children(id).size();
}

NodeId Forest::child_at_index(NodeId parent, std::size_t index) const {
    check_parent(parent);
    check_child_index(parent, index);
    return children_[parent][index];
}

void Forest::check_node(NodeId id) const {
    if (!contains(id)) throw TreeError::invalid_node(id);
}

void Forest::check_parent(NodeId id) const {
    if (!contains(id)) throw TreeError::invalid_parent(id);
}

void Forest::check_child(NodeId id) const {
    if (!contains(id)) throw TreeError::invalid_child(id);
}

void Forest::check_child_index(NodeId parent, std::size_t index) const {
    std::size_t count = children_[parent].size();
    if (index >= count) {
        throw TreeError::child_index_out_of_bounds(parent, index, count);
    }
}

} // namespace sapling::tree
