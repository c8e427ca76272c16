#pragma once
#include <sapling/layout/layout.h>
#include <sapling/style/style.h>

#include <cstddef>
#include <optional>
#include <vector>

namespace sapling::tree {

// Index of a node inside one Forest. Only valid until the next swap_remove,
// which may move another node into the freed slot.
using NodeId = std::size_t;

// Per-node layout state.
//
// Invariant: a populated cache implies is_dirty == false. The only ways to
// touch the caches are mark_dirty() (clears both, sets dirty) and
// store_caches() (fills them, clears dirty), plus direct writes by the
// layout algorithm, which must uphold the same rule.
struct NodeData {
    explicit NodeData(style::FlexboxLayout style);
    NodeData(style::FlexboxLayout style, layout::MeasureFunc measure);

    style::FlexboxLayout style;
    // Empty unless the node sizes itself (text, images).
    layout::MeasureFunc measure;
    layout::Layout layout;
    std::optional<layout::LayoutCache> main_size_layout_cache;
    std::optional<layout::LayoutCache> other_layout_cache;
    bool is_dirty = true;

    bool has_measure() const { return static_cast<bool>(measure); }

    // Drops both caches and flags the node for recomputation. The previous
    // layout value is left in place.
    void mark_dirty();

    void store_caches(std::optional<layout::LayoutCache> main_size,
                      std::optional<layout::LayoutCache> other);
};

// Struct-of-arrays storage for layout nodes.
//
// nodes_, children_ and parents_ always have the same length and are indexed
// by the same NodeId. Children are ordered (flex item order); parents are
// not. A node may have several parents, so the structure is a DAG rather than
// a tree. Adjacency is symmetric: c appears in children(p) exactly as many
// times as p appears in parents(c).
//
// Not thread-safe. Guard the whole forest with one lock if shared.
class Forest {
public:
    Forest() = default;
    explicit Forest(std::size_t capacity);

    NodeId new_leaf(style::FlexboxLayout style);
    NodeId new_leaf_with_measure(style::FlexboxLayout style, layout::MeasureFunc measure);
    // The new node is registered as a parent of every child before it is
    // appended. Duplicate entries in `children` create duplicate edges.
    NodeId new_with_children(style::FlexboxLayout style, std::vector<NodeId> children);

    // Appends an edge and marks `parent` dirty. Adding the same child twice
    // creates two edges.
    void add_child(NodeId parent, NodeId child);
    // Replaces the whole child list of `parent` and marks it dirty.
    void set_children(NodeId parent, std::vector<NodeId> children);
    // Removes the first edge parent -> child. Returns child.
    NodeId remove_child(NodeId parent, NodeId child);
    // Removes the edge at `index` of parent's child list. Returns the child.
    NodeId remove_child_at_index(NodeId parent, std::size_t index);
    // Swaps the child at `index` for `new_child`. Returns the old child.
    NodeId replace_child_at_index(NodeId parent, std::size_t index, NodeId new_child);

    // Deletes `node` and every edge touching it. The last node is moved into
    // the freed slot to keep storage dense; when that happens its previous
    // id is returned and the caller must remap any copy of that id to `node`.
    std::optional<NodeId> swap_remove(NodeId node);

    // Removes every node. Capacity is retained.
    void clear();

    // Marks `node` and all of its ancestors dirty, clearing their caches.
    void mark_dirty(NodeId node);

    std::size_t len() const { return nodes_.size(); }
    bool is_empty() const { return nodes_.empty(); }
    std::size_t capacity() const { return nodes_.capacity(); }
    bool contains(NodeId id) const { return id < nodes_.size(); }

    NodeData& node(NodeId id);
    const NodeData& node(NodeId id) const;
    const std::vector<NodeId>& children(NodeId id) const;
    const std::vector<NodeId>& parents(NodeId id) const;
    std::size_t child_count(NodeId id) const;
    NodeId child_at_index(NodeId parent, std::size_t index) const;

    // Raw views of the parallel sequences, for consistency checks.
    const std::vector<NodeData>& nodes() const { return nodes_; }
    const std::vector<std::vector<NodeId>>& child_lists() const { return children_; }
    const std::vector<std::vector<NodeId>>& parent_lists() const { return parents_; }

private:
    NodeId push_node(NodeData data, std::vector<NodeId> children);
    void check_node(NodeId id) const;
    void check_parent(NodeId id) const;
    void check_child(NodeId id) const;
    void check_child_index(NodeId parent, std::size_t index) const;

    std::vector<NodeData> nodes_;
    std::vector<std::vector<NodeId>> children_;
    std::vector<std::vector<NodeId>> parents_;
};

} // namespace sapling::tree
