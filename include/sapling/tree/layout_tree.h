#pragma once
#include <sapling/core/config.h>
#include <sapling/core/diagnostics.h>
#include <sapling/layout/layout.h>
#include <sapling/style/style.h>
#include <sapling/tree/forest.h>
#include <sapling/tree/tree_error.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <vector>

namespace sapling::tree {

// Stable handle to a node. Unlike NodeId it survives the removal of other
// nodes, and a LayoutTree never hands out the same value twice.
struct Node {
    uint64_t value = 0;

    bool operator==(const Node& other) const { return value == other.value; }
    bool operator!=(const Node& other) const { return value != other.value; }
};

} // namespace sapling::tree

namespace std {
template<>
struct hash<sapling::tree::Node> {
    size_t operator()(const sapling::tree::Node& n) const noexcept {
        return hash<uint64_t>{}(n.value);
    }
};
} // namespace std

namespace sapling::tree {

// Tree-editing front end over a Forest. Owns the Node <-> NodeId mapping and
// applies the remap that Forest::swap_remove asks of its caller, so handles
// held by users stay valid across removals.
class LayoutTree {
public:
    struct Options {
        std::size_t node_capacity = core::config::kDefaultNodeCapacity;
        core::Severity min_severity = core::Severity::Info;
        std::size_t diagnostic_event_limit = core::config::kDefaultDiagnosticEventLimit;
    };

    LayoutTree();
    explicit LayoutTree(const Options& options);

    // Non-copyable
    LayoutTree(const LayoutTree&) = delete;
    LayoutTree& operator=(const LayoutTree&) = delete;

    Node new_leaf(style::FlexboxLayout style);
    Node new_leaf_with_measure(style::FlexboxLayout style, layout::MeasureFunc measure);
    Node new_with_children(style::FlexboxLayout style, const std::vector<Node>& children);

    // Drops every node. Handles issued before stay invalid afterwards.
    void clear();

    // Deletes `node` and its edges; former parents are marked dirty.
    // Returns the removed handle.
    Node remove(Node node);

    // Installs or, with an empty function, drops the measure function.
    void set_measure(Node node, layout::MeasureFunc measure);

    void add_child(Node parent, Node child);
    void set_children(Node parent, const std::vector<Node>& children);
    Node remove_child(Node parent, Node child);
    Node remove_child_at_index(Node parent, std::size_t index);
    Node replace_child_at_index(Node parent, std::size_t index, Node new_child);

    Node child_at_index(Node parent, std::size_t index) const;
    std::vector<Node> children(Node parent) const;
    std::vector<Node> parents(Node node) const;
    std::size_t child_count(Node parent) const;

    void set_style(Node node, style::FlexboxLayout style);
    const style::FlexboxLayout& style(Node node) const;

    const layout::Layout& layout(Node node) const;
    void mark_dirty(Node node);
    bool dirty(Node node) const;

    bool contains(Node node) const;
    std::size_t size() const { return handles_.size(); }

    NodeId id_of(Node node) const;
    Node node_at(NodeId id) const;

    // The layout algorithm reads and writes node state through the forest.
    // Topology must only be edited through this class.
    Forest& forest() { return forest_; }
    const Forest& forest() const { return forest_; }

    core::DiagnosticEmitter& diagnostics() { return diagnostics_; }
    const core::DiagnosticEmitter& diagnostics() const { return diagnostics_; }

private:
    Node register_node(NodeId id, const char* stage);
    NodeId lookup(Node node, TreeErrorKind kind, const char* stage) const;
    std::vector<NodeId> lookup_all(const std::vector<Node>& nodes, const char* stage) const;
    std::vector<Node> to_handles(const std::vector<NodeId>& ids) const;
    void fail(const char* stage, const TreeError& error) const;

    template<typename Fn>
    auto guarded(const char* stage, Fn&& fn) const -> decltype(fn());

    Forest forest_;
    // Indexed by NodeId, kept parallel to the forest.
    std::vector<Node> handles_;
    std::unordered_map<Node, NodeId> ids_;
    uint64_t next_handle_ = 0;
    // Failed const lookups are logged too.
    mutable core::DiagnosticEmitter diagnostics_;
};

} // namespace sapling::tree
