#include <sapling/tree/forest.h>
#include <sapling/tree/invariants.h>

#include <gtest/gtest.h>
#include <vector>

using namespace sapling;
using namespace sapling::tree;

namespace {

layout::LayoutCache cache_of(float w, float h) {
    layout::LayoutCache cache;
    cache.node_size = geometry::defined_size(w, h);
    cache.size = {w, h};
    return cache;
}

void compute_all(Forest& forest) {
    for (NodeId id = 0; id < forest.len(); ++id) {
        NodeData& n = forest.node(id);
        n.layout.size = {10.0f * static_cast<float>(id + 1), 5.0f};
        n.store_caches(cache_of(1, 1), cache_of(2, 2));
    }
}

bool is_clean_with_caches(const NodeData& n) {
    return !n.is_dirty && n.main_size_layout_cache && n.other_layout_cache;
}

bool is_invalidated(const NodeData& n) {
    return n.is_dirty && !n.main_size_layout_cache && !n.other_layout_cache;
}

// root -> {m, n}, m -> leaf, n -> leaf, plus an unrelated sibling under root
// and an isolated node.
struct Diamond {
    Forest forest;
    NodeId leaf, m, n, root, sibling, isolated;

    Diamond() {
        leaf = forest.new_leaf({});
        m = forest.new_with_children({}, {leaf});
        n = forest.new_with_children({}, {leaf});
        sibling = forest.new_leaf({});
        root = forest.new_with_children({}, {m, n, sibling});
        isolated = forest.new_leaf({});
        compute_all(forest);
    }
};

} // namespace

// ---------------------------------------------------------------------------
// 1. Upward propagation
// ---------------------------------------------------------------------------
TEST(DirtyPropagation, DiamondMarksEveryAncestor) {
    Diamond d;
    d.forest.mark_dirty(d.leaf);

    EXPECT_TRUE(is_invalidated(d.forest.node(d.leaf)));
    EXPECT_TRUE(is_invalidated(d.forest.node(d.m)));
    EXPECT_TRUE(is_invalidated(d.forest.node(d.n)));
    EXPECT_TRUE(is_invalidated(d.forest.node(d.root)));
}

TEST(DirtyPropagation, UnrelatedNodesAreUntouched) {
    Diamond d;
    d.forest.mark_dirty(d.leaf);

    EXPECT_TRUE(is_clean_with_caches(d.forest.node(d.sibling)));
    EXPECT_TRUE(is_clean_with_caches(d.forest.node(d.isolated)));
}

TEST(DirtyPropagation, DescendantsAreNotMarked) {
    Diamond d;
    d.forest.mark_dirty(d.m);

    EXPECT_TRUE(is_invalidated(d.forest.node(d.m)));
    EXPECT_TRUE(is_invalidated(d.forest.node(d.root)));
    EXPECT_TRUE(is_clean_with_caches(d.forest.node(d.leaf)));
    EXPECT_TRUE(is_clean_with_caches(d.forest.node(d.n)));
}

TEST(DirtyPropagation, RootOnlyMarksItself) {
    Diamond d;
    d.forest.mark_dirty(d.root);
    EXPECT_TRUE(is_invalidated(d.forest.node(d.root)));
    for (NodeId id : {d.leaf, d.m, d.n, d.sibling, d.isolated}) {
        EXPECT_TRUE(is_clean_with_caches(d.forest.node(id))) << "node " << id;
    }
}

TEST(DirtyPropagation, TwiceEqualsOnce) {
    Diamond once;
    Diamond twice;
    once.forest.mark_dirty(once.leaf);
    twice.forest.mark_dirty(twice.leaf);
    twice.forest.mark_dirty(twice.leaf);

    for (NodeId id = 0; id < once.forest.len(); ++id) {
        const NodeData& a = once.forest.node(id);
        const NodeData& b = twice.forest.node(id);
        EXPECT_EQ(a.is_dirty, b.is_dirty) << "node " << id;
        EXPECT_EQ(a.main_size_layout_cache.has_value(), b.main_size_layout_cache.has_value());
        EXPECT_EQ(a.other_layout_cache.has_value(), b.other_layout_cache.has_value());
    }
}

// Cache clearing does not erase the previous layout result.
TEST(DirtyPropagation, StaleLayoutIsKept) {
    Forest forest;
    NodeId id = forest.new_leaf({});
    NodeData& n = forest.node(id);
    n.layout.size = {40.0f, 30.0f};
    n.layout.location = {1.0f, 2.0f};
    n.store_caches(cache_of(40, 30), cache_of(40, 30));

    forest.mark_dirty(id);

    const NodeData& after = forest.node(id);
    EXPECT_TRUE(after.is_dirty);
    EXPECT_FALSE(after.main_size_layout_cache.has_value());
    EXPECT_FALSE(after.other_layout_cache.has_value());
    EXPECT_FLOAT_EQ(after.layout.size.width, 40.0f);
    EXPECT_FLOAT_EQ(after.layout.size.height, 30.0f);
    EXPECT_FLOAT_EQ(after.layout.location.y, 2.0f);
}

TEST(DirtyPropagation, DeepChainDoesNotRecurse) {
    Forest forest;
    NodeId below = forest.new_leaf({});
    NodeId deepest = below;
    for (int i = 0; i < 100000; ++i) {
        below = forest.new_with_children({}, {below});
    }
    NodeId top = below;
    compute_all(forest);

    forest.mark_dirty(deepest);

    EXPECT_TRUE(is_invalidated(forest.node(top)));
    EXPECT_TRUE(check_forest_invariants(forest).all_passed());
}

// A cycle breaks the acyclic precondition, but marking must still end.
// A wide, flat tree: every add_child only walks the single parent.
TEST(DirtyPropagation, WideTreeOnlyTouchesTheParent) {
    Forest forest;
    NodeId root = forest.new_leaf({});
    NodeId other = forest.new_leaf({});
    for (int i = 0; i < 50000; ++i) {
        forest.add_child(root, forest.new_leaf({}));
    }
    compute_all(forest);

    NodeId extra = forest.new_leaf({});
    forest.add_child(root, extra);

    EXPECT_EQ(forest.child_count(root), 50001u);
    EXPECT_TRUE(is_invalidated(forest.node(root)));
    EXPECT_TRUE(is_clean_with_caches(forest.node(other)));
    EXPECT_TRUE(is_clean_with_caches(forest.node(forest.child_at_index(root, 0))));
}

TEST(DirtyPropagation, CycleTerminates) {
    Forest forest;
    NodeId a = forest.new_leaf({});
    NodeId b = forest.new_with_children({}, {a});
    forest.add_child(a, b);
    compute_all(forest);

    forest.mark_dirty(a);

    EXPECT_TRUE(is_invalidated(forest.node(a)));
    EXPECT_TRUE(is_invalidated(forest.node(b)));
}

TEST(DirtyPropagation, UnknownNodeThrows) {
    Forest forest;
    EXPECT_THROW(forest.mark_dirty(0), std::runtime_error);
}

// ---------------------------------------------------------------------------
// 2. Mutations invalidate
// ---------------------------------------------------------------------------
TEST(DirtyPropagation, AddChildInvalidatesAncestors) {
    Diamond d;
    NodeId extra = d.forest.new_leaf({});
    d.forest.add_child(d.m, extra);
    EXPECT_TRUE(is_invalidated(d.forest.node(d.m)));
    EXPECT_TRUE(is_invalidated(d.forest.node(d.root)));
    EXPECT_TRUE(is_clean_with_caches(d.forest.node(d.n)));
}

TEST(DirtyPropagation, RemoveChildInvalidatesAncestors) {
    Diamond d;
    d.forest.remove_child(d.n, d.leaf);
    EXPECT_TRUE(is_invalidated(d.forest.node(d.n)));
    EXPECT_TRUE(is_invalidated(d.forest.node(d.root)));
    EXPECT_TRUE(is_clean_with_caches(d.forest.node(d.m)));
    EXPECT_TRUE(is_clean_with_caches(d.forest.node(d.leaf)));
}

TEST(DirtyPropagation, NoCacheOnDirtyNodeAfterMutations) {
    Diamond d;
    d.forest.mark_dirty(d.leaf);
    d.forest.set_children(d.m, {});
    d.forest.replace_child_at_index(d.root, 2, d.isolated);
    auto report = check_forest_invariants(d.forest);
    EXPECT_TRUE(report.all_passed()) << report.format_report();
}
