#pragma once
#include <sapling/geometry/geometry.h>

#include <cstdint>
#include <functional>

namespace sapling::layout {

// Final geometry of a node, written back by the layout algorithm.
struct Layout {
    // Relative paint order of the node among its siblings.
    uint32_t order = 0;
    geometry::Size<float> size;
    // Relative to the parent's content box.
    geometry::Point<float> location;

    bool operator==(const Layout& other) const {
        return order == other.order && size == other.size && location == other.location;
    }
    bool operator!=(const Layout& other) const { return !(*this == other); }
};

// One memoized sizing result. The tree stores these without inspecting them;
// the layout algorithm decides what the key fields mean.
struct LayoutCache {
    geometry::OptionalSize node_size;
    geometry::OptionalSize parent_size;
    bool perform_layout = false;
    geometry::Size<float> size;

    bool operator==(const LayoutCache& other) const {
        return node_size == other.node_size && parent_size == other.parent_size &&
               perform_layout == other.perform_layout && size == other.size;
    }
};

// Intrinsic size of a leaf (text, image) given the known constraints.
using MeasureFunc = std::function<geometry::Size<float>(const geometry::OptionalSize&)>;

} // namespace sapling::layout
