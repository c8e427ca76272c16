#include <sapling/tree/tree_error.h>

namespace sapling::tree {

const char* tree_error_kind_name(TreeErrorKind kind) {
    switch (kind) {
        case TreeErrorKind::InvalidNode:           return "invalid node";
        case TreeErrorKind::InvalidParentNode:     return "invalid parent node";
        case TreeErrorKind::InvalidChildNode:      return "invalid child node";
        case TreeErrorKind::ChildIndexOutOfBounds: return "child index out of bounds";
        case TreeErrorKind::ChildNotFound:         return "child not found";
    }
    return "unknown";
}

TreeError::TreeError(TreeErrorKind kind, const std::string& detail)
    : std::runtime_error(std::string(tree_error_kind_name(kind)) + ": " + detail),
      kind_(kind) {}

TreeError TreeError::invalid_node(std::size_t id) {
    return TreeError(TreeErrorKind::InvalidNode, "node " + std::to_string(id));
}

TreeError TreeError::invalid_parent(std::size_t id) {
    return TreeError(TreeErrorKind::InvalidParentNode, "parent " + std::to_string(id));
}

TreeError TreeError::invalid_child(std::size_t id) {
    return TreeError(TreeErrorKind::InvalidChildNode, "child " + std::to_string(id));
}

TreeError TreeError::child_index_out_of_bounds(std::size_t parent, std::size_t index,
                                               std::size_t child_count) {
    return TreeError(TreeErrorKind::ChildIndexOutOfBounds,
                     "index " + std::to_string(index) + " on parent " +
                     std::to_string(parent) + " with " +
                     std::to_string(child_count) + " children");
}

TreeError TreeError::child_not_found(std::size_t parent, std::size_t child) {
    return TreeError(TreeErrorKind::ChildNotFound,
                     "node " + std::to_string(child) + " is not a child of " +
                     std::to_string(parent));
}

} // namespace sapling::tree
