#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace sapling::tree {

enum class TreeErrorKind {
    InvalidNode,
    InvalidParentNode,
    InvalidChildNode,
    ChildIndexOutOfBounds,
    ChildNotFound,
};

const char* tree_error_kind_name(TreeErrorKind kind);

// Thrown on a caller-contract violation. The tree is left untouched: every
// operation checks its preconditions before mutating anything.
class TreeError : public std::runtime_error {
public:
    TreeError(TreeErrorKind kind, const std::string& detail);

    TreeErrorKind kind() const { return kind_; }

    static TreeError invalid_node(std::size_t id);
    static TreeError invalid_parent(std::size_t id);
    static TreeError invalid_child(std::size_t id);
    static TreeError child_index_out_of_bounds(std::size_t parent, std::size_t index,
                                               std::size_t child_count);
    static TreeError child_not_found(std::size_t parent, std::size_t child);

private:
    TreeErrorKind kind_;
};

} // namespace sapling::tree
