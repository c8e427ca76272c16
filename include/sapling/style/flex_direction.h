#pragma once

namespace sapling::style {

// Main axis of a flex container. Row is the default.
enum class FlexDirection { Row, Column, RowReverse, ColumnReverse };

inline bool is_row(FlexDirection d) {
    return d == FlexDirection::Row || d == FlexDirection::RowReverse;
}
inline bool is_column(FlexDirection d) {
    return d == FlexDirection::Column || d == FlexDirection::ColumnReverse;
}
inline bool is_reverse(FlexDirection d) {
    return d == FlexDirection::RowReverse || d == FlexDirection::ColumnReverse;
}

} // namespace sapling::style
