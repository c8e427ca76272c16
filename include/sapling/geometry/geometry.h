#pragma once
#include <sapling/style/flex_direction.h>

#include <optional>

namespace sapling::geometry {

using style::FlexDirection;

// Four-sided value. start/end are left/right for LTR text.
// Also used for padding/margin/border amounts per side.
template<typename T>
struct Rect {
    T start{};
    T end{};
    T top{};
    T bottom{};

    // start + end. Not the width of the rectangle.
    T horizontal_axis_sum() const { return start + end; }
    // top + bottom. Not the height of the rectangle.
    T vertical_axis_sum() const { return top + bottom; }

    T main_axis_sum(FlexDirection d) const {
        return style::is_row(d) ? horizontal_axis_sum() : vertical_axis_sum();
    }
    T cross_axis_sum(FlexDirection d) const {
        return style::is_row(d) ? vertical_axis_sum() : horizontal_axis_sum();
    }

    T main_start(FlexDirection d) const { return style::is_row(d) ? start : top; }
    T main_end(FlexDirection d) const { return style::is_row(d) ? end : bottom; }
    T cross_start(FlexDirection d) const { return style::is_row(d) ? top : start; }
    T cross_end(FlexDirection d) const { return style::is_row(d) ? bottom : end; }

    bool operator==(const Rect& other) const {
        return start == other.start && end == other.end &&
               top == other.top && bottom == other.bottom;
    }
    bool operator!=(const Rect& other) const { return !(*this == other); }
};

template<typename T>
struct Size {
    T width{};
    T height{};

    T main(FlexDirection d) const { return style::is_row(d) ? width : height; }
    T cross(FlexDirection d) const { return style::is_row(d) ? height : width; }

    void set_main(FlexDirection d, T value) {
        if (style::is_row(d)) width = value; else height = value;
    }
    void set_cross(FlexDirection d, T value) {
        if (style::is_row(d)) height = value; else width = value;
    }

    template<typename Fn>
    auto map(Fn&& fn) const -> Size<decltype(fn(width))> {
        return {fn(width), fn(height)};
    }

    bool operator==(const Size& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Size& other) const { return !(*this == other); }
};

// When used together with a Rect, the bottom-left corner.
template<typename T>
struct Point {
    T x{};
    T y{};

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const { return !(*this == other); }
};

// Size with possibly unknown extents (an unconstrained axis is nullopt).
using OptionalSize = Size<std::optional<float>>;

inline OptionalSize undefined_size() { return {std::nullopt, std::nullopt}; }
inline OptionalSize defined_size(float width, float height) { return {width, height}; }

} // namespace sapling::geometry
