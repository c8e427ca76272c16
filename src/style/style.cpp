#include <sapling/style/style.h>

namespace sapling::style {

std::optional<float> Dimension::resolve(std::optional<float> parent_value) const {
    switch (unit) {
        case Unit::Points:
            return value;
        case Unit::Percent:
            if (!parent_value) return std::nullopt;
            return *parent_value * value;
        case Unit::Undefined:
        case Unit::Auto:
            break;
    }
    return std::nullopt;
}

DimensionRect rect_from_points(float start, float end, float top, float bottom) {
    return {Dimension::points(start), Dimension::points(end),
            Dimension::points(top), Dimension::points(bottom)};
}

DimensionRect rect_from_percent(float start, float end, float top, float bottom) {
    return {Dimension::percent(start), Dimension::percent(end),
            Dimension::percent(top), Dimension::percent(bottom)};
}

DimensionRect rect_top_from_points(float start, float top) {
    DimensionRect r;
    r.start = Dimension::points(start);
    r.top = Dimension::points(top);
    return r;
}

DimensionRect rect_bot_from_points(float end, float bottom) {
    DimensionRect r;
    r.end = Dimension::points(end);
    r.bottom = Dimension::points(bottom);
    return r;
}

DimensionRect rect_top_from_percent(float start, float top) {
    DimensionRect r;
    r.start = Dimension::percent(start);
    r.top = Dimension::percent(top);
    return r;
}

DimensionRect rect_bot_from_percent(float end, float bottom) {
    DimensionRect r;
    r.end = Dimension::percent(end);
    r.bottom = Dimension::percent(bottom);
    return r;
}

DimensionRect undefined_rect() {
    return {};
}

DimensionRect auto_rect() {
    return {Dimension::auto_val(), Dimension::auto_val(),
            Dimension::auto_val(), Dimension::auto_val()};
}

DimensionSize size_from_points(float width, float height) {
    return {Dimension::points(width), Dimension::points(height)};
}

DimensionSize size_from_percent(float width, float height) {
    return {Dimension::percent(width), Dimension::percent(height)};
}

DimensionSize auto_size() {
    return {Dimension::auto_val(), Dimension::auto_val()};
}

AlignSelf FlexboxLayout::resolved_align_self(const FlexboxLayout& parent) const {
    if (align_self != AlignSelf::Auto) {
        return align_self;
    }
    switch (parent.align_items) {
        case AlignItems::FlexStart: return AlignSelf::FlexStart;
        case AlignItems::FlexEnd:   return AlignSelf::FlexEnd;
        case AlignItems::Center:    return AlignSelf::Center;
        case AlignItems::Baseline:  return AlignSelf::Baseline;
        case AlignItems::Stretch:   return AlignSelf::Stretch;
    }
    return AlignSelf::Stretch;
}

bool FlexboxLayout::operator==(const FlexboxLayout& other) const {
    return display == other.display &&
           position_type == other.position_type &&
           flex_direction == other.flex_direction &&
           flex_wrap == other.flex_wrap &&
           align_items == other.align_items &&
           align_self == other.align_self &&
           align_content == other.align_content &&
           justify_content == other.justify_content &&
           position == other.position &&
           margin == other.margin &&
           padding == other.padding &&
           border == other.border &&
           flex_grow == other.flex_grow &&
           flex_shrink == other.flex_shrink &&
           flex_basis == other.flex_basis &&
           size == other.size &&
           min_size == other.min_size &&
           max_size == other.max_size &&
           aspect_ratio == other.aspect_ratio;
}

const char* flex_direction_name(FlexDirection d) {
    switch (d) {
        case FlexDirection::Row:           return "row";
        case FlexDirection::Column:        return "column";
        case FlexDirection::RowReverse:    return "row-reverse";
        case FlexDirection::ColumnReverse: return "column-reverse";
    }
    return "unknown";
}

const char* display_name(Display d) {
    switch (d) {
        case Display::Flex: return "flex";
        case Display::None: return "none";
    }
    return "unknown";
}

} // namespace sapling::style
