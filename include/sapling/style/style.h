#pragma once
#include <sapling/geometry/geometry.h>
#include <sapling/style/flex_direction.h>

#include <optional>

namespace sapling::style {

enum class AlignItems { FlexStart, FlexEnd, Center, Baseline, Stretch };
enum class AlignSelf { Auto, FlexStart, FlexEnd, Center, Baseline, Stretch };
enum class AlignContent { FlexStart, FlexEnd, Center, Stretch, SpaceBetween, SpaceAround };
enum class Display { Flex, None };
enum class JustifyContent { FlexStart, FlexEnd, Center, SpaceBetween, SpaceAround, SpaceEvenly };
// Relative is the default here, unlike CSS where it is static.
enum class PositionType { Relative, Absolute };
enum class FlexWrap { NoWrap, Wrap, WrapReverse };

// A unit of linear measurement. Defaults to Undefined.
struct Dimension {
    enum class Unit { Undefined, Auto, Points, Percent };
    float value = 0;
    Unit unit = Unit::Undefined;

    static Dimension undefined() { return {0, Unit::Undefined}; }
    static Dimension auto_val() { return {0, Unit::Auto}; }
    static Dimension points(float v) { return {v, Unit::Points}; }
    static Dimension percent(float v) { return {v, Unit::Percent}; }

    bool is_undefined() const { return unit == Unit::Undefined; }
    bool is_auto() const { return unit == Unit::Auto; }
    // Points and Percent carry a value; Undefined and Auto do not.
    bool is_defined() const { return unit == Unit::Points || unit == Unit::Percent; }

    // Points as-is, Percent (a fraction, 0.5 == 50%) against parent_value,
    // nullopt otherwise.
    std::optional<float> resolve(std::optional<float> parent_value) const;

    bool operator==(const Dimension& other) const {
        if (unit != other.unit) return false;
        return !is_defined() || value == other.value;
    }
    bool operator!=(const Dimension& other) const { return !(*this == other); }
};

using DimensionRect = geometry::Rect<Dimension>;
using DimensionSize = geometry::Size<Dimension>;

DimensionRect rect_from_points(float start, float end, float top, float bottom);
DimensionRect rect_from_percent(float start, float end, float top, float bottom);
// Only start and top are set; end and bottom stay Undefined.
DimensionRect rect_top_from_points(float start, float top);
// Only end and bottom are set; start and top stay Undefined.
DimensionRect rect_bot_from_points(float end, float bottom);
DimensionRect rect_top_from_percent(float start, float top);
DimensionRect rect_bot_from_percent(float end, float bottom);
// Every side Undefined / every side Auto.
DimensionRect undefined_rect();
DimensionRect auto_rect();

DimensionSize size_from_points(float width, float height);
DimensionSize size_from_percent(float width, float height);
DimensionSize auto_size();

// Flexbox style of a single node. Field names follow the CSS properties.
struct FlexboxLayout {
    Display display = Display::Flex;
    PositionType position_type = PositionType::Relative;
    FlexDirection flex_direction = FlexDirection::Row;
    FlexWrap flex_wrap = FlexWrap::NoWrap;
    AlignItems align_items = AlignItems::Stretch;
    AlignSelf align_self = AlignSelf::Auto;
    AlignContent align_content = AlignContent::Stretch;
    JustifyContent justify_content = JustifyContent::FlexStart;
    DimensionRect position;
    DimensionRect margin;
    DimensionRect padding;
    DimensionRect border;
    float flex_grow = 0.0f;
    float flex_shrink = 1.0f;
    Dimension flex_basis = Dimension::auto_val();
    DimensionSize size = auto_size();
    DimensionSize min_size = auto_size();
    DimensionSize max_size = auto_size();
    // width / height
    std::optional<float> aspect_ratio;

    Dimension min_main_size(FlexDirection d) const { return min_size.main(d); }
    Dimension max_main_size(FlexDirection d) const { return max_size.main(d); }
    Dimension main_margin_start(FlexDirection d) const { return margin.main_start(d); }
    Dimension main_margin_end(FlexDirection d) const { return margin.main_end(d); }
    Dimension cross_size(FlexDirection d) const { return size.cross(d); }
    Dimension min_cross_size(FlexDirection d) const { return min_size.cross(d); }
    Dimension max_cross_size(FlexDirection d) const { return max_size.cross(d); }
    Dimension cross_margin_start(FlexDirection d) const { return margin.cross_start(d); }
    Dimension cross_margin_end(FlexDirection d) const { return margin.cross_end(d); }

    // Effective cross-axis alignment inside `parent`. Never returns Auto.
    AlignSelf resolved_align_self(const FlexboxLayout& parent) const;

    bool operator==(const FlexboxLayout& other) const;
    bool operator!=(const FlexboxLayout& other) const { return !(*this == other); }
};

const char* flex_direction_name(FlexDirection d);
const char* display_name(Display d);

} // namespace sapling::style
