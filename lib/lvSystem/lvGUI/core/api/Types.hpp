#pragma once

#include <stdint.h>

#include <lvgl.h>

namespace lvgui
{
    struct Color
    {
        lv_color_t value;

        static Color rgb(uint8_t r, uint8_t g, uint8_t b) { return Color{lv_color_make(r, g, b)}; }
        static Color hex(uint32_t rgb) { return Color{lv_color_hex(rgb)}; }
        static Color hex3(uint32_t rgb) { return Color{lv_color_hex3(rgb)}; }
        static Color white() { return Color{lv_color_white()}; }
        static Color black() { return Color{lv_color_black()}; }
        static Color palette(lv_palette_t p) { return Color{lv_palette_main(p)}; }

        uint16_t rgb565() const { return lv_color_to_u16(value); }

        operator lv_color_t() const { return value; }

        bool operator==(const Color &other) const { return lv_color_eq(value, other.value); }
        bool operator!=(const Color &other) const { return !(*this == other); }
    };

    enum class Align : uint8_t
    {
        Default = LV_ALIGN_DEFAULT,
        TopLeft = LV_ALIGN_TOP_LEFT,
        TopMid = LV_ALIGN_TOP_MID,
        TopRight = LV_ALIGN_TOP_RIGHT,
        BottomLeft = LV_ALIGN_BOTTOM_LEFT,
        BottomMid = LV_ALIGN_BOTTOM_MID,
        BottomRight = LV_ALIGN_BOTTOM_RIGHT,
        LeftMid = LV_ALIGN_LEFT_MID,
        RightMid = LV_ALIGN_RIGHT_MID,
        Center = LV_ALIGN_CENTER,
        OutTopLeft = LV_ALIGN_OUT_TOP_LEFT,
        OutTopMid = LV_ALIGN_OUT_TOP_MID,
        OutTopRight = LV_ALIGN_OUT_TOP_RIGHT,
        OutBottomLeft = LV_ALIGN_OUT_BOTTOM_LEFT,
        OutBottomMid = LV_ALIGN_OUT_BOTTOM_MID,
        OutBottomRight = LV_ALIGN_OUT_BOTTOM_RIGHT,
        OutLeftTop = LV_ALIGN_OUT_LEFT_TOP,
        OutLeftMid = LV_ALIGN_OUT_LEFT_MID,
        OutLeftBottom = LV_ALIGN_OUT_LEFT_BOTTOM,
        OutRightTop = LV_ALIGN_OUT_RIGHT_TOP,
        OutRightMid = LV_ALIGN_OUT_RIGHT_MID,
        OutRightBottom = LV_ALIGN_OUT_RIGHT_BOTTOM
    };

    enum class State : uint16_t
    {
        Default = LV_STATE_DEFAULT,
        Checked = LV_STATE_CHECKED,
        Focused = LV_STATE_FOCUSED,
        FocusKey = LV_STATE_FOCUS_KEY,
        Edited = LV_STATE_EDITED,
        Hovered = LV_STATE_HOVERED,
        Pressed = LV_STATE_PRESSED,
        Scrolled = LV_STATE_SCROLLED,
        Disabled = LV_STATE_DISABLED
    };

    enum class Part : uint32_t
    {
        Main = LV_PART_MAIN,
        Scrollbar = LV_PART_SCROLLBAR,
        Indicator = LV_PART_INDICATOR,
        Knob = LV_PART_KNOB,
        Selected = LV_PART_SELECTED,
        Items = LV_PART_ITEMS,
        Cursor = LV_PART_CURSOR,
        Any = LV_PART_ANY
    };

    // Part and state packed the way lv_obj_add_style expects them.
    using Selector = lv_style_selector_t;

    constexpr Selector selector(Part part, State state = State::Default)
    {
        return static_cast<Selector>(part) | static_cast<Selector>(state);
    }

    constexpr Selector MainDefault = 0;

    enum class EventCode : uint32_t
    {
        All = LV_EVENT_ALL,
        Pressed = LV_EVENT_PRESSED,
        Pressing = LV_EVENT_PRESSING,
        PressLost = LV_EVENT_PRESS_LOST,
        ShortClicked = LV_EVENT_SHORT_CLICKED,
        Clicked = LV_EVENT_CLICKED,
        LongPressed = LV_EVENT_LONG_PRESSED,
        LongPressedRepeat = LV_EVENT_LONG_PRESSED_REPEAT,
        Released = LV_EVENT_RELEASED,
        Focused = LV_EVENT_FOCUSED,
        Defocused = LV_EVENT_DEFOCUSED,
        Key = LV_EVENT_KEY,
        ValueChanged = LV_EVENT_VALUE_CHANGED,
        Ready = LV_EVENT_READY,
        Cancel = LV_EVENT_CANCEL,
        Delete = LV_EVENT_DELETE,
        SizeChanged = LV_EVENT_SIZE_CHANGED,
        ScreenLoaded = LV_EVENT_SCREEN_LOADED
    };

    enum class GradDir : uint8_t
    {
        None = LV_GRAD_DIR_NONE,
        Vertical = LV_GRAD_DIR_VER,
        Horizontal = LV_GRAD_DIR_HOR
    };

    enum class BorderSide : uint8_t
    {
        None = LV_BORDER_SIDE_NONE,
        Bottom = LV_BORDER_SIDE_BOTTOM,
        Top = LV_BORDER_SIDE_TOP,
        Left = LV_BORDER_SIDE_LEFT,
        Right = LV_BORDER_SIDE_RIGHT,
        Full = LV_BORDER_SIDE_FULL,
        Internal = LV_BORDER_SIDE_INTERNAL
    };

    enum class TextAlign : uint8_t
    {
        Auto = LV_TEXT_ALIGN_AUTO,
        Left = LV_TEXT_ALIGN_LEFT,
        Center = LV_TEXT_ALIGN_CENTER,
        Right = LV_TEXT_ALIGN_RIGHT
    };

    enum class FlexFlow : uint8_t
    {
        Row = LV_FLEX_FLOW_ROW,
        Column = LV_FLEX_FLOW_COLUMN,
        RowWrap = LV_FLEX_FLOW_ROW_WRAP,
        ColumnWrap = LV_FLEX_FLOW_COLUMN_WRAP
    };

    enum class FlexAlign : uint8_t
    {
        Start = LV_FLEX_ALIGN_START,
        End = LV_FLEX_ALIGN_END,
        Center = LV_FLEX_ALIGN_CENTER,
        SpaceEvenly = LV_FLEX_ALIGN_SPACE_EVENLY,
        SpaceAround = LV_FLEX_ALIGN_SPACE_AROUND,
        SpaceBetween = LV_FLEX_ALIGN_SPACE_BETWEEN
    };

    inline int32_t pct(int32_t v)
    {
        return lv_pct(v);
    }
}
