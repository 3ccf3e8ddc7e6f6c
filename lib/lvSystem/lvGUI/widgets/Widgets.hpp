#pragma once

#include <stdarg.h>
#include <stdint.h>

#include <lvgl.h>

#include <lvGUI/core/api/Runtime.hpp>
#include <lvGUI/core/api/Types.hpp>
#include <lvGUI/widgets/Widget.hpp>

namespace lvgui
{
    enum class LabelLongMode : uint8_t
    {
        Wrap = LV_LABEL_LONG_WRAP,
        Dot = LV_LABEL_LONG_DOT,
        Scroll = LV_LABEL_LONG_SCROLL,
        ScrollCircular = LV_LABEL_LONG_SCROLL_CIRCULAR,
        Clip = LV_LABEL_LONG_CLIP,
    };

    enum class ArcMode : uint8_t
    {
        Normal = LV_ARC_MODE_NORMAL,
        Symmetrical = LV_ARC_MODE_SYMMETRICAL,
        Reverse = LV_ARC_MODE_REVERSE,
    };

    enum class ChartType : uint8_t
    {
        None = LV_CHART_TYPE_NONE,
        Line = LV_CHART_TYPE_LINE,
        Bar = LV_CHART_TYPE_BAR,
        Scatter = LV_CHART_TYPE_SCATTER,
    };

    enum class ChartAxis : uint8_t
    {
        PrimaryY = LV_CHART_AXIS_PRIMARY_Y,
        SecondaryY = LV_CHART_AXIS_SECONDARY_Y,
        PrimaryX = LV_CHART_AXIS_PRIMARY_X,
        SecondaryX = LV_CHART_AXIS_SECONDARY_X,
    };

    enum class ChartUpdateMode : uint8_t
    {
        Shift = LV_CHART_UPDATE_MODE_SHIFT,
        Circular = LV_CHART_UPDATE_MODE_CIRCULAR,
    };

    enum class RollerMode : uint8_t
    {
        Normal = LV_ROLLER_MODE_NORMAL,
        Infinite = LV_ROLLER_MODE_INFINITE,
    };

    enum class KeyboardMode : uint8_t
    {
        TextLower = LV_KEYBOARD_MODE_TEXT_LOWER,
        TextUpper = LV_KEYBOARD_MODE_TEXT_UPPER,
        Special = LV_KEYBOARD_MODE_SPECIAL,
        Number = LV_KEYBOARD_MODE_NUMBER,
    };

    enum class ScaleMode : uint8_t
    {
        HorizontalTop = LV_SCALE_MODE_HORIZONTAL_TOP,
        HorizontalBottom = LV_SCALE_MODE_HORIZONTAL_BOTTOM,
        VerticalLeft = LV_SCALE_MODE_VERTICAL_LEFT,
        VerticalRight = LV_SCALE_MODE_VERTICAL_RIGHT,
        RoundInner = LV_SCALE_MODE_ROUND_INNER,
        RoundOuter = LV_SCALE_MODE_ROUND_OUTER,
    };

    // Series storage belongs to the chart; only use it while the chart is alive.
    struct ChartSeries
    {
        lv_chart_series_t *raw = nullptr;
        bool valid() const { return raw != nullptr; }
    };

    struct CalendarDate
    {
        uint16_t year = 0;
        uint8_t month = 0;
        uint8_t day = 0;
    };

    namespace kind
    {
        struct Label
        {
            static lv_obj_t *create(lv_obj_t *parent) { return lv_label_create(parent); }
            static const lv_obj_class_t *classPtr() { return &lv_label_class; }
            static void setText(lv_obj_t *o, const char *t) { lv_label_set_text(o, t); }
            static const char *text(lv_obj_t *o) { return lv_label_get_text(o); }

            template <typename Self>
            class Ops : public TextContent<Self, Label>
            {
            public:
                // The string is not copied and must outlive the label.
                void setTextStatic(const char *text)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_label_set_text_static(o, text);
                }

                void setTextFmt(const char *fmt, ...)
                {
                    lv_obj_t *o = detail::selfRaw<Self>(this);
                    if (!o || !fmt)
                        return;

                    char buf[128];
                    va_list args;
                    va_start(args, fmt);
                    lv_vsnprintf(buf, sizeof(buf), fmt, args);
                    va_end(args);
                    lv_label_set_text(o, buf);
                }

                void setLongMode(LabelLongMode mode)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_label_set_long_mode(o, static_cast<lv_label_long_mode_t>(mode));
                }
            };
        };

        struct Button
        {
            static lv_obj_t *create(lv_obj_t *parent) { return lv_button_create(parent); }
            static const lv_obj_class_t *classPtr() { return &lv_button_class; }

            template <typename Self>
            class Ops
            {
            public:
                // Button with a centered label child.
                static Result<Self> createWithLabel(const Obj &parent, const char *text)
                {
                    Result<Self> btn = Self::create(parent);
                    if (!btn)
                        return btn;

                    lv_obj_t *label = lv_label_create(btn->raw());
                    if (!label)
                    {
                        btn->destroy();
                        return Error::OutOfMemory;
                    }
                    lv_label_set_text(label, text ? text : "");
                    lv_obj_center(label);
                    return btn;
                }

                // Updates the first label child, if there is one.
                bool setLabelText(const char *text)
                {
                    lv_obj_t *label = firstLabel();
                    if (!label)
                        return false;
                    lv_label_set_text(label, text ? text : "");
                    return true;
                }

                const char *labelText() const
                {
                    lv_obj_t *label = firstLabel();
                    return label ? lv_label_get_text(label) : "";
                }

            private:
                lv_obj_t *firstLabel() const
                {
                    lv_obj_t *o = detail::selfRaw<Self>(this);
                    if (!o)
                        return nullptr;

                    uint32_t n = lv_obj_get_child_count(o);
                    for (uint32_t i = 0; i < n; ++i)
                    {
                        lv_obj_t *c = lv_obj_get_child(o, static_cast<int32_t>(i));
                        if (lv_obj_check_type(c, &lv_label_class))
                            return c;
                    }
                    return nullptr;
                }
            };
        };

        struct Slider
        {
            static lv_obj_t *create(lv_obj_t *parent) { return lv_slider_create(parent); }
            static const lv_obj_class_t *classPtr() { return &lv_slider_class; }
            static void setValue(lv_obj_t *o, int32_t v, lv_anim_enable_t a) { lv_slider_set_value(o, v, a); }
            static int32_t value(lv_obj_t *o) { return lv_slider_get_value(o); }
            static void setRange(lv_obj_t *o, int32_t min, int32_t max) { lv_slider_set_range(o, min, max); }
            static int32_t minValue(lv_obj_t *o) { return lv_slider_get_min_value(o); }
            static int32_t maxValue(lv_obj_t *o) { return lv_slider_get_max_value(o); }

            template <typename Self>
            class Ops : public ValueRange<Self, Slider>, public RangeBounds<Self, Slider>
            {
            public:
                bool isDragged() const
                {
                    lv_obj_t *o = detail::selfRaw<Self>(this);
                    return o && lv_slider_is_dragged(o);
                }
            };
        };

        struct Switch
        {
            static lv_obj_t *create(lv_obj_t *parent) { return lv_switch_create(parent); }
            static const lv_obj_class_t *classPtr() { return &lv_switch_class; }

            template <typename Self>
            class Ops : public Checkable<Self>
            {
            };
        };

        struct Checkbox
        {
            static lv_obj_t *create(lv_obj_t *parent) { return lv_checkbox_create(parent); }
            static const lv_obj_class_t *classPtr() { return &lv_checkbox_class; }
            static void setText(lv_obj_t *o, const char *t) { lv_checkbox_set_text(o, t); }
            static const char *text(lv_obj_t *o) { return lv_checkbox_get_text(o); }

            template <typename Self>
            class Ops : public TextContent<Self, Checkbox>, public Checkable<Self>
            {
            };
        };

        struct Bar
        {
            static lv_obj_t *create(lv_obj_t *parent) { return lv_bar_create(parent); }
            static const lv_obj_class_t *classPtr() { return &lv_bar_class; }
            static void setValue(lv_obj_t *o, int32_t v, lv_anim_enable_t a) { lv_bar_set_value(o, v, a); }
            static int32_t value(lv_obj_t *o) { return lv_bar_get_value(o); }
            static void setRange(lv_obj_t *o, int32_t min, int32_t max) { lv_bar_set_range(o, min, max); }
            static int32_t minValue(lv_obj_t *o) { return lv_bar_get_min_value(o); }
            static int32_t maxValue(lv_obj_t *o) { return lv_bar_get_max_value(o); }

            template <typename Self>
            class Ops : public ValueRange<Self, Bar>, public RangeBounds<Self, Bar>
            {
            public:
                void setStartValue(int32_t value, bool animate = false)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_bar_set_start_value(o, value, animate ? LV_ANIM_ON : LV_ANIM_OFF);
                }
            };
        };

        struct Arc
        {
            static lv_obj_t *create(lv_obj_t *parent) { return lv_arc_create(parent); }
            static const lv_obj_class_t *classPtr() { return &lv_arc_class; }
            // Arcs have no value animation.
            static void setValue(lv_obj_t *o, int32_t v, lv_anim_enable_t) { lv_arc_set_value(o, v); }
            static int32_t value(lv_obj_t *o) { return lv_arc_get_value(o); }
            static void setRange(lv_obj_t *o, int32_t min, int32_t max) { lv_arc_set_range(o, min, max); }
            static int32_t minValue(lv_obj_t *o) { return lv_arc_get_min_value(o); }
            static int32_t maxValue(lv_obj_t *o) { return lv_arc_get_max_value(o); }

            template <typename Self>
            class Ops : public ValueRange<Self, Arc>, public RangeBounds<Self, Arc>
            {
            public:
                void setAngles(int32_t start, int32_t end)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_arc_set_angles(o, start, end);
                }

                void setBgAngles(int32_t start, int32_t end)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_arc_set_bg_angles(o, start, end);
                }

                void setRotation(int32_t degrees)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_arc_set_rotation(o, degrees);
                }

                void setMode(ArcMode mode)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_arc_set_mode(o, static_cast<lv_arc_mode_t>(mode));
                }
            };
        };

        struct Spinner
        {
            static lv_obj_t *create(lv_obj_t *parent) { return lv_spinner_create(parent); }
            static const lv_obj_class_t *classPtr() { return &lv_spinner_class; }

            template <typename Self>
            class Ops
            {
            public:
                void setAnimParams(uint32_t periodMs, uint32_t arcDegrees)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_spinner_set_anim_params(o, periodMs, arcDegrees);
                }
            };
        };

        struct Led
        {
            static lv_obj_t *create(lv_obj_t *parent) { return lv_led_create(parent); }
            static const lv_obj_class_t *classPtr() { return &lv_led_class; }

            template <typename Self>
            class Ops
            {
            public:
                void on()
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_led_on(o);
                }

                void off()
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_led_off(o);
                }

                void toggle()
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_led_toggle(o);
                }

                void setBrightness(uint8_t level)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_led_set_brightness(o, level);
                }

                uint8_t brightness() const
                {
                    lv_obj_t *o = detail::selfRaw<Self>(this);
                    return o ? lv_led_get_brightness(o) : 0;
                }

                void setColor(Color color)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_led_set_color(o, color);
                }
            };
        };

        struct Chart
        {
            static lv_obj_t *create(lv_obj_t *parent) { return lv_chart_create(parent); }
            static const lv_obj_class_t *classPtr() { return &lv_chart_class; }

            template <typename Self>
            class Ops
            {
            public:
                void setType(ChartType type)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_chart_set_type(o, static_cast<lv_chart_type_t>(type));
                }

                void setPointCount(uint32_t count)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_chart_set_point_count(o, count);
                }

                uint32_t pointCount() const
                {
                    lv_obj_t *o = detail::selfRaw<Self>(this);
                    return o ? lv_chart_get_point_count(o) : 0;
                }

                void setAxisRange(ChartAxis axis, int32_t min, int32_t max)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_chart_set_range(o, static_cast<lv_chart_axis_t>(axis), min, max);
                }

                void setDivLineCount(uint8_t hdiv, uint8_t vdiv)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_chart_set_div_line_count(o, hdiv, vdiv);
                }

                void setUpdateMode(ChartUpdateMode mode)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_chart_set_update_mode(o, static_cast<lv_chart_update_mode_t>(mode));
                }

                ChartSeries addSeries(Color color, ChartAxis axis = ChartAxis::PrimaryY)
                {
                    ChartSeries s;
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        s.raw = lv_chart_add_series(o, color, static_cast<lv_chart_axis_t>(axis));
                    return s;
                }

                void setNextValue(ChartSeries series, int32_t value)
                {
                    lv_obj_t *o = detail::selfRaw<Self>(this);
                    if (o && series.valid())
                        lv_chart_set_next_value(o, series.raw, value);
                }

                void setAllValues(ChartSeries series, int32_t value)
                {
                    lv_obj_t *o = detail::selfRaw<Self>(this);
                    if (o && series.valid())
                        lv_chart_set_all_value(o, series.raw, value);
                }

                void refresh()
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_chart_refresh(o);
                }
            };
        };

        struct Tabview
        {
            static lv_obj_t *create(lv_obj_t *parent) { return lv_tabview_create(parent); }
            static const lv_obj_class_t *classPtr() { return &lv_tabview_class; }

            template <typename Self>
            class Ops
            {
            public:
                // Returns the page container for the new tab.
                Obj addTab(const char *name)
                {
                    lv_obj_t *o = detail::selfRaw<Self>(this);
                    if (!o)
                        return Obj();
                    return detail::self<Self>(this).adopt(lv_tabview_add_tab(o, name ? name : ""));
                }

                void setActive(uint32_t index, bool animate = false)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_tabview_set_active(o, index, animate ? LV_ANIM_ON : LV_ANIM_OFF);
                }

                uint32_t active() const
                {
                    lv_obj_t *o = detail::selfRaw<Self>(this);
                    return o ? lv_tabview_get_tab_active(o) : 0;
                }

                uint32_t tabCount() const
                {
                    lv_obj_t *o = detail::selfRaw<Self>(this);
                    return o ? lv_tabview_get_tab_count(o) : 0;
                }

                void setTabBarPosition(lv_dir_t dir)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_tabview_set_tab_bar_position(o, dir);
                }

                void setTabBarSize(int32_t size)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_tabview_set_tab_bar_size(o, size);
                }

                Obj content() const
                {
                    lv_obj_t *o = detail::selfRaw<Self>(this);
                    return o ? detail::self<Self>(this).adopt(lv_tabview_get_content(o)) : Obj();
                }
            };
        };

        struct Dropdown
        {
            static lv_obj_t *create(lv_obj_t *parent) { return lv_dropdown_create(parent); }
            static const lv_obj_class_t *classPtr() { return &lv_dropdown_class; }
            static void setOptions(lv_obj_t *o, const char *opts) { lv_dropdown_set_options(o, opts); }
            static uint32_t selected(lv_obj_t *o) { return lv_dropdown_get_selected(o); }
            // The dropdown list does not animate its selection.
            static void setSelected(lv_obj_t *o, uint32_t i, lv_anim_enable_t) { lv_dropdown_set_selected(o, i); }
            static void selectedText(lv_obj_t *o, char *buf, uint32_t n) { lv_dropdown_get_selected_str(o, buf, n); }
            static uint32_t optionCount(lv_obj_t *o) { return lv_dropdown_get_option_count(o); }

            template <typename Self>
            class Ops : public OptionList<Self, Dropdown>
            {
            public:
                void addOption(const char *option, uint32_t pos = LV_DROPDOWN_POS_LAST)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_dropdown_add_option(o, option, pos);
                }

                void open()
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_dropdown_open(o);
                }

                void close()
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_dropdown_close(o);
                }
            };
        };

        struct Roller
        {
            static lv_obj_t *create(lv_obj_t *parent) { return lv_roller_create(parent); }
            static const lv_obj_class_t *classPtr() { return &lv_roller_class; }
            static void setOptions(lv_obj_t *o, const char *opts) { lv_roller_set_options(o, opts, LV_ROLLER_MODE_NORMAL); }
            static uint32_t selected(lv_obj_t *o) { return lv_roller_get_selected(o); }
            static void setSelected(lv_obj_t *o, uint32_t i, lv_anim_enable_t a) { lv_roller_set_selected(o, i, a); }
            static void selectedText(lv_obj_t *o, char *buf, uint32_t n) { lv_roller_get_selected_str(o, buf, n); }
            static uint32_t optionCount(lv_obj_t *o) { return lv_roller_get_option_count(o); }

            template <typename Self>
            class Ops : public OptionList<Self, Roller>
            {
            public:
                void setOptionsMode(const char *options, RollerMode mode)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_roller_set_options(o, options, static_cast<lv_roller_mode_t>(mode));
                }

                void setVisibleRowCount(uint32_t rows)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_roller_set_visible_row_count(o, rows);
                }
            };
        };

        struct Textarea
        {
            static lv_obj_t *create(lv_obj_t *parent) { return lv_textarea_create(parent); }
            static const lv_obj_class_t *classPtr() { return &lv_textarea_class; }
            static void setText(lv_obj_t *o, const char *t) { lv_textarea_set_text(o, t); }
            static const char *text(lv_obj_t *o) { return lv_textarea_get_text(o); }

            template <typename Self>
            class Ops : public TextContent<Self, Textarea>
            {
            public:
                void addText(const char *text)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_textarea_add_text(o, text);
                }

                void deleteChar()
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_textarea_delete_char(o);
                }

                void setPlaceholderText(const char *text)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_textarea_set_placeholder_text(o, text);
                }

                void setOneLine(bool enable)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_textarea_set_one_line(o, enable);
                }

                void setPasswordMode(bool enable)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_textarea_set_password_mode(o, enable);
                }

                void setMaxLength(uint32_t length)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_textarea_set_max_length(o, length);
                }

                void setAcceptedChars(const char *chars)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_textarea_set_accepted_chars(o, chars);
                }
            };
        };

        struct Table
        {
            static lv_obj_t *create(lv_obj_t *parent) { return lv_table_create(parent); }
            static const lv_obj_class_t *classPtr() { return &lv_table_class; }

            template <typename Self>
            class Ops
            {
            public:
                void setRowCount(uint32_t rows)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_table_set_row_count(o, rows);
                }

                void setColumnCount(uint32_t cols)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_table_set_column_count(o, cols);
                }

                uint32_t rowCount() const
                {
                    lv_obj_t *o = detail::selfRaw<Self>(this);
                    return o ? lv_table_get_row_count(o) : 0;
                }

                uint32_t columnCount() const
                {
                    lv_obj_t *o = detail::selfRaw<Self>(this);
                    return o ? lv_table_get_column_count(o) : 0;
                }

                // Grows the table when the cell lies outside it.
                void setCellValue(uint32_t row, uint32_t col, const char *text)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_table_set_cell_value(o, row, col, text ? text : "");
                }

                const char *cellValue(uint32_t row, uint32_t col) const
                {
                    lv_obj_t *o = detail::selfRaw<Self>(this);
                    if (!o || row >= lv_table_get_row_count(o) || col >= lv_table_get_column_count(o))
                        return "";
                    const char *v = lv_table_get_cell_value(o, row, col);
                    return v ? v : "";
                }

                void setColumnWidth(uint32_t col, int32_t width)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_table_set_column_width(o, col, width);
                }
            };
        };

        struct List
        {
            static lv_obj_t *create(lv_obj_t *parent) { return lv_list_create(parent); }
            static const lv_obj_class_t *classPtr() { return &lv_list_class; }

            template <typename Self>
            class Ops
            {
            public:
                Obj addText(const char *text)
                {
                    lv_obj_t *o = detail::selfRaw<Self>(this);
                    return o ? detail::self<Self>(this).adopt(lv_list_add_text(o, text)) : Obj();
                }

                // icon may be null or an LV_SYMBOL_* string.
                Widget<kind::Button> addButton(const void *icon, const char *text)
                {
                    lv_obj_t *o = detail::selfRaw<Self>(this);
                    Obj btn = o ? detail::self<Self>(this).adopt(lv_list_add_button(o, icon, text)) : Obj();
                    return Widget<kind::Button>::from(btn);
                }

                const char *buttonText(const Obj &button) const
                {
                    lv_obj_t *o = detail::selfRaw<Self>(this);
                    lv_obj_t *b = button.raw();
                    if (!o || !b)
                        return "";
                    const char *t = lv_list_get_button_text(o, b);
                    return t ? t : "";
                }
            };
        };

        struct Msgbox
        {
            static lv_obj_t *create(lv_obj_t *parent) { return lv_msgbox_create(parent); }
            static const lv_obj_class_t *classPtr() { return &lv_msgbox_class; }

            template <typename Self>
            class Ops
            {
            public:
                // Modal box on the top layer with a dimming backdrop.
                static Result<Self> createModal(Runtime &runtime)
                {
                    if (!runtime.isInitialized())
                        return Error::NotInitialized;
                    lv_obj_t *box = lv_msgbox_create(nullptr);
                    if (!box)
                        return Error::OutOfMemory;
                    return Self::from(runtime.wrap(box));
                }

                Obj addTitle(const char *title)
                {
                    lv_obj_t *o = detail::selfRaw<Self>(this);
                    return o ? detail::self<Self>(this).adopt(lv_msgbox_add_title(o, title)) : Obj();
                }

                Obj addText(const char *text)
                {
                    lv_obj_t *o = detail::selfRaw<Self>(this);
                    return o ? detail::self<Self>(this).adopt(lv_msgbox_add_text(o, text)) : Obj();
                }

                Widget<kind::Button> addFooterButton(const char *text)
                {
                    lv_obj_t *o = detail::selfRaw<Self>(this);
                    Obj btn = o ? detail::self<Self>(this).adopt(lv_msgbox_add_footer_button(o, text)) : Obj();
                    return Widget<kind::Button>::from(btn);
                }

                Widget<kind::Button> addCloseButton()
                {
                    lv_obj_t *o = detail::selfRaw<Self>(this);
                    Obj btn = o ? detail::self<Self>(this).adopt(lv_msgbox_add_close_button(o)) : Obj();
                    return Widget<kind::Button>::from(btn);
                }

                // Deletes the box (and its backdrop); every handle into it goes stale.
                void close()
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_msgbox_close(o);
                }
            };
        };

        struct Keyboard
        {
            static lv_obj_t *create(lv_obj_t *parent) { return lv_keyboard_create(parent); }
            static const lv_obj_class_t *classPtr() { return &lv_keyboard_class; }

            template <typename Self>
            class Ops
            {
            public:
                void setTextarea(const Obj &textarea)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_keyboard_set_textarea(o, textarea.raw());
                }

                void setMode(KeyboardMode mode)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_keyboard_set_mode(o, static_cast<lv_keyboard_mode_t>(mode));
                }

                KeyboardMode mode() const
                {
                    lv_obj_t *o = detail::selfRaw<Self>(this);
                    return o ? static_cast<KeyboardMode>(lv_keyboard_get_mode(o)) : KeyboardMode::TextLower;
                }
            };
        };

        struct Buttonmatrix
        {
            static lv_obj_t *create(lv_obj_t *parent) { return lv_buttonmatrix_create(parent); }
            static const lv_obj_class_t *classPtr() { return &lv_buttonmatrix_class; }

            template <typename Self>
            class Ops
            {
            public:
                // "\n" starts a new row, "" terminates. The map is not copied.
                void setMap(const char *map[])
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_buttonmatrix_set_map(o, map);
                }

                uint32_t selectedButton() const
                {
                    lv_obj_t *o = detail::selfRaw<Self>(this);
                    return o ? lv_buttonmatrix_get_selected_button(o) : LV_BUTTONMATRIX_BUTTON_NONE;
                }

                const char *buttonText(uint32_t id) const
                {
                    lv_obj_t *o = detail::selfRaw<Self>(this);
                    const char *t = o ? lv_buttonmatrix_get_button_text(o, id) : nullptr;
                    return t ? t : "";
                }

                void setOneChecked(bool enable)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_buttonmatrix_set_one_checked(o, enable);
                }

                void setButtonCtrlAll(lv_buttonmatrix_ctrl_t ctrl)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_buttonmatrix_set_button_ctrl_all(o, ctrl);
                }
            };
        };

        struct Image
        {
            static lv_obj_t *create(lv_obj_t *parent) { return lv_image_create(parent); }
            static const lv_obj_class_t *classPtr() { return &lv_image_class; }

            template <typename Self>
            class Ops
            {
            public:
                // Image descriptor, file path or LV_SYMBOL_* string.
                void setSrc(const void *src)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_image_set_src(o, src);
                }

                // Tenths of a degree.
                void setRotation(int32_t angle)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_image_set_rotation(o, angle);
                }

                // 256 is 100%.
                void setScale(uint32_t zoom)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_image_set_scale(o, zoom);
                }

                void setPivot(int32_t x, int32_t y)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_image_set_pivot(o, x, y);
                }
            };
        };

        struct Line
        {
            static lv_obj_t *create(lv_obj_t *parent) { return lv_line_create(parent); }
            static const lv_obj_class_t *classPtr() { return &lv_line_class; }

            template <typename Self>
            class Ops
            {
            public:
                // Points are not copied and must outlive the line.
                void setPoints(const lv_point_precise_t *points, uint32_t count)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_line_set_points(o, points, count);
                }

                void setYInvert(bool enable)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_line_set_y_invert(o, enable);
                }
            };
        };

        struct Scale
        {
            static lv_obj_t *create(lv_obj_t *parent) { return lv_scale_create(parent); }
            static const lv_obj_class_t *classPtr() { return &lv_scale_class; }

            template <typename Self>
            class Ops
            {
            public:
                void setMode(ScaleMode mode)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_scale_set_mode(o, static_cast<lv_scale_mode_t>(mode));
                }

                void setScaleRange(int32_t min, int32_t max)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_scale_set_range(o, min, max);
                }

                void setTotalTickCount(uint32_t count)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_scale_set_total_tick_count(o, count);
                }

                void setMajorTickEvery(uint32_t nth)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_scale_set_major_tick_every(o, nth);
                }

                void setLabelShow(bool show)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_scale_set_label_show(o, show);
                }
            };
        };

        struct Canvas
        {
            static lv_obj_t *create(lv_obj_t *parent) { return lv_canvas_create(parent); }
            static const lv_obj_class_t *classPtr() { return &lv_canvas_class; }

            template <typename Self>
            class Ops
            {
            public:
                // The buffer belongs to the caller and must outlive the canvas.
                void setBuffer(void *buf, int32_t w, int32_t h, lv_color_format_t cf)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_canvas_set_buffer(o, buf, w, h, cf);
                }

                void fillBg(Color color, lv_opa_t opa = LV_OPA_COVER)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_canvas_fill_bg(o, color, opa);
                }

                void setPixel(int32_t x, int32_t y, Color color, lv_opa_t opa = LV_OPA_COVER)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_canvas_set_px(o, x, y, color, opa);
                }
            };
        };

        struct Calendar
        {
            static lv_obj_t *create(lv_obj_t *parent) { return lv_calendar_create(parent); }
            static const lv_obj_class_t *classPtr() { return &lv_calendar_class; }

            template <typename Self>
            class Ops
            {
            public:
                void setTodayDate(uint32_t year, uint32_t month, uint32_t day)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_calendar_set_today_date(o, year, month, day);
                }

                void setShowedDate(uint32_t year, uint32_t month)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_calendar_set_showed_date(o, year, month);
                }

                // False when no day has been pressed yet.
                bool pressedDate(CalendarDate &out) const
                {
                    lv_obj_t *o = detail::selfRaw<Self>(this);
                    if (!o)
                        return false;

                    lv_calendar_date_t d;
                    if (lv_calendar_get_pressed_date(o, &d) != LV_RESULT_OK)
                        return false;
                    out.year = d.year;
                    out.month = static_cast<uint8_t>(d.month);
                    out.day = static_cast<uint8_t>(d.day);
                    return true;
                }

                Obj addHeaderArrow()
                {
                    lv_obj_t *o = detail::selfRaw<Self>(this);
                    return o ? detail::self<Self>(this).adopt(lv_calendar_header_arrow_create(o)) : Obj();
                }
            };
        };

        struct Spinbox
        {
            static lv_obj_t *create(lv_obj_t *parent) { return lv_spinbox_create(parent); }
            static const lv_obj_class_t *classPtr() { return &lv_spinbox_class; }
            static void setValue(lv_obj_t *o, int32_t v, lv_anim_enable_t) { lv_spinbox_set_value(o, v); }
            static int32_t value(lv_obj_t *o) { return lv_spinbox_get_value(o); }
            static void setRange(lv_obj_t *o, int32_t min, int32_t max) { lv_spinbox_set_range(o, min, max); }

            template <typename Self>
            class Ops : public ValueRange<Self, Spinbox>
            {
            public:
                void setDigitFormat(uint32_t digits, uint32_t separatorPos)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_spinbox_set_digit_format(o, digits, separatorPos);
                }

                void setStep(uint32_t step)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_spinbox_set_step(o, step);
                }

                void setRollover(bool enable)
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_spinbox_set_rollover(o, enable);
                }

                void increment()
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_spinbox_increment(o);
                }

                void decrement()
                {
                    if (lv_obj_t *o = detail::selfRaw<Self>(this))
                        lv_spinbox_decrement(o);
                }
            };
        };
    }

    using Label = Widget<kind::Label>;
    using Button = Widget<kind::Button>;
    using Slider = Widget<kind::Slider>;
    using Switch = Widget<kind::Switch>;
    using Checkbox = Widget<kind::Checkbox>;
    using Bar = Widget<kind::Bar>;
    using Arc = Widget<kind::Arc>;
    using Spinner = Widget<kind::Spinner>;
    using Led = Widget<kind::Led>;
    using Chart = Widget<kind::Chart>;
    using Tabview = Widget<kind::Tabview>;
    using Dropdown = Widget<kind::Dropdown>;
    using Roller = Widget<kind::Roller>;
    using Textarea = Widget<kind::Textarea>;
    using Table = Widget<kind::Table>;
    using List = Widget<kind::List>;
    using Msgbox = Widget<kind::Msgbox>;
    using Keyboard = Widget<kind::Keyboard>;
    using Buttonmatrix = Widget<kind::Buttonmatrix>;
    using Image = Widget<kind::Image>;
    using Line = Widget<kind::Line>;
    using Scale = Widget<kind::Scale>;
    using Canvas = Widget<kind::Canvas>;
    using Calendar = Widget<kind::Calendar>;
    using Spinbox = Widget<kind::Spinbox>;
}
