#pragma once

#include <stdint.h>

#include <lvgl.h>

#include <lvGUI/core/api/Error.hpp>
#include <lvGUI/core/api/Obj.hpp>

namespace lvgui
{
    namespace detail
    {
        template <typename Self, typename Cap>
        inline const Obj &self(const Cap *cap)
        {
            return *static_cast<const Self *>(cap);
        }

        template <typename Self, typename Cap>
        inline lv_obj_t *selfRaw(const Cap *cap)
        {
            return static_cast<const Self *>(cap)->raw();
        }
    }

    // Typed handle for one widget class. Kind supplies the LVGL constructor and class and, through
    // Kind::Ops, the operations that class supports on top of the common Obj set.
    template <typename Kind>
    class Widget final : public Obj, public Kind::template Ops<Widget<Kind>>
    {
    public:
        Widget() = default;

        static Result<Widget> create(const Obj &parent)
        {
            lv_obj_t *p = parent.raw();
            if (!p)
                return Error::InvalidHandle;

            lv_obj_t *obj = Kind::create(p);
            if (!obj)
                return Error::OutOfMemory;

            return Widget(parent.adopt(obj));
        }

        // For nodes of this class that LVGL builds on its own (list buttons, msgbox footers).
        // Empty when obj is stale or neither of this class nor derived from it.
        static Widget from(const Obj &obj)
        {
            lv_obj_t *o = obj.raw();
            if (!o || !lv_obj_has_class(o, Kind::classPtr()))
                return Widget();
            return Widget(obj);
        }

    private:
        explicit Widget(const Obj &obj) : Obj(obj) {}
    };

    template <typename Self, typename Kind>
    class ValueRange
    {
    public:
        void setValue(int32_t value, bool animate = false)
        {
            if (lv_obj_t *o = detail::selfRaw<Self>(this))
                Kind::setValue(o, value, animate ? LV_ANIM_ON : LV_ANIM_OFF);
        }

        int32_t value() const
        {
            lv_obj_t *o = detail::selfRaw<Self>(this);
            return o ? Kind::value(o) : 0;
        }

        void setRange(int32_t min, int32_t max)
        {
            if (lv_obj_t *o = detail::selfRaw<Self>(this))
                Kind::setRange(o, min, max);
        }
    };

    template <typename Self, typename Kind>
    class RangeBounds
    {
    public:
        int32_t minValue() const
        {
            lv_obj_t *o = detail::selfRaw<Self>(this);
            return o ? Kind::minValue(o) : 0;
        }

        int32_t maxValue() const
        {
            lv_obj_t *o = detail::selfRaw<Self>(this);
            return o ? Kind::maxValue(o) : 0;
        }
    };

    template <typename Self>
    class Checkable
    {
    public:
        void setChecked(bool checked)
        {
            lv_obj_t *o = detail::selfRaw<Self>(this);
            if (!o)
                return;

            if (checked)
                lv_obj_add_state(o, LV_STATE_CHECKED);
            else
                lv_obj_remove_state(o, LV_STATE_CHECKED);
        }

        bool isChecked() const
        {
            lv_obj_t *o = detail::selfRaw<Self>(this);
            return o && lv_obj_has_state(o, LV_STATE_CHECKED);
        }
    };

    template <typename Self, typename Kind>
    class TextContent
    {
    public:
        void setText(const char *text)
        {
            if (lv_obj_t *o = detail::selfRaw<Self>(this))
                Kind::setText(o, text);
        }

        // Empty string on a stale handle.
        const char *text() const
        {
            lv_obj_t *o = detail::selfRaw<Self>(this);
            const char *t = o ? Kind::text(o) : nullptr;
            return t ? t : "";
        }
    };

    // Newline separated option strings.
    template <typename Self, typename Kind>
    class OptionList
    {
    public:
        void setOptions(const char *options)
        {
            if (lv_obj_t *o = detail::selfRaw<Self>(this))
                Kind::setOptions(o, options);
        }

        uint32_t selected() const
        {
            lv_obj_t *o = detail::selfRaw<Self>(this);
            return o ? Kind::selected(o) : 0;
        }

        void setSelected(uint32_t index, bool animate = false)
        {
            if (lv_obj_t *o = detail::selfRaw<Self>(this))
                Kind::setSelected(o, index, animate ? LV_ANIM_ON : LV_ANIM_OFF);
        }

        void selectedText(char *buf, uint32_t size) const
        {
            if (!buf || !size)
                return;
            buf[0] = '\0';
            if (lv_obj_t *o = detail::selfRaw<Self>(this))
                Kind::selectedText(o, buf, size);
        }

        uint32_t optionCount() const
        {
            lv_obj_t *o = detail::selfRaw<Self>(this);
            return o ? Kind::optionCount(o) : 0;
        }
    };
}
