#pragma once

#include <stdint.h>

#include <lvgl.h>

#include <lvGUI/core/api/Types.hpp>

namespace lvgui
{
    // Reusable set of style properties. Objects keep a pointer to it, so it must outlive
    // every object it is added to and it cannot be copied or moved.
    class Style
    {
    public:
        Style();
        ~Style();

        Style(const Style &) = delete;
        Style &operator=(const Style &) = delete;

        const lv_style_t *raw() const { return &_style; }
        lv_style_t *raw() { return &_style; }

        // Drops every property. Objects using the style need a refresh afterwards.
        void reset();

        Style &setBgColor(Color color);
        Style &setBgOpa(lv_opa_t opa);
        Style &setBgGradColor(Color color);
        Style &setBgGradDir(GradDir dir);

        Style &setBorderColor(Color color);
        Style &setBorderWidth(int32_t width);
        Style &setBorderOpa(lv_opa_t opa);
        Style &setBorderSide(BorderSide side);

        Style &setOutlineColor(Color color);
        Style &setOutlineWidth(int32_t width);
        Style &setOutlineOpa(lv_opa_t opa);
        Style &setOutlinePad(int32_t pad);

        Style &setPadAll(int32_t pad);
        Style &setPadTop(int32_t pad);
        Style &setPadBottom(int32_t pad);
        Style &setPadLeft(int32_t pad);
        Style &setPadRight(int32_t pad);
        Style &setPadHor(int32_t pad);
        Style &setPadVer(int32_t pad);
        Style &setPadRow(int32_t pad);
        Style &setPadColumn(int32_t pad);

        Style &setWidth(int32_t w);
        Style &setHeight(int32_t h);
        Style &setMinWidth(int32_t w);
        Style &setMaxWidth(int32_t w);
        Style &setMinHeight(int32_t h);
        Style &setMaxHeight(int32_t h);

        Style &setRadius(int32_t radius);
        Style &setOpa(lv_opa_t opa);

        Style &setTextColor(Color color);
        Style &setTextOpa(lv_opa_t opa);
        Style &setTextFont(const lv_font_t *font);
        Style &setTextLetterSpace(int32_t space);
        Style &setTextLineSpace(int32_t space);
        Style &setTextAlign(TextAlign align);

        Style &setShadowColor(Color color);
        Style &setShadowWidth(int32_t width);
        Style &setShadowOffsetX(int32_t x);
        Style &setShadowOffsetY(int32_t y);
        Style &setShadowSpread(int32_t spread);
        Style &setShadowOpa(lv_opa_t opa);

    private:
        lv_style_t _style;
    };
}
