#include <lvGUI/core/api/Style.hpp>

namespace lvgui
{
    Style::Style()
    {
        lv_style_init(&_style);
    }

    Style::~Style()
    {
        if (lv_is_initialized())
            lv_style_reset(&_style);
    }

    void Style::reset()
    {
        lv_style_reset(&_style);
    }

    Style &Style::setBgColor(Color color)
    {
        lv_style_set_bg_color(&_style, color);
        return *this;
    }

    Style &Style::setBgOpa(lv_opa_t opa)
    {
        lv_style_set_bg_opa(&_style, opa);
        return *this;
    }

    Style &Style::setBgGradColor(Color color)
    {
        lv_style_set_bg_grad_color(&_style, color);
        return *this;
    }

    Style &Style::setBgGradDir(GradDir dir)
    {
        lv_style_set_bg_grad_dir(&_style, static_cast<lv_grad_dir_t>(dir));
        return *this;
    }

    Style &Style::setBorderColor(Color color)
    {
        lv_style_set_border_color(&_style, color);
        return *this;
    }

    Style &Style::setBorderWidth(int32_t width)
    {
        lv_style_set_border_width(&_style, width);
        return *this;
    }

    Style &Style::setBorderOpa(lv_opa_t opa)
    {
        lv_style_set_border_opa(&_style, opa);
        return *this;
    }

    Style &Style::setBorderSide(BorderSide side)
    {
        lv_style_set_border_side(&_style, static_cast<lv_border_side_t>(side));
        return *this;
    }

    Style &Style::setOutlineColor(Color color)
    {
        lv_style_set_outline_color(&_style, color);
        return *this;
    }

    Style &Style::setOutlineWidth(int32_t width)
    {
        lv_style_set_outline_width(&_style, width);
        return *this;
    }

    Style &Style::setOutlineOpa(lv_opa_t opa)
    {
        lv_style_set_outline_opa(&_style, opa);
        return *this;
    }

    Style &Style::setOutlinePad(int32_t pad)
    {
        lv_style_set_outline_pad(&_style, pad);
        return *this;
    }

    Style &Style::setPadAll(int32_t pad)
    {
        lv_style_set_pad_all(&_style, pad);
        return *this;
    }

    Style &Style::setPadTop(int32_t pad)
    {
        lv_style_set_pad_top(&_style, pad);
        return *this;
    }

    Style &Style::setPadBottom(int32_t pad)
    {
        lv_style_set_pad_bottom(&_style, pad);
        return *this;
    }

    Style &Style::setPadLeft(int32_t pad)
    {
        lv_style_set_pad_left(&_style, pad);
        return *this;
    }

    Style &Style::setPadRight(int32_t pad)
    {
        lv_style_set_pad_right(&_style, pad);
        return *this;
    }

    Style &Style::setPadHor(int32_t pad)
    {
        lv_style_set_pad_hor(&_style, pad);
        return *this;
    }

    Style &Style::setPadVer(int32_t pad)
    {
        lv_style_set_pad_ver(&_style, pad);
        return *this;
    }

    Style &Style::setPadRow(int32_t pad)
    {
        lv_style_set_pad_row(&_style, pad);
        return *this;
    }

    Style &Style::setPadColumn(int32_t pad)
    {
        lv_style_set_pad_column(&_style, pad);
        return *this;
    }

    Style &Style::setWidth(int32_t w)
    {
        lv_style_set_width(&_style, w);
        return *this;
    }

    Style &Style::setHeight(int32_t h)
    {
        lv_style_set_height(&_style, h);
        return *this;
    }

    Style &Style::setMinWidth(int32_t w)
    {
        lv_style_set_min_width(&_style, w);
        return *this;
    }

    Style &Style::setMaxWidth(int32_t w)
    {
        lv_style_set_max_width(&_style, w);
        return *this;
    }

    Style &Style::setMinHeight(int32_t h)
    {
        lv_style_set_min_height(&_style, h);
        return *this;
    }

    Style &Style::setMaxHeight(int32_t h)
    {
        lv_style_set_max_height(&_style, h);
        return *this;
    }

    Style &Style::setRadius(int32_t radius)
    {
        lv_style_set_radius(&_style, radius);
        return *this;
    }

    Style &Style::setOpa(lv_opa_t opa)
    {
        lv_style_set_opa(&_style, opa);
        return *this;
    }

    Style &Style::setTextColor(Color color)
    {
        lv_style_set_text_color(&_style, color);
        return *this;
    }

    Style &Style::setTextOpa(lv_opa_t opa)
    {
        lv_style_set_text_opa(&_style, opa);
        return *this;
    }

    Style &Style::setTextFont(const lv_font_t *font)
    {
        lv_style_set_text_font(&_style, font);
        return *this;
    }

    Style &Style::setTextLetterSpace(int32_t space)
    {
        lv_style_set_text_letter_space(&_style, space);
        return *this;
    }

    Style &Style::setTextLineSpace(int32_t space)
    {
        lv_style_set_text_line_space(&_style, space);
        return *this;
    }

    Style &Style::setTextAlign(TextAlign align)
    {
        lv_style_set_text_align(&_style, static_cast<lv_text_align_t>(align));
        return *this;
    }

    Style &Style::setShadowColor(Color color)
    {
        lv_style_set_shadow_color(&_style, color);
        return *this;
    }

    Style &Style::setShadowWidth(int32_t width)
    {
        lv_style_set_shadow_width(&_style, width);
        return *this;
    }

    Style &Style::setShadowOffsetX(int32_t x)
    {
        lv_style_set_shadow_offset_x(&_style, x);
        return *this;
    }

    Style &Style::setShadowOffsetY(int32_t y)
    {
        lv_style_set_shadow_offset_y(&_style, y);
        return *this;
    }

    Style &Style::setShadowSpread(int32_t spread)
    {
        lv_style_set_shadow_spread(&_style, spread);
        return *this;
    }

    Style &Style::setShadowOpa(lv_opa_t opa)
    {
        lv_style_set_shadow_opa(&_style, opa);
        return *this;
    }
}
