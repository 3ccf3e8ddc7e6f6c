#include <lvGUI/core/api/Obj.hpp>

#include <lvGUI/core/api/Style.hpp>

namespace lvgui
{
    Result<Obj> Obj::create(const Obj &parent)
    {
        lv_obj_t *p = parent.raw();
        if (!p)
            return Error::InvalidHandle;

        lv_obj_t *obj = lv_obj_create(p);
        if (!obj)
            return Error::OutOfMemory;

        return parent.adopt(obj);
    }

    Obj Obj::wrap(ObjRegistry &registry, lv_obj_t *obj)
    {
        if (!obj)
            return Obj();
        return Obj(&registry, registry.track(obj));
    }

    Obj Obj::adopt(lv_obj_t *obj) const
    {
        if (!_registry || !obj)
            return Obj();
        return Obj(_registry, _registry->track(obj));
    }

    void Obj::setPos(int32_t x, int32_t y)
    {
        if (lv_obj_t *o = raw())
            lv_obj_set_pos(o, x, y);
    }

    void Obj::setSize(int32_t w, int32_t h)
    {
        if (lv_obj_t *o = raw())
            lv_obj_set_size(o, w, h);
    }

    void Obj::setWidth(int32_t w)
    {
        if (lv_obj_t *o = raw())
            lv_obj_set_width(o, w);
    }

    void Obj::setHeight(int32_t h)
    {
        if (lv_obj_t *o = raw())
            lv_obj_set_height(o, h);
    }

    void Obj::setAlign(Align align)
    {
        if (lv_obj_t *o = raw())
            lv_obj_set_align(o, static_cast<lv_align_t>(align));
    }

    void Obj::align(Align align, int32_t xOfs, int32_t yOfs)
    {
        if (lv_obj_t *o = raw())
            lv_obj_align(o, static_cast<lv_align_t>(align), xOfs, yOfs);
    }

    void Obj::alignTo(const Obj &base, Align align, int32_t xOfs, int32_t yOfs)
    {
        lv_obj_t *o = raw();
        lv_obj_t *b = base.raw();
        if (o && b)
            lv_obj_align_to(o, b, static_cast<lv_align_t>(align), xOfs, yOfs);
    }

    void Obj::center()
    {
        if (lv_obj_t *o = raw())
            lv_obj_center(o);
    }

    int32_t Obj::x() const
    {
        lv_obj_t *o = raw();
        return o ? lv_obj_get_x(o) : 0;
    }

    int32_t Obj::y() const
    {
        lv_obj_t *o = raw();
        return o ? lv_obj_get_y(o) : 0;
    }

    int32_t Obj::width() const
    {
        lv_obj_t *o = raw();
        return o ? lv_obj_get_width(o) : 0;
    }

    int32_t Obj::height() const
    {
        lv_obj_t *o = raw();
        return o ? lv_obj_get_height(o) : 0;
    }

    void Obj::updateLayout()
    {
        if (lv_obj_t *o = raw())
            lv_obj_update_layout(o);
    }

    void Obj::setFlexFlow(FlexFlow flow)
    {
        if (lv_obj_t *o = raw())
            lv_obj_set_flex_flow(o, static_cast<lv_flex_flow_t>(flow));
    }

    void Obj::setFlexAlign(FlexAlign main, FlexAlign cross, FlexAlign track)
    {
        if (lv_obj_t *o = raw())
            lv_obj_set_flex_align(o,
                                  static_cast<lv_flex_align_t>(main),
                                  static_cast<lv_flex_align_t>(cross),
                                  static_cast<lv_flex_align_t>(track));
    }

    void Obj::addStyle(const Style &style, Selector sel)
    {
        if (lv_obj_t *o = raw())
            lv_obj_add_style(o, style.raw(), sel);
    }

    void Obj::removeStyle(const Style &style, Selector sel)
    {
        if (lv_obj_t *o = raw())
            lv_obj_remove_style(o, style.raw(), sel);
    }

    void Obj::removeStyleAll()
    {
        if (lv_obj_t *o = raw())
            lv_obj_remove_style_all(o);
    }

    bool Obj::adoptStyle(std::unique_ptr<Style> style, Selector sel)
    {
        if (!_registry)
            return false;
        return _registry->adoptStyle(_id, std::move(style), sel);
    }

    void Obj::setStyleBgColor(Color color, Selector sel)
    {
        if (lv_obj_t *o = raw())
            lv_obj_set_style_bg_color(o, color, sel);
    }

    void Obj::setStyleBgOpa(lv_opa_t opa, Selector sel)
    {
        if (lv_obj_t *o = raw())
            lv_obj_set_style_bg_opa(o, opa, sel);
    }

    void Obj::setStyleTextColor(Color color, Selector sel)
    {
        if (lv_obj_t *o = raw())
            lv_obj_set_style_text_color(o, color, sel);
    }

    void Obj::setStyleTextFont(const lv_font_t *font, Selector sel)
    {
        if (lv_obj_t *o = raw())
            lv_obj_set_style_text_font(o, font, sel);
    }

    void Obj::setStyleBorderWidth(int32_t width, Selector sel)
    {
        if (lv_obj_t *o = raw())
            lv_obj_set_style_border_width(o, width, sel);
    }

    void Obj::setStyleBorderColor(Color color, Selector sel)
    {
        if (lv_obj_t *o = raw())
            lv_obj_set_style_border_color(o, color, sel);
    }

    void Obj::setStyleRadius(int32_t radius, Selector sel)
    {
        if (lv_obj_t *o = raw())
            lv_obj_set_style_radius(o, radius, sel);
    }

    void Obj::setStylePadAll(int32_t pad, Selector sel)
    {
        if (lv_obj_t *o = raw())
            lv_obj_set_style_pad_all(o, pad, sel);
    }

    void Obj::setStylePadRow(int32_t pad, Selector sel)
    {
        if (lv_obj_t *o = raw())
            lv_obj_set_style_pad_row(o, pad, sel);
    }

    void Obj::setStylePadColumn(int32_t pad, Selector sel)
    {
        if (lv_obj_t *o = raw())
            lv_obj_set_style_pad_column(o, pad, sel);
    }

    void Obj::addState(State state)
    {
        if (lv_obj_t *o = raw())
            lv_obj_add_state(o, static_cast<lv_state_t>(state));
    }

    void Obj::removeState(State state)
    {
        if (lv_obj_t *o = raw())
            lv_obj_remove_state(o, static_cast<lv_state_t>(state));
    }

    bool Obj::hasState(State state) const
    {
        lv_obj_t *o = raw();
        return o && lv_obj_has_state(o, static_cast<lv_state_t>(state));
    }

    void Obj::setHidden(bool hidden)
    {
        lv_obj_t *o = raw();
        if (!o)
            return;

        if (hidden)
            lv_obj_add_flag(o, LV_OBJ_FLAG_HIDDEN);
        else
            lv_obj_remove_flag(o, LV_OBJ_FLAG_HIDDEN);
    }

    bool Obj::isHidden() const
    {
        lv_obj_t *o = raw();
        return o && lv_obj_has_flag(o, LV_OBJ_FLAG_HIDDEN);
    }

    void Obj::setClickable(bool clickable)
    {
        lv_obj_t *o = raw();
        if (!o)
            return;

        if (clickable)
            lv_obj_add_flag(o, LV_OBJ_FLAG_CLICKABLE);
        else
            lv_obj_remove_flag(o, LV_OBJ_FLAG_CLICKABLE);
    }

    bool Obj::isClickable() const
    {
        lv_obj_t *o = raw();
        return o && lv_obj_has_flag(o, LV_OBJ_FLAG_CLICKABLE);
    }

    void Obj::setScrollable(bool scrollable)
    {
        lv_obj_t *o = raw();
        if (!o)
            return;

        if (scrollable)
            lv_obj_add_flag(o, LV_OBJ_FLAG_SCROLLABLE);
        else
            lv_obj_remove_flag(o, LV_OBJ_FLAG_SCROLLABLE);
    }

    Obj Obj::parent() const
    {
        lv_obj_t *o = raw();
        return o ? adopt(lv_obj_get_parent(o)) : Obj();
    }

    Obj Obj::child(int32_t index) const
    {
        lv_obj_t *o = raw();
        return o ? adopt(lv_obj_get_child(o, index)) : Obj();
    }

    uint32_t Obj::childCount() const
    {
        lv_obj_t *o = raw();
        return o ? lv_obj_get_child_count(o) : 0;
    }

    void Obj::clean()
    {
        if (lv_obj_t *o = raw())
            lv_obj_clean(o);
    }

    void Obj::destroy()
    {
        if (lv_obj_t *o = raw())
            lv_obj_delete(o);
    }

    void Obj::invalidate()
    {
        if (lv_obj_t *o = raw())
            lv_obj_invalidate(o);
    }

    EventToken Obj::addEventHandler(EventCode code, EventHandler handler)
    {
        if (!_registry)
            return EventToken{};
        return _registry->addHandler(_id, code, std::move(handler));
    }

    bool Obj::removeEventHandler(const EventToken &token)
    {
        if (!_registry || token.obj != _id)
            return false;
        return _registry->removeHandler(token);
    }

    Error Obj::sendEvent(EventCode code, void *param)
    {
        lv_obj_t *o = raw();
        if (!o)
            return Error::InvalidHandle;
        lv_obj_send_event(o, static_cast<lv_event_code_t>(code), param);
        return Error::Ok;
    }

    EventCode Event::code() const
    {
        return static_cast<EventCode>(lv_event_get_code(_e));
    }

    Obj Event::target() const
    {
        return wrapTarget(lv_event_get_target(_e));
    }

    Obj Event::currentTarget() const
    {
        return wrapTarget(lv_event_get_current_target(_e));
    }

    void *Event::param() const
    {
        return lv_event_get_param(_e);
    }

    void Event::stopBubbling()
    {
        lv_event_stop_bubbling(_e);
    }

    Obj Event::wrapTarget(void *obj) const
    {
        if (!_registry || !obj)
            return Obj();

        lv_obj_t *o = static_cast<lv_obj_t *>(obj);
        // A node being deleted must not be tracked again.
        if (lv_event_get_code(_e) == LV_EVENT_DELETE)
            return Obj(_registry, _registry->find(o));
        return Obj(_registry, _registry->track(o));
    }
}
