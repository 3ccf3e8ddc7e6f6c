#pragma once

#include <stdint.h>
#include <memory>

#include <lvgl.h>

#include <lvGUI/core/api/Error.hpp>
#include <lvGUI/core/api/ObjRegistry.hpp>
#include <lvGUI/core/api/Types.hpp>

namespace lvgui
{
    class Style;

    // Non-owning handle to one node of the LVGL tree. LVGL owns the node; once it is deleted
    // every handle to it (or to anything below it) goes stale, and calls on a stale handle do nothing.
    class Obj
    {
    public:
        Obj() = default;
        Obj(ObjRegistry *registry, ObjId id) : _registry(registry), _id(id) {}

        // Plain container under parent.
        static Result<Obj> create(const Obj &parent);
        static Obj wrap(ObjRegistry &registry, lv_obj_t *obj);

        lv_obj_t *raw() const { return _registry ? _registry->resolve(_id) : nullptr; }
        bool isValid() const { return raw() != nullptr; }
        ObjId id() const { return _id; }
        ObjRegistry *registry() const { return _registry; }

        void setPos(int32_t x, int32_t y);
        void setSize(int32_t w, int32_t h);
        void setWidth(int32_t w);
        void setHeight(int32_t h);
        void setAlign(Align align);
        void align(Align align, int32_t xOfs = 0, int32_t yOfs = 0);
        void alignTo(const Obj &base, Align align, int32_t xOfs = 0, int32_t yOfs = 0);
        void center();

        int32_t x() const;
        int32_t y() const;
        int32_t width() const;
        int32_t height() const;
        void updateLayout();

        void setFlexFlow(FlexFlow flow);
        void setFlexAlign(FlexAlign main, FlexAlign cross, FlexAlign track);

        void addStyle(const Style &style, Selector sel = MainDefault);
        void removeStyle(const Style &style, Selector sel = MainDefault);
        void removeStyleAll();
        // The registry keeps the style alive until this node is deleted.
        bool adoptStyle(std::unique_ptr<Style> style, Selector sel = MainDefault);

        void setStyleBgColor(Color color, Selector sel = MainDefault);
        void setStyleBgOpa(lv_opa_t opa, Selector sel = MainDefault);
        void setStyleTextColor(Color color, Selector sel = MainDefault);
        void setStyleTextFont(const lv_font_t *font, Selector sel = MainDefault);
        void setStyleBorderWidth(int32_t width, Selector sel = MainDefault);
        void setStyleBorderColor(Color color, Selector sel = MainDefault);
        void setStyleRadius(int32_t radius, Selector sel = MainDefault);
        void setStylePadAll(int32_t pad, Selector sel = MainDefault);
        void setStylePadRow(int32_t pad, Selector sel = MainDefault);
        void setStylePadColumn(int32_t pad, Selector sel = MainDefault);

        void addState(State state);
        void removeState(State state);
        bool hasState(State state) const;

        void setHidden(bool hidden);
        bool isHidden() const;
        void setClickable(bool clickable);
        bool isClickable() const;
        void setScrollable(bool scrollable);

        Obj parent() const;
        Obj child(int32_t index) const;
        uint32_t childCount() const;
        // Deletes every child, keeps this node.
        void clean();
        // Deletes this node and its subtree.
        void destroy();

        void invalidate();

        EventToken addEventHandler(EventCode code, EventHandler handler);
        bool removeEventHandler(const EventToken &token);
        Error sendEvent(EventCode code, void *param = nullptr);

        bool operator==(const Obj &other) const { return _registry == other._registry && _id == other._id; }
        bool operator!=(const Obj &other) const { return !(*this == other); }

        // Handle for another node, tracked in this handle's registry.
        Obj adopt(lv_obj_t *obj) const;

    protected:
        ObjRegistry *_registry = nullptr;
        ObjId _id;
    };

    class Event
    {
    public:
        Event(ObjRegistry *registry, lv_event_t *e) : _registry(registry), _e(e) {}

        EventCode code() const;
        // Object the event was originally sent to.
        Obj target() const;
        // Object whose handler is running.
        Obj currentTarget() const;
        void *param() const;
        void stopBubbling();

        lv_event_t *raw() const { return _e; }

    private:
        Obj wrapTarget(void *obj) const;

        ObjRegistry *_registry;
        lv_event_t *_e;
    };
}
