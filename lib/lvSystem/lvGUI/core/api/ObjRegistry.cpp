#include <lvGUI/core/api/ObjRegistry.hpp>

#include <lvGUI/core/api/Obj.hpp>
#include <lvGUI/core/api/Style.hpp>

namespace lvgui
{
    ObjRegistry::~ObjRegistry()
    {
        if (!lv_is_initialized())
            return;

        for (Slot &slot : _slots)
        {
            if (!slot.obj)
                continue;
            for (const std::unique_ptr<Handler> &h : slot.handlers)
                lv_obj_remove_event_cb_with_user_data(slot.obj, dispatch, h.get());
            for (const std::unique_ptr<Style> &s : slot.styles)
                lv_obj_remove_style(slot.obj, s->raw(), LV_PART_ANY | LV_STATE_ANY);
            lv_obj_remove_event_cb_with_user_data(slot.obj, onDelete, this);
        }
    }

    ObjId ObjRegistry::track(lv_obj_t *obj)
    {
        if (!obj)
            return ObjId{};

        auto it = _byObj.find(obj);
        if (it != _byObj.end())
            return ObjId{it->second, _slots[it->second].generation};

        uint32_t index = 0;
        if (!_free.empty())
        {
            index = _free.back();
            _free.pop_back();
        }
        else
        {
            index = static_cast<uint32_t>(_slots.size());
            _slots.emplace_back();
        }

        Slot &slot = _slots[index];
        slot.obj = obj;
        _byObj.emplace(obj, index);
        lv_obj_add_event_cb(obj, onDelete, LV_EVENT_DELETE, this);

        return ObjId{index, slot.generation};
    }

    ObjId ObjRegistry::find(const lv_obj_t *obj) const
    {
        auto it = _byObj.find(obj);
        if (it == _byObj.end())
            return ObjId{};
        return ObjId{it->second, _slots[it->second].generation};
    }

    lv_obj_t *ObjRegistry::resolve(ObjId id) const
    {
        const Slot *slot = liveSlot(id);
        return slot ? slot->obj : nullptr;
    }

    EventToken ObjRegistry::addHandler(ObjId id, EventCode code, EventHandler handler)
    {
        Slot *slot = liveSlot(id);
        if (!slot || !handler)
            return EventToken{};

        std::unique_ptr<Handler> h = std::make_unique<Handler>();
        h->serial = _nextSerial++;
        h->owner = this;
        h->fn = std::move(handler);

        lv_obj_add_event_cb(slot->obj, dispatch, static_cast<lv_event_code_t>(code), h.get());

        EventToken token{id, h->serial};
        slot->handlers.push_back(std::move(h));
        return token;
    }

    bool ObjRegistry::removeHandler(const EventToken &token)
    {
        Slot *slot = liveSlot(token.obj);
        if (!slot || !token.valid())
            return false;

        for (auto it = slot->handlers.begin(); it != slot->handlers.end(); ++it)
        {
            if ((*it)->serial != token.handler)
                continue;

            lv_obj_remove_event_cb_with_user_data(slot->obj, dispatch, it->get());
            (*it)->removed = true;
            // The handler may be the one running right now.
            _deadHandlers.push_back(std::move(*it));
            slot->handlers.erase(it);
            return true;
        }
        return false;
    }

    size_t ObjRegistry::handlerCount(ObjId id) const
    {
        const Slot *slot = liveSlot(id);
        return slot ? slot->handlers.size() : 0;
    }

    bool ObjRegistry::adoptStyle(ObjId id, std::unique_ptr<Style> style, Selector sel)
    {
        Slot *slot = liveSlot(id);
        if (!slot || !style)
            return false;

        lv_obj_add_style(slot->obj, style->raw(), sel);
        slot->styles.push_back(std::move(style));
        return true;
    }

    size_t ObjRegistry::adoptedStyleCount(ObjId id) const
    {
        const Slot *slot = liveSlot(id);
        return slot ? slot->styles.size() : 0;
    }

    void ObjRegistry::collect()
    {
        _deadHandlers.clear();
        _deadStyles.clear();
    }

    void ObjRegistry::onDelete(lv_event_t *e)
    {
        ObjRegistry *self = static_cast<ObjRegistry *>(lv_event_get_user_data(e));
        lv_obj_t *obj = static_cast<lv_obj_t *>(lv_event_get_current_target(e));
        if (!self || obj != lv_event_get_target(e))
            return;
        self->release(obj);
    }

    void ObjRegistry::dispatch(lv_event_t *e)
    {
        Handler *h = static_cast<Handler *>(lv_event_get_user_data(e));
        if (!h || h->removed)
            return;

        Event event(h->owner, e);
        h->fn(event);
    }

    void ObjRegistry::release(lv_obj_t *obj)
    {
        auto it = _byObj.find(obj);
        if (it == _byObj.end())
            return;

        const uint32_t index = it->second;
        _byObj.erase(it);

        Slot &slot = _slots[index];
        // LVGL still refers to both until the node is fully gone; they are freed on the next collect().
        for (std::unique_ptr<Handler> &h : slot.handlers)
            _deadHandlers.push_back(std::move(h));
        for (std::unique_ptr<Style> &s : slot.styles)
            _deadStyles.push_back(std::move(s));
        slot.handlers.clear();
        slot.styles.clear();

        slot.obj = nullptr;
        ++slot.generation;
        _free.push_back(index);
    }

    ObjRegistry::Slot *ObjRegistry::liveSlot(ObjId id)
    {
        if (id.index >= _slots.size())
            return nullptr;
        Slot &slot = _slots[id.index];
        if (!slot.obj || slot.generation != id.generation)
            return nullptr;
        return &slot;
    }

    const ObjRegistry::Slot *ObjRegistry::liveSlot(ObjId id) const
    {
        if (id.index >= _slots.size())
            return nullptr;
        const Slot &slot = _slots[id.index];
        if (!slot.obj || slot.generation != id.generation)
            return nullptr;
        return &slot;
    }
}
