#pragma once

#include <stdint.h>
#include <stddef.h>
#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>

#include <lvgl.h>

#include <lvGUI/core/api/Types.hpp>

namespace lvgui
{
    class Event;
    class Style;

    using EventHandler = std::function<void(Event &)>;

    // Stable name for a tree node. A slot's generation moves on when its node is deleted,
    // so ids taken before the delete stop resolving.
    struct ObjId
    {
        uint32_t index = 0;
        uint32_t generation = 0;

        bool operator==(const ObjId &other) const { return index == other.index && generation == other.generation; }
        bool operator!=(const ObjId &other) const { return !(*this == other); }
    };

    struct EventToken
    {
        ObjId obj;
        uint32_t handler = 0;

        bool valid() const { return handler != 0; }
    };

    class ObjRegistry
    {
    public:
        ObjRegistry() = default;
        ~ObjRegistry();

        ObjRegistry(const ObjRegistry &) = delete;
        ObjRegistry &operator=(const ObjRegistry &) = delete;

        // Returns the existing id when obj is already tracked.
        ObjId track(lv_obj_t *obj);
        // Lookup only, never starts tracking. Default id when unknown.
        ObjId find(const lv_obj_t *obj) const;
        lv_obj_t *resolve(ObjId id) const;

        EventToken addHandler(ObjId id, EventCode code, EventHandler handler);
        bool removeHandler(const EventToken &token);
        size_t handlerCount(ObjId id) const;

        bool adoptStyle(ObjId id, std::unique_ptr<Style> style, Selector sel);
        size_t adoptedStyleCount(ObjId id) const;

        // Frees handler and style storage of deleted nodes. Not safe from inside an event handler.
        void collect();

        size_t liveCount() const { return _byObj.size(); }
        size_t pendingRelease() const { return _deadHandlers.size() + _deadStyles.size(); }

    private:
        struct Handler
        {
            uint32_t serial = 0;
            ObjRegistry *owner = nullptr;
            EventHandler fn;
            bool removed = false;
        };

        struct Slot
        {
            lv_obj_t *obj = nullptr;
            uint32_t generation = 1;
            std::vector<std::unique_ptr<Handler>> handlers;
            std::vector<std::unique_ptr<Style>> styles;
        };

        static void onDelete(lv_event_t *e);
        static void dispatch(lv_event_t *e);

        void release(lv_obj_t *obj);
        Slot *liveSlot(ObjId id);
        const Slot *liveSlot(ObjId id) const;

        std::vector<Slot> _slots;
        std::vector<uint32_t> _free;
        std::unordered_map<const lv_obj_t *, uint32_t> _byObj;

        std::vector<std::unique_ptr<Handler>> _deadHandlers;
        std::vector<std::unique_ptr<Style>> _deadStyles;

        uint32_t _nextSerial = 1;
    };
}
