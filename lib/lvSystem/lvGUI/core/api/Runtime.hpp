#pragma once

#include <stdint.h>

#include <lvgl.h>

#include <lvGUI/core/api/Error.hpp>
#include <lvGUI/core/api/Obj.hpp>
#include <lvGUI/core/api/ObjRegistry.hpp>

namespace lvgui
{
    using LogSink = void (*)(lv_log_level_t level, const char *message);

    // Owns the LVGL session. Only one runtime can be initialized per process at a time;
    // displays and input devices created from it must be destroyed before it.
    class Runtime
    {
    public:
        Runtime() = default;
        ~Runtime();

        Runtime(const Runtime &) = delete;
        Runtime &operator=(const Runtime &) = delete;

        Error init();
        bool isInitialized() const { return _initialized; }
        // True while any runtime in the process holds LVGL.
        static bool processInitialized();

        void tickInc(uint32_t ms);
        uint32_t taskHandler();

        // One control-loop step: advance the tick by the time since the last call, run LVGL timers
        // and release storage of deleted objects. Returns how long the caller may sleep.
        uint32_t pump(uint32_t nowMs, uint32_t maxDelayMs);

        // Frees handler and style storage of deleted objects.
        void collect() { _registry.collect(); }

        Obj activeScreen();
        Obj topLayer();
        Result<Obj> createScreen();
        Error loadScreen(const Obj &screen);

        Obj wrap(lv_obj_t *obj) { return Obj::wrap(_registry, obj); }
        ObjRegistry &registry() { return _registry; }

        void setLogSink(LogSink sink);

    private:
        ObjRegistry _registry;
        bool _initialized = false;
        bool _havePumped = false;
        uint32_t _lastPumpMs = 0;
    };
}
