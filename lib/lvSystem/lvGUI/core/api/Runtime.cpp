#include <lvGUI/core/api/Runtime.hpp>

namespace lvgui
{
    namespace
    {
        bool s_processInitialized = false;
    }

    Runtime::~Runtime()
    {
        if (!_initialized)
            return;

        lv_deinit();
        _registry.collect();
        _initialized = false;
        s_processInitialized = false;
    }

    Error Runtime::init()
    {
        if (s_processInitialized || lv_is_initialized())
        {
            LV_LOG_WARN("LVGL runtime already initialized");
            return Error::AlreadyInitialized;
        }

        lv_init();
        if (!lv_is_initialized())
            return Error::OutOfMemory;

        _initialized = true;
        _havePumped = false;
        s_processInitialized = true;
        LV_LOG_INFO("LVGL %d.%d.%d initialized", LVGL_VERSION_MAJOR, LVGL_VERSION_MINOR, LVGL_VERSION_PATCH);
        return Error::Ok;
    }

    bool Runtime::processInitialized()
    {
        return s_processInitialized;
    }

    void Runtime::tickInc(uint32_t ms)
    {
        if (_initialized)
            lv_tick_inc(ms);
    }

    uint32_t Runtime::taskHandler()
    {
        if (!_initialized)
            return LV_NO_TIMER_READY;
        return lv_timer_handler();
    }

    uint32_t Runtime::pump(uint32_t nowMs, uint32_t maxDelayMs)
    {
        if (!_initialized)
            return maxDelayMs;

        if (_havePumped)
            lv_tick_inc(nowMs - _lastPumpMs);
        _havePumped = true;
        _lastPumpMs = nowMs;

        const uint32_t delay = lv_timer_handler();
        _registry.collect();

        return delay < maxDelayMs ? delay : maxDelayMs;
    }

    Obj Runtime::activeScreen()
    {
        if (!_initialized)
            return Obj();
        return Obj::wrap(_registry, lv_screen_active());
    }

    Obj Runtime::topLayer()
    {
        if (!_initialized)
            return Obj();
        return Obj::wrap(_registry, lv_layer_top());
    }

    Result<Obj> Runtime::createScreen()
    {
        if (!_initialized)
            return Error::NotInitialized;

        lv_obj_t *screen = lv_obj_create(nullptr);
        if (!screen)
            return Error::OutOfMemory;
        return Obj::wrap(_registry, screen);
    }

    Error Runtime::loadScreen(const Obj &screen)
    {
        if (!_initialized)
            return Error::NotInitialized;

        lv_obj_t *s = screen.raw();
        if (!s)
            return Error::InvalidHandle;

        lv_screen_load(s);
        return Error::Ok;
    }

    void Runtime::setLogSink(LogSink sink)
    {
#if LV_USE_LOG
        lv_log_register_print_cb(sink);
#else
        (void)sink;
#endif
    }
}
