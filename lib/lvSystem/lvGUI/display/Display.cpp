#include <lvGUI/display/Display.hpp>

#include <lvGUI/core/api/Runtime.hpp>

namespace lvgui
{
    namespace detail
    {
        struct DisplayState
        {
            lv_display_t *disp = nullptr;
            ObjRegistry *registry = nullptr;
            FlushTarget *target = nullptr;
            RenderMode mode = RenderMode::Partial;
            FlushState state = FlushState::Idle;
            uint32_t flushes = 0;
            uint32_t readies = 0;
        };
    }

    bool FlushRequest::isLast() const
    {
        return _state && _state->disp && lv_display_flush_is_last(_state->disp);
    }

    void FlushRequest::ready()
    {
        if (!_state || !_state->disp)
            return;

        if (_state->state != FlushState::Flushing)
        {
            LV_LOG_WARN("flush acknowledged twice, ignoring");
            return;
        }

        _state->state = FlushState::Idle;
        ++_state->readies;
        lv_display_flush_ready(_state->disp);
    }

    Result<Display> Display::create(Runtime &runtime, int32_t width, int32_t height)
    {
        if (!runtime.isInitialized())
            return Error::NotInitialized;
        if (width <= 0 || height <= 0)
            return Error::InvalidParameter;

        std::unique_ptr<detail::DisplayState> state = std::make_unique<detail::DisplayState>();
        state->registry = &runtime.registry();
        state->disp = lv_display_create(width, height);
        if (!state->disp)
            return Error::OutOfMemory;

        lv_display_set_user_data(state->disp, state.get());
        lv_display_set_flush_cb(state->disp, flushTrampoline);

        return Display(std::move(state));
    }

    Display::Display(std::unique_ptr<detail::DisplayState> state)
        : _state(std::move(state))
    {
    }

    Display::Display(Display &&other) noexcept = default;

    Display &Display::operator=(Display &&other) noexcept
    {
        if (this != &other)
        {
            release();
            _state = std::move(other._state);
        }
        return *this;
    }

    Display::~Display()
    {
        release();
    }

    void Display::release()
    {
        if (!_state || !_state->disp)
            return;
        // lv_deinit already took the display down with it.
        if (lv_is_initialized())
            lv_display_delete(_state->disp);
        _state->disp = nullptr;
    }

    Error Display::setBuffers(void *buf1, void *buf2, uint32_t bytes, RenderMode mode)
    {
        if (!_state || !_state->disp)
            return Error::DisplayError;
        if (!buf1 || bytes == 0)
            return Error::InvalidParameter;

        lv_display_set_buffers(_state->disp, buf1, buf2, bytes, static_cast<lv_display_render_mode_t>(mode));
        _state->mode = mode;
        return Error::Ok;
    }

    void Display::setFlushTarget(FlushTarget &target)
    {
        if (_state)
            _state->target = &target;
    }

    int32_t Display::horizontalResolution() const
    {
        lv_display_t *d = raw();
        return d ? lv_display_get_horizontal_resolution(d) : 0;
    }

    int32_t Display::verticalResolution() const
    {
        lv_display_t *d = raw();
        return d ? lv_display_get_vertical_resolution(d) : 0;
    }

    void Display::setResolution(int32_t width, int32_t height)
    {
        if (lv_display_t *d = raw())
            lv_display_set_resolution(d, width, height);
    }

    void Display::setRotation(Rotation rotation)
    {
        if (lv_display_t *d = raw())
            lv_display_set_rotation(d, static_cast<lv_display_rotation_t>(rotation));
    }

    Rotation Display::rotation() const
    {
        lv_display_t *d = raw();
        return d ? static_cast<Rotation>(lv_display_get_rotation(d)) : Rotation::R0;
    }

    void Display::setDefault()
    {
        if (lv_display_t *d = raw())
            lv_display_set_default(d);
    }

    Obj Display::activeScreen() const
    {
        lv_display_t *d = raw();
        if (!d || !_state->registry)
            return Obj();
        return Obj::wrap(*_state->registry, lv_display_get_screen_active(d));
    }

    void Display::refreshNow()
    {
        if (lv_display_t *d = raw())
            lv_refr_now(d);
    }

    FlushState Display::flushState() const
    {
        return _state ? _state->state : FlushState::Idle;
    }

    uint32_t Display::flushCount() const
    {
        return _state ? _state->flushes : 0;
    }

    uint32_t Display::readyCount() const
    {
        return _state ? _state->readies : 0;
    }

    lv_display_t *Display::raw() const
    {
        return _state ? _state->disp : nullptr;
    }

    void Display::flushTrampoline(lv_display_t *disp, const lv_area_t *area, uint8_t *pxMap)
    {
        detail::DisplayState *state = static_cast<detail::DisplayState *>(lv_display_get_user_data(disp));
        if (!state)
        {
            lv_display_flush_ready(disp);
            return;
        }

        ++state->flushes;
        state->state = FlushState::Flushing;

        if (!state->target)
        {
            LV_LOG_WARN("display has no flush target, dropping frame");
            FlushRequest dropped(state, *area, pxMap, 0, 0, false);
            dropped.ready();
            return;
        }

        const lv_color_format_t cf = lv_display_get_color_format(disp);
        const uint32_t px = lv_color_format_get_size(cf);
        const uint32_t w = static_cast<uint32_t>(lv_area_get_width(area));
        const uint32_t h = static_cast<uint32_t>(lv_area_get_height(area));
        const size_t bytes = static_cast<size_t>(w) * h * px;

        // Partial buffers hold just the area. Full and direct buffers hold the whole
        // screen and pxMap points at its origin.
        size_t stride = lv_draw_buf_width_to_stride(w, cf);
        uint8_t *first = pxMap;
        if (state->mode != RenderMode::Partial)
        {
            stride = lv_draw_buf_width_to_stride(static_cast<uint32_t>(lv_display_get_horizontal_resolution(disp)), cf);
            first = pxMap + static_cast<size_t>(area->y1) * stride + static_cast<size_t>(area->x1) * px;
        }

        FlushRequest request(state, *area, first, bytes, stride, state->mode == RenderMode::Direct);
        state->target->flush(request);
    }
}
