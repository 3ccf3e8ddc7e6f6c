#pragma once

#include <stdint.h>
#include <stddef.h>
#include <memory>

#include <lvgl.h>

#include <lvGUI/core/api/Error.hpp>
#include <lvGUI/core/api/Obj.hpp>

namespace lvgui
{
    class Runtime;

    enum class RenderMode : uint8_t
    {
        Partial = LV_DISPLAY_RENDER_MODE_PARTIAL,
        Direct = LV_DISPLAY_RENDER_MODE_DIRECT,
        Full = LV_DISPLAY_RENDER_MODE_FULL
    };

    enum class Rotation : uint8_t
    {
        R0 = LV_DISPLAY_ROTATION_0,
        R90 = LV_DISPLAY_ROTATION_90,
        R180 = LV_DISPLAY_ROTATION_180,
        R270 = LV_DISPLAY_ROTATION_270
    };

    enum class FlushState : uint8_t
    {
        Idle,
        Flushing
    };

    // Bytes for `lines` full rows of RGB565.
    constexpr uint32_t bufferBytes(int32_t width, int32_t lines)
    {
        return (width > 0 && lines > 0) ? static_cast<uint32_t>(width) * static_cast<uint32_t>(lines) * 2U : 0U;
    }

    template <uint32_t Bytes>
    struct DrawBuffer
    {
        alignas(4) uint8_t data[Bytes];

        static constexpr uint32_t size() { return Bytes; }
    };

    namespace detail
    {
        struct DisplayState;
    }

    // One dirty area handed to a FlushTarget. Copyable so the transfer can finish later;
    // ready() must be called exactly once per request.
    // Rows of the area start stride() bytes apart from pixels(); each row holds rowBytes().
    class FlushRequest
    {
    public:
        int32_t x1() const { return _area.x1; }
        int32_t y1() const { return _area.y1; }
        int32_t x2() const { return _area.x2; }
        int32_t y2() const { return _area.y2; }
        int32_t width() const { return _area.x2 - _area.x1 + 1; }
        int32_t height() const { return _area.y2 - _area.y1 + 1; }
        const lv_area_t &area() const { return _area; }

        // First pixel of the area.
        uint8_t *pixels() const { return _pixels; }
        // Bytes in the area, packed.
        size_t byteCount() const { return _bytes; }
        size_t rowBytes() const { return height() > 0 ? _bytes / static_cast<size_t>(height()) : 0; }
        size_t stride() const { return _stride; }
        bool isContiguous() const { return _stride == rowBytes(); }
        // The pixels live in a frame buffer LVGL keeps drawing into (direct mode). Do not modify them.
        bool isRetained() const { return _retained; }

        // Last area of the current refresh cycle.
        bool isLast() const;

        void ready();

    private:
        friend class Display;

        FlushRequest(detail::DisplayState *state,
                     const lv_area_t &area,
                     uint8_t *pixels,
                     size_t bytes,
                     size_t stride,
                     bool retained)
            : _state(state), _area(area), _pixels(pixels), _bytes(bytes), _stride(stride), _retained(retained)
        {
        }

        detail::DisplayState *_state;
        lv_area_t _area;
        uint8_t *_pixels;
        size_t _bytes;
        size_t _stride;
        bool _retained;
    };

    class FlushTarget
    {
    public:
        virtual ~FlushTarget() = default;
        virtual void flush(FlushRequest &request) = 0;
    };

    // Owns one lv_display_t.
    class Display
    {
    public:
        static Result<Display> create(Runtime &runtime, int32_t width, int32_t height);

        Display(Display &&other) noexcept;
        Display &operator=(Display &&other) noexcept;
        ~Display();

        Display(const Display &) = delete;
        Display &operator=(const Display &) = delete;

        // buf1 and buf2 stay owned by the caller and must outlive the display.
        Error setBuffers(void *buf1, void *buf2, uint32_t bytes, RenderMode mode);
        void setFlushTarget(FlushTarget &target);

        int32_t horizontalResolution() const;
        int32_t verticalResolution() const;
        void setResolution(int32_t width, int32_t height);
        void setRotation(Rotation rotation);
        Rotation rotation() const;

        void setDefault();
        Obj activeScreen() const;
        // Renders every invalidated area right away.
        void refreshNow();

        FlushState flushState() const;
        uint32_t flushCount() const;
        uint32_t readyCount() const;

        lv_display_t *raw() const;

    private:
        explicit Display(std::unique_ptr<detail::DisplayState> state);

        void release();

        static void flushTrampoline(lv_display_t *disp, const lv_area_t *area, uint8_t *pxMap);

        std::unique_ptr<detail::DisplayState> _state;
    };
}
