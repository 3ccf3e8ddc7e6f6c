#include <lvGUI/display/PanelFlush.hpp>

#include <string.h>

namespace lvgui
{
    lvcore::BusError PanelFlush::writeRows(const FlushRequest &request)
    {
        const size_t rowBytes = request.rowBytes();
        const bool copy = _swapBytes && request.isRetained();
        if (copy)
            _row.resize(rowBytes);

        for (int32_t r = 0; r < request.height(); ++r)
        {
            uint8_t *src = request.pixels() + static_cast<size_t>(r) * request.stride();
            if (copy)
            {
                memcpy(_row.data(), src, rowBytes);
                src = _row.data();
            }
            if (_swapBytes)
                lv_draw_sw_rgb565_swap(src, static_cast<uint32_t>(rowBytes / 2));

            const int32_t y = request.y1() + r;
            lvcore::BusError err = _panel.writeRect(request.x1(), y, request.x2(), y, src, rowBytes);
            if (err != lvcore::BusOk)
                return err;
        }
        return lvcore::BusOk;
    }

    void PanelFlush::flush(FlushRequest &request)
    {
        if (request.isContiguous() && !(_swapBytes && request.isRetained()))
        {
            if (_swapBytes)
                lv_draw_sw_rgb565_swap(request.pixels(), static_cast<uint32_t>(request.byteCount() / 2));

            _lastError = _panel.writeRect(request.x1(),
                                          request.y1(),
                                          request.x2(),
                                          request.y2(),
                                          request.pixels(),
                                          request.byteCount());
        }
        else
        {
            _lastError = writeRows(request);
        }
        if (_lastError != lvcore::BusOk)
        {
            ++_errors;
            LV_LOG_ERROR("panel write failed (%d) for area %d,%d-%d,%d",
                         static_cast<int>(_lastError),
                         static_cast<int>(request.x1()),
                         static_cast<int>(request.y1()),
                         static_cast<int>(request.x2()),
                         static_cast<int>(request.y2()));
        }

        // A failed area is dropped; holding it back would stall the renderer.
        request.ready();
    }
}
