#pragma once

#include <stdint.h>
#include <vector>

#include <lvCore/Platforms/GuiDisplay.hpp>
#include <lvGUI/display/Display.hpp>

namespace lvgui
{
    // Writes each dirty area straight to an SPI panel and acknowledges it once the bus is done.
    class PanelFlush final : public FlushTarget
    {
    public:
        // SPI panels take RGB565 big-endian, LVGL renders it little-endian.
        explicit PanelFlush(lvcore::GuiDisplay &panel, bool swapBytes = true)
            : _panel(panel), _swapBytes(swapBytes)
        {
        }

        void flush(FlushRequest &request) override;

        lvcore::BusError lastError() const { return _lastError; }
        uint32_t errorCount() const { return _errors; }

    private:
        lvcore::BusError writeRows(const FlushRequest &request);

        lvcore::GuiDisplay &_panel;
        bool _swapBytes;
        // One swapped row when the source frame must stay untouched.
        std::vector<uint8_t> _row;
        lvcore::BusError _lastError = lvcore::BusOk;
        uint32_t _errors = 0;
    };
}
