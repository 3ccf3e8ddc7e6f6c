#pragma once

#include <stdint.h>
#include <stddef.h>

#include <lvCore/Platforms/Bus.hpp>

namespace lvcore
{
    class GuiDisplay
    {
    public:
        virtual ~GuiDisplay() = default;

        virtual BusError begin() = 0;
        virtual uint16_t width() const = 0;
        virtual uint16_t height() const = 0;

        virtual BusError fillScreen565(uint16_t color565) = 0;

        // Inclusive corners, pixels packed RGB565 in panel byte order.
        virtual BusError writeRect(int32_t x1,
                                   int32_t y1,
                                   int32_t x2,
                                   int32_t y2,
                                   const uint8_t *pixels,
                                   size_t len) = 0;
    };
}
