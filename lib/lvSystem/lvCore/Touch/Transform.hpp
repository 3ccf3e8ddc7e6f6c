#pragma once

#include <stdint.h>

namespace lvcore
{
    // Maps raw controller coordinates onto panel coordinates: swap, then invert, then clamp.
    struct TouchTransform
    {
        uint16_t width = 0;
        uint16_t height = 0;
        bool swapXY = false;
        bool invertX = false;
        bool invertY = false;

        void apply(uint16_t rawX, uint16_t rawY, uint16_t &outX, uint16_t &outY) const;
    };
}
