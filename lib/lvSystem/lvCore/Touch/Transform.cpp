#include <lvCore/Touch/Transform.hpp>

namespace lvcore
{
    namespace
    {
        inline uint16_t saturatingSub(uint16_t a, uint16_t b)
        {
            return a > b ? static_cast<uint16_t>(a - b) : 0;
        }
    }

    void TouchTransform::apply(uint16_t rawX, uint16_t rawY, uint16_t &outX, uint16_t &outY) const
    {
        uint16_t x = swapXY ? rawY : rawX;
        uint16_t y = swapXY ? rawX : rawY;

        if (invertX)
            x = saturatingSub(width, x);
        if (invertY)
            y = saturatingSub(height, y);

        const uint16_t maxX = saturatingSub(width, 1);
        const uint16_t maxY = saturatingSub(height, 1);
        outX = x > maxX ? maxX : x;
        outY = y > maxY ? maxY : y;
    }
}
