#pragma once

#include <stdint.h>
#include <stddef.h>

#include <lvCore/Platforms/Bus.hpp>
#include <lvCore/Platforms/GUIPlatform.hpp>
#include <lvCore/Touch/Transform.hpp>

namespace lvcore
{
    enum class Gesture : uint8_t
    {
        None = 0x00,
        SwipeUp = 0x01,
        SwipeDown = 0x02,
        SwipeLeft = 0x03,
        SwipeRight = 0x04,
        SingleClick = 0x05,
        DoubleClick = 0x0B,
        LongPress = 0x0C
    };

    Gesture gestureFromCode(uint8_t code);
    const char *gestureName(Gesture gesture);

    struct TouchData
    {
        uint16_t x = 0;
        uint16_t y = 0;
        bool pressed = false;
        Gesture gesture = Gesture::None;
    };

    struct Cst816Config
    {
        uint8_t address = 0x15;
        int8_t rst = -1;
        int8_t irq = -1;
        uint32_t timeoutMs = 100;
        TouchTransform transform;
    };

    class CST816
    {
    public:
        static constexpr size_t ReportBytes = 6;

        CST816(I2cBus &bus, GuiPlatform &platform, const Cst816Config &cfg);

        BusError begin();
        BusError read(TouchData &out);

        // Raw report starting at the gesture register.
        static TouchData decodeReport(const uint8_t (&report)[ReportBytes], const TouchTransform &transform);

        void setTransform(bool swapXY, bool invertX, bool invertY);
        const TouchTransform &transform() const { return _cfg.transform; }

        // Active-low interrupt line; without one every poll has to hit the bus.
        bool isTouched();

        BusError sleep();
        BusError wake();

        uint8_t chipId() const { return _chipId; }

    private:
        void hardReset();
        BusError readReg(uint8_t reg, uint8_t &value);
        BusError writeReg(uint8_t reg, uint8_t value);

        I2cBus &_bus;
        GuiPlatform &_platform;
        Cst816Config _cfg;
        uint8_t _chipId = 0;
    };
}
