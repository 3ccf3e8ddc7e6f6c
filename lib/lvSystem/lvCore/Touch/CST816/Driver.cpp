#include <lvCore/Touch/CST816/Driver.hpp>

namespace lvcore
{
    namespace
    {
        constexpr uint8_t RegGestureId = 0x01;
        constexpr uint8_t RegChipId = 0xA7;
        constexpr uint8_t RegIrqCtl = 0xFA;
        constexpr uint8_t RegDisAutoSleep = 0xFE;

        constexpr uint8_t IrqOnTouch = 0x41;
    }

    Gesture gestureFromCode(uint8_t code)
    {
        switch (code)
        {
        case 0x01:
            return Gesture::SwipeUp;
        case 0x02:
            return Gesture::SwipeDown;
        case 0x03:
            return Gesture::SwipeLeft;
        case 0x04:
            return Gesture::SwipeRight;
        case 0x05:
            return Gesture::SingleClick;
        case 0x0B:
            return Gesture::DoubleClick;
        case 0x0C:
            return Gesture::LongPress;
        default:
            return Gesture::None;
        }
    }

    const char *gestureName(Gesture gesture)
    {
        switch (gesture)
        {
        case Gesture::SwipeUp:
            return "swipe-up";
        case Gesture::SwipeDown:
            return "swipe-down";
        case Gesture::SwipeLeft:
            return "swipe-left";
        case Gesture::SwipeRight:
            return "swipe-right";
        case Gesture::SingleClick:
            return "click";
        case Gesture::DoubleClick:
            return "double-click";
        case Gesture::LongPress:
            return "long-press";
        case Gesture::None:
            break;
        }
        return "none";
    }

    CST816::CST816(I2cBus &bus, GuiPlatform &platform, const Cst816Config &cfg)
        : _bus(bus), _platform(platform), _cfg(cfg)
    {
    }

    BusError CST816::begin()
    {
        if (isPinValid(_cfg.rst))
            _platform.ioPinModeOutput(static_cast<uint8_t>(_cfg.rst));
        if (isPinValid(_cfg.irq))
            _platform.ioPinModeInput(static_cast<uint8_t>(_cfg.irq), true);

        hardReset();

        BusError err = readReg(RegChipId, _chipId);
        if (err != BusOk)
            return err;

        err = writeReg(RegDisAutoSleep, 0x01);
        if (err != BusOk)
            return err;

        return writeReg(RegIrqCtl, IrqOnTouch);
    }

    BusError CST816::read(TouchData &out)
    {
        const uint8_t reg = RegGestureId;
        uint8_t report[ReportBytes] = {};

        const BusError err = _bus.writeRead(_cfg.address, &reg, 1, report, sizeof(report), _cfg.timeoutMs);
        if (err != BusOk)
            return err;

        out = decodeReport(report, _cfg.transform);
        return BusOk;
    }

    TouchData CST816::decodeReport(const uint8_t (&report)[ReportBytes], const TouchTransform &transform)
    {
        const uint16_t rawX = static_cast<uint16_t>(((report[2] & 0x0F) << 8) | report[3]);
        const uint16_t rawY = static_cast<uint16_t>(((report[4] & 0x0F) << 8) | report[5]);

        TouchData data;
        data.gesture = gestureFromCode(report[0]);
        data.pressed = report[1] > 0;
        transform.apply(rawX, rawY, data.x, data.y);
        return data;
    }

    void CST816::setTransform(bool swapXY, bool invertX, bool invertY)
    {
        _cfg.transform.swapXY = swapXY;
        _cfg.transform.invertX = invertX;
        _cfg.transform.invertY = invertY;
    }

    bool CST816::isTouched()
    {
        if (!isPinValid(_cfg.irq))
            return true;
        return !_platform.ioDigitalRead(static_cast<uint8_t>(_cfg.irq));
    }

    BusError CST816::sleep()
    {
        return writeReg(RegDisAutoSleep, 0x00);
    }

    BusError CST816::wake()
    {
        hardReset();
        return writeReg(RegDisAutoSleep, 0x01);
    }

    void CST816::hardReset()
    {
        if (!isPinValid(_cfg.rst))
            return;

        const uint8_t pin = static_cast<uint8_t>(_cfg.rst);
        _platform.ioDigitalWrite(pin, false);
        _platform.delayMs(10);
        _platform.ioDigitalWrite(pin, true);
        _platform.delayMs(50);
    }

    BusError CST816::readReg(uint8_t reg, uint8_t &value)
    {
        return _bus.writeRead(_cfg.address, &reg, 1, &value, 1, _cfg.timeoutMs);
    }

    BusError CST816::writeReg(uint8_t reg, uint8_t value)
    {
        const uint8_t buf[2] = {reg, value};
        return _bus.write(_cfg.address, buf, sizeof(buf), _cfg.timeoutMs);
    }
}
