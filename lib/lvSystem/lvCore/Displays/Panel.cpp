#include <lvCore/Displays/Panel.hpp>

namespace lvcore
{
    namespace
    {
        constexpr uint8_t CmdSLPIN = 0x10;
        constexpr uint8_t CmdSLPOUT = 0x11;
        constexpr uint8_t CmdDISPOFF = 0x28;
        constexpr uint8_t CmdDISPON = 0x29;
        constexpr uint8_t CmdCASET = 0x2A;
        constexpr uint8_t CmdRASET = 0x2B;
        constexpr uint8_t CmdRAMWR = 0x2C;
        constexpr uint8_t CmdMADCTL = 0x36;

        constexpr size_t FillChunkPixels = 512;

        inline void putBe16(uint8_t *out, uint16_t a, uint16_t b)
        {
            out[0] = static_cast<uint8_t>(a >> 8);
            out[1] = static_cast<uint8_t>(a & 0xFF);
            out[2] = static_cast<uint8_t>(b >> 8);
            out[3] = static_cast<uint8_t>(b & 0xFF);
        }
    }

    uint8_t madctlFor(Orientation orientation, bool bgr)
    {
        uint8_t v = 0;
        switch (orientation)
        {
        case Orientation::Portrait:
            v = madctl::MX;
            break;
        case Orientation::Landscape:
            v = madctl::MV;
            break;
        case Orientation::PortraitInverted:
            v = madctl::MY;
            break;
        case Orientation::LandscapeInverted:
            v = static_cast<uint8_t>(madctl::MY | madctl::MX | madctl::MV);
            break;
        }
        return bgr ? static_cast<uint8_t>(v | madctl::BGR) : v;
    }

    PanelDriver::PanelDriver(SpiPanelBus &bus, GuiPlatform &platform, const PanelConfig &cfg)
        : _bus(bus), _platform(platform), _cfg(cfg)
    {
    }

    uint16_t PanelDriver::width() const
    {
        return swapsAxes(_cfg.orientation) ? _cfg.height : _cfg.width;
    }

    uint16_t PanelDriver::height() const
    {
        return swapsAxes(_cfg.orientation) ? _cfg.width : _cfg.height;
    }

    size_t PanelDriver::chunkBytes() const
    {
        const size_t busMax = _bus.maxTransferBytes();
        if (busMax == 0 || busMax > MaxChunkBytes)
            return MaxChunkBytes;
        return busMax;
    }

    BusError PanelDriver::setOrientation(Orientation orientation)
    {
        const BusError err = writeCmd8(CmdMADCTL, madctlFor(orientation, _cfg.bgr));
        if (err != BusOk)
            return err;
        _cfg.orientation = orientation;
        return BusOk;
    }

    BusError PanelDriver::setWindow(uint16_t x0, uint16_t y0, uint16_t x1, uint16_t y1)
    {
        uint16_t dx = _cfg.colOffset;
        uint16_t dy = _cfg.rowOffset;
        if (swapsAxes(_cfg.orientation))
        {
            dx = _cfg.rowOffset;
            dy = _cfg.colOffset;
        }

        uint8_t buf[4];

        putBe16(buf, static_cast<uint16_t>(x0 + dx), static_cast<uint16_t>(x1 + dx));
        BusError err = writeCmd(CmdCASET, buf, sizeof(buf));
        if (err != BusOk)
            return err;

        putBe16(buf, static_cast<uint16_t>(y0 + dy), static_cast<uint16_t>(y1 + dy));
        err = writeCmd(CmdRASET, buf, sizeof(buf));
        if (err != BusOk)
            return err;

        return writeCmd(CmdRAMWR);
    }

    BusError PanelDriver::writePixels(const uint8_t *data, size_t len)
    {
        return forEachChunk(data, len, chunkBytes(), [this](const uint8_t *p, size_t n)
                            { return _bus.writeData(p, n); });
    }

    BusError PanelDriver::writeRect(int32_t x1,
                                    int32_t y1,
                                    int32_t x2,
                                    int32_t y2,
                                    const uint8_t *pixels,
                                    size_t len)
    {
        if (!pixels || x2 < x1 || y2 < y1 || x1 < 0 || y1 < 0)
            return BusErrInvalidArg;

        const BusError err = setWindow(static_cast<uint16_t>(x1),
                                       static_cast<uint16_t>(y1),
                                       static_cast<uint16_t>(x2),
                                       static_cast<uint16_t>(y2));
        if (err != BusOk)
            return err;

        return writePixels(pixels, len);
    }

    BusError PanelDriver::fillRect(uint16_t x, uint16_t y, uint16_t w, uint16_t h, uint16_t color)
    {
        if (!w || !h)
            return BusOk;

        BusError err = setWindow(x, y, static_cast<uint16_t>(x + w - 1U), static_cast<uint16_t>(y + h - 1U));
        if (err != BusOk)
            return err;

        uint8_t line[FillChunkPixels * 2];
        for (size_t i = 0; i < FillChunkPixels; ++i)
        {
            line[i * 2] = static_cast<uint8_t>(color >> 8);
            line[i * 2 + 1] = static_cast<uint8_t>(color & 0xFF);
        }

        size_t remaining = static_cast<size_t>(w) * static_cast<size_t>(h);
        while (remaining)
        {
            const size_t n = remaining > FillChunkPixels ? FillChunkPixels : remaining;
            err = writePixels(line, n * 2);
            if (err != BusOk)
                return err;
            remaining -= n;
        }
        return BusOk;
    }

    BusError PanelDriver::fillScreen565(uint16_t color)
    {
        return fillRect(0, 0, width(), height(), color);
    }

    BusError PanelDriver::displayOn()
    {
        return writeCmd(CmdDISPON);
    }

    BusError PanelDriver::displayOff()
    {
        return writeCmd(CmdDISPOFF);
    }

    BusError PanelDriver::sleep()
    {
        const BusError err = writeCmd(CmdSLPIN);
        if (err != BusOk)
            return err;
        delayMs(5);
        return BusOk;
    }

    BusError PanelDriver::wake()
    {
        const BusError err = writeCmd(CmdSLPOUT);
        if (err != BusOk)
            return err;
        delayMs(120);
        return BusOk;
    }

    void PanelDriver::setBacklight(bool on)
    {
        if (isPinValid(_cfg.backlight))
            _platform.ioDigitalWrite(static_cast<uint8_t>(_cfg.backlight), on);
    }

    BusError PanelDriver::writeCmd(uint8_t cmd)
    {
        return _bus.writeCommand(cmd);
    }

    BusError PanelDriver::writeCmd(uint8_t cmd, const uint8_t *data, size_t len)
    {
        const BusError err = _bus.writeCommand(cmd);
        if (err != BusOk || !len)
            return err;
        return _bus.writeData(data, len);
    }

    BusError PanelDriver::writeCmd8(uint8_t cmd, uint8_t value)
    {
        return writeCmd(cmd, &value, 1);
    }

    void PanelDriver::configurePins()
    {
        if (isPinValid(_cfg.rst))
            _platform.ioPinModeOutput(static_cast<uint8_t>(_cfg.rst));
        if (isPinValid(_cfg.backlight))
        {
            _platform.ioPinModeOutput(static_cast<uint8_t>(_cfg.backlight));
            _platform.ioDigitalWrite(static_cast<uint8_t>(_cfg.backlight), false);
        }
    }

    void PanelDriver::setReset(bool level)
    {
        if (isPinValid(_cfg.rst))
            _platform.ioDigitalWrite(static_cast<uint8_t>(_cfg.rst), level);
    }
}
