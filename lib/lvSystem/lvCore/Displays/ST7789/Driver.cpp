#include <lvCore/Displays/ST7789/Driver.hpp>

namespace lvcore
{
    namespace
    {
        constexpr uint8_t CmdSWRESET = 0x01;
        constexpr uint8_t CmdSLPOUT = 0x11;
        constexpr uint8_t CmdNORON = 0x13;
        constexpr uint8_t CmdINVOFF = 0x20;
        constexpr uint8_t CmdINVON = 0x21;
        constexpr uint8_t CmdDISPON = 0x29;
        constexpr uint8_t CmdCOLMOD = 0x3A;

        constexpr uint8_t Colmod16bpp = 0x55;

        St7789Config makeConfig(uint16_t w, uint16_t h, uint16_t colOffset, uint16_t rowOffset, Orientation o)
        {
            St7789Config cfg;
            cfg.width = w;
            cfg.height = h;
            cfg.colOffset = colOffset;
            cfg.rowOffset = rowOffset;
            cfg.orientation = o;
            return cfg;
        }
    }

    St7789Config St7789Config::square240()
    {
        return makeConfig(240, 240, 0, 0, Orientation::Portrait);
    }

    St7789Config St7789Config::rect240x320()
    {
        return makeConfig(240, 320, 0, 0, Orientation::Portrait);
    }

    St7789Config St7789Config::tDisplay()
    {
        return makeConfig(135, 240, 52, 40, Orientation::Portrait);
    }

    St7789Config St7789Config::tDisplayS3()
    {
        return makeConfig(170, 320, 35, 0, Orientation::Portrait);
    }

    St7789Config St7789Config::esp32S3Box()
    {
        return makeConfig(240, 320, 0, 0, Orientation::Landscape);
    }

    ST7789::ST7789(SpiPanelBus &bus, GuiPlatform &platform, const St7789Config &cfg)
        : PanelDriver(bus, platform, cfg)
    {
    }

    BusError ST7789::begin()
    {
        if (_cfg.width == 0 || _cfg.height == 0)
            return BusErrInvalidArg;

        configurePins();
        hardReset();

        BusError err = writeCmd(CmdSWRESET);
        if (err != BusOk)
            return err;
        delayMs(150);

        err = writeCmd(CmdSLPOUT);
        if (err != BusOk)
            return err;
        delayMs(50);

        err = writeCmd8(CmdCOLMOD, Colmod16bpp);
        if (err != BusOk)
            return err;
        delayMs(10);

        err = setOrientation(_cfg.orientation);
        if (err != BusOk)
            return err;

        err = setInversion(_cfg.invertColors);
        if (err != BusOk)
            return err;
        delayMs(10);

        err = writeCmd(CmdNORON);
        if (err != BusOk)
            return err;
        delayMs(10);

        err = writeCmd(CmdDISPON);
        if (err != BusOk)
            return err;
        delayMs(50);

        err = fillScreen565(color565::Black);
        if (err != BusOk)
            return err;

        setBacklight(true);
        return BusOk;
    }

    BusError ST7789::setInversion(bool on)
    {
        const BusError err = writeCmd(on ? CmdINVON : CmdINVOFF);
        if (err == BusOk)
            _cfg.invertColors = on;
        return err;
    }

    void ST7789::hardReset()
    {
        if (!isPinValid(_cfg.rst))
            return;

        setReset(true);
        delayMs(10);
        setReset(false);
        delayMs(10);
        setReset(true);
        delayMs(120);
    }
}
