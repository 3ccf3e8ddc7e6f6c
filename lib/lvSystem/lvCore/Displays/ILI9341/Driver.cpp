#include <lvCore/Displays/ILI9341/Driver.hpp>

namespace lvcore
{
    namespace
    {
        constexpr uint8_t CmdSWRESET = 0x01;
        constexpr uint8_t CmdSLPOUT = 0x11;
        constexpr uint8_t CmdINVON = 0x21;
        constexpr uint8_t CmdDISPON = 0x29;
        constexpr uint8_t CmdCOLMOD = 0x3A;

        constexpr uint8_t Colmod16bpp = 0x55;
    }

    ILI9341::ILI9341(SpiPanelBus &bus, GuiPlatform &platform, const Ili9341Config &cfg)
        : PanelDriver(bus, platform, cfg)
    {
    }

    BusError ILI9341::begin()
    {
        if (_cfg.width == 0 || _cfg.height == 0)
            return BusErrInvalidArg;

        configurePins();
        hardReset();

        BusError err = writeCmd(CmdSWRESET);
        if (err != BusOk)
            return err;
        delayMs(120);

        err = writeCmd(CmdSLPOUT);
        if (err != BusOk)
            return err;
        delayMs(120);

        err = writeCmd8(CmdCOLMOD, Colmod16bpp);
        if (err != BusOk)
            return err;

        err = setOrientation(_cfg.orientation);
        if (err != BusOk)
            return err;

        if (_cfg.invertColors)
        {
            err = writeCmd(CmdINVON);
            if (err != BusOk)
                return err;
        }

        err = writeCmd(CmdDISPON);
        if (err != BusOk)
            return err;
        delayMs(50);

        setBacklight(true);
        return BusOk;
    }

    void ILI9341::hardReset()
    {
        if (!isPinValid(_cfg.rst))
            return;

        setReset(false);
        delayMs(10);
        setReset(true);
        delayMs(120);
    }
}
