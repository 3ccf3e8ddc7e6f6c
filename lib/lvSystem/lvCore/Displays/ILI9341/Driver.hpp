#pragma once

#include <stdint.h>
#include <stddef.h>

#include <lvCore/Displays/Panel.hpp>

namespace lvcore
{
    struct Ili9341Config : PanelConfig
    {
        Ili9341Config()
        {
            width = 240;
            height = 320;
        }
    };

    class ILI9341 final : public PanelDriver
    {
    public:
        ILI9341(SpiPanelBus &bus, GuiPlatform &platform, const Ili9341Config &cfg = Ili9341Config());

        BusError begin() override;

    private:
        void hardReset();
    };
}
