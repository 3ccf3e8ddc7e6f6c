#pragma once

#include <stdint.h>
#include <stddef.h>

#include <lvCore/Displays/Panel.hpp>

namespace lvcore
{
    struct St7789Config : PanelConfig
    {
        St7789Config()
        {
            invertColors = true;
        }

        static St7789Config square240();
        static St7789Config rect240x320();
        // LILYGO T-Display
        static St7789Config tDisplay();
        // LILYGO T-Display-S3
        static St7789Config tDisplayS3();
        static St7789Config esp32S3Box();
    };

    class ST7789 final : public PanelDriver
    {
    public:
        ST7789(SpiPanelBus &bus, GuiPlatform &platform, const St7789Config &cfg = St7789Config::rect240x320());

        BusError begin() override;

        BusError setInversion(bool on);

    private:
        void hardReset();
    };
}
