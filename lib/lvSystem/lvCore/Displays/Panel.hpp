#pragma once

#include <stdint.h>
#include <stddef.h>

#include <lvCore/Platforms/Bus.hpp>
#include <lvCore/Platforms/GUIPlatform.hpp>
#include <lvCore/Platforms/GuiDisplay.hpp>

namespace lvcore
{
    enum class Orientation : uint8_t
    {
        Portrait,
        Landscape,
        PortraitInverted,
        LandscapeInverted
    };

    namespace madctl
    {
        constexpr uint8_t MY = 0x80;
        constexpr uint8_t MX = 0x40;
        constexpr uint8_t MV = 0x20;
        constexpr uint8_t ML = 0x10;
        constexpr uint8_t BGR = 0x08;
        constexpr uint8_t MH = 0x04;
    }

    uint8_t madctlFor(Orientation orientation, bool bgr);

    inline bool swapsAxes(Orientation orientation)
    {
        return orientation == Orientation::Landscape || orientation == Orientation::LandscapeInverted;
    }

    constexpr uint16_t rgb565(uint8_t r, uint8_t g, uint8_t b)
    {
        return static_cast<uint16_t>(((r & 0xF8) << 8) | ((g & 0xFC) << 3) | (b >> 3));
    }

    namespace color565
    {
        constexpr uint16_t Black = 0x0000;
        constexpr uint16_t White = 0xFFFF;
        constexpr uint16_t Red = rgb565(255, 0, 0);
        constexpr uint16_t Green = rgb565(0, 255, 0);
        constexpr uint16_t Blue = rgb565(0, 0, 255);
        constexpr uint16_t Yellow = rgb565(255, 255, 0);
        constexpr uint16_t Cyan = rgb565(0, 255, 255);
        constexpr uint16_t Magenta = rgb565(255, 0, 255);
    }

    // Calls fn(ptr, n) for consecutive slices of at most maxChunk bytes, stops on the first error.
    template <typename Fn>
    BusError forEachChunk(const uint8_t *data, size_t len, size_t maxChunk, Fn &&fn)
    {
        if (!data || !maxChunk)
            return len ? BusErrInvalidArg : BusOk;

        while (len)
        {
            const size_t n = len > maxChunk ? maxChunk : len;
            const BusError err = fn(data, n);
            if (err != BusOk)
                return err;
            data += n;
            len -= n;
        }
        return BusOk;
    }

    struct PanelConfig
    {
        uint16_t width = 0;
        uint16_t height = 0;
        uint16_t colOffset = 0;
        uint16_t rowOffset = 0;
        Orientation orientation = Orientation::Portrait;
        bool invertColors = false;
        bool bgr = true;
        int8_t rst = -1;
        int8_t backlight = -1;
    };

    // Command/data plumbing shared by the MIPI-DCS style SPI panels.
    class PanelDriver : public GuiDisplay
    {
    public:
        static constexpr size_t MaxChunkBytes = 4096;

        PanelDriver(SpiPanelBus &bus, GuiPlatform &platform, const PanelConfig &cfg);

        uint16_t width() const override;
        uint16_t height() const override;

        const PanelConfig &config() const { return _cfg; }
        Orientation orientation() const { return _cfg.orientation; }
        size_t chunkBytes() const;

        BusError setOrientation(Orientation orientation);

        BusError setWindow(uint16_t x0, uint16_t y0, uint16_t x1, uint16_t y1);
        BusError writePixels(const uint8_t *data, size_t len);

        BusError writeRect(int32_t x1,
                           int32_t y1,
                           int32_t x2,
                           int32_t y2,
                           const uint8_t *pixels,
                           size_t len) override;

        BusError fillRect(uint16_t x, uint16_t y, uint16_t w, uint16_t h, uint16_t color565);
        BusError fillScreen565(uint16_t color565) override;
        BusError clear() { return fillScreen565(color565::Black); }

        BusError displayOn();
        BusError displayOff();
        BusError sleep();
        BusError wake();

        void setBacklight(bool on);

    protected:
        BusError writeCmd(uint8_t cmd);
        BusError writeCmd(uint8_t cmd, const uint8_t *data, size_t len);
        BusError writeCmd8(uint8_t cmd, uint8_t value);

        void configurePins();
        void setReset(bool level);
        void delayMs(uint32_t ms) { _platform.delayMs(ms); }

        SpiPanelBus &_bus;
        GuiPlatform &_platform;
        PanelConfig _cfg;
    };
}
