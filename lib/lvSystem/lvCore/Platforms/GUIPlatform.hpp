#pragma once

#include <stdint.h>
#include <stddef.h>
#include <stdlib.h>

namespace lvcore
{
    enum class GuiAllocCaps : uint8_t
    {
        Default = 0,
        PreferExternal = 1,
        Dma = 2
    };

    class GuiPlatform
    {
    public:
        virtual ~GuiPlatform() = default;

        virtual uint32_t nowMs() = 0;
        virtual void delayMs(uint32_t ms) = 0;

        virtual void ioPinModeInput(uint8_t, bool) {}
        virtual void ioPinModeOutput(uint8_t) {}
        virtual bool ioDigitalRead(uint8_t) { return false; }
        virtual void ioDigitalWrite(uint8_t, bool) {}

        virtual void configureBacklightPin(uint8_t, uint8_t = 0, uint32_t = 5000, uint8_t = 12) {}
        virtual uint8_t loadMaxBrightnessPercent() { return 100; }
        virtual void storeMaxBrightnessPercent(uint8_t) {}
        virtual void setBacklightPercent(uint8_t) {}

        virtual void *guiAlloc(size_t bytes, GuiAllocCaps caps = GuiAllocCaps::Default)
        {
            (void)caps;
            return malloc(bytes);
        }
    };

    inline bool isPinValid(int8_t pin)
    {
        return pin >= 0;
    }
}
