#pragma once

#include <lvCore/Platforms/GUIPlatform.hpp>

#if !defined(ESP32)
#error "lvcore::Esp32GuiPlatform requires ESP32"
#endif

#include <Arduino.h>
#include <Preferences.h>

namespace lvcore
{
    class Esp32GuiPlatform final : public GuiPlatform
    {
    public:
        Esp32GuiPlatform() = default;

        uint32_t nowMs() override;
        void delayMs(uint32_t ms) override;

        void ioPinModeInput(uint8_t pin, bool pullup) override;
        void ioPinModeOutput(uint8_t pin) override;
        bool ioDigitalRead(uint8_t pin) override;
        void ioDigitalWrite(uint8_t pin, bool level) override;

        void configureBacklightPin(uint8_t pin, uint8_t channel = 0, uint32_t freqHz = 5000, uint8_t resolutionBits = 12) override;
        uint8_t loadMaxBrightnessPercent() override;
        void storeMaxBrightnessPercent(uint8_t percent) override;
        void setBacklightPercent(uint8_t percent) override;

        void *guiAlloc(size_t bytes, GuiAllocCaps caps = GuiAllocCaps::Default) override;

    private:
        void ensurePrefs();

        Preferences _prefs;
        bool _prefsInited = false;

        bool _backlightConfigured = false;
        uint8_t _backlightChannel = 0;
        uint8_t _backlightResolution = 12;
    };
}
