#include <lvCore/Platforms/ESP32/GUI.hpp>

#include <esp_heap_caps.h>

namespace lvcore
{
    namespace
    {
        constexpr const char *PrefsNamespace = "lvgui";
        constexpr const char *PrefsKeyMaxBrightness = "bmax";
    }

    uint32_t Esp32GuiPlatform::nowMs()
    {
        return millis();
    }

    void Esp32GuiPlatform::delayMs(uint32_t ms)
    {
        delay(ms);
    }

    void Esp32GuiPlatform::ioPinModeInput(uint8_t pin, bool pullup)
    {
        pinMode(pin, pullup ? INPUT_PULLUP : INPUT);
    }

    void Esp32GuiPlatform::ioPinModeOutput(uint8_t pin)
    {
        pinMode(pin, OUTPUT);
    }

    bool Esp32GuiPlatform::ioDigitalRead(uint8_t pin)
    {
        return digitalRead(pin) != 0;
    }

    void Esp32GuiPlatform::ioDigitalWrite(uint8_t pin, bool level)
    {
        digitalWrite(pin, level ? HIGH : LOW);
    }

    void Esp32GuiPlatform::configureBacklightPin(uint8_t pin, uint8_t channel, uint32_t freqHz, uint8_t resolutionBits)
    {
        const uint8_t resolvedBits = resolutionBits > 16 ? 12 : resolutionBits;
        ledcSetup(channel, freqHz, resolvedBits);
        ledcAttachPin(pin, channel);
        _backlightConfigured = true;
        _backlightChannel = channel;
        _backlightResolution = resolvedBits;
    }

    void Esp32GuiPlatform::ensurePrefs()
    {
        if (_prefsInited)
            return;
        _prefs.begin(PrefsNamespace, false);
        _prefsInited = true;
    }

    uint8_t Esp32GuiPlatform::loadMaxBrightnessPercent()
    {
        ensurePrefs();

        uint16_t raw = _prefs.getUShort(PrefsKeyMaxBrightness, 100);
        if (raw > 100)
            raw = 100;
        return static_cast<uint8_t>(raw);
    }

    void Esp32GuiPlatform::storeMaxBrightnessPercent(uint8_t percent)
    {
        if (percent > 100)
            percent = 100;

        ensurePrefs();
        _prefs.putUShort(PrefsKeyMaxBrightness, percent);
    }

    void Esp32GuiPlatform::setBacklightPercent(uint8_t percent)
    {
        if (!_backlightConfigured)
            return;

        if (percent > 100)
            percent = 100;

        const uint32_t dutyMax = (1U << _backlightResolution) - 1U;
        ledcWrite(_backlightChannel, (dutyMax * (uint32_t)percent + 50U) / 100U);
    }

    void *Esp32GuiPlatform::guiAlloc(size_t bytes, GuiAllocCaps caps)
    {
        if (bytes == 0)
            return nullptr;

        switch (caps)
        {
        case GuiAllocCaps::Dma:
            return heap_caps_aligned_alloc(4, bytes, MALLOC_CAP_DMA | MALLOC_CAP_8BIT);
        case GuiAllocCaps::PreferExternal:
        {
            void *p = heap_caps_malloc(bytes, MALLOC_CAP_SPIRAM | MALLOC_CAP_8BIT);
            if (p)
                return p;
            break;
        }
        case GuiAllocCaps::Default:
            break;
        }

        return heap_caps_malloc(bytes, MALLOC_CAP_8BIT);
    }
}
