#pragma once

#include <stdint.h>

#include <lvCore/Platforms/GUIPlatform.hpp>

namespace lvcore
{
    // Debounced push button sampled through the platform GPIO.
    class Button
    {
    public:
        Button(GuiPlatform &platform, uint8_t pin, bool usePullup = true, bool activeLow = true, uint16_t debounceMs = 30)
            : _platform(platform),
              _pin(pin),
              _usePullup(usePullup),
              _activeLow(activeLow),
              _debounceMs(debounceMs)
        {
        }

        void begin()
        {
            _platform.ioPinModeInput(_pin, _usePullup);
            _stable = _sampled = readLevel();
            _sampledAtMs = _platform.nowMs();
            _downSinceMs = _sampledAtMs;
            _edges = 0;
        }

        void update()
        {
            const uint32_t now = _platform.nowMs();
            const bool level = readLevel();
            if (level != _sampled)
            {
                _sampled = level;
                _sampledAtMs = now;
                return;
            }

            if (_stable == _sampled || (uint32_t)(now - _sampledAtMs) < _debounceMs)
                return;

            _stable = _sampled;
            if (_stable)
            {
                _downSinceMs = now;
                _edges |= EdgePress;
            }
            else
            {
                _edges |= EdgeRelease;
            }
        }

        bool wasPressed() { return consume(EdgePress); }
        bool wasReleased() { return consume(EdgeRelease); }

        bool isDown() const { return _stable; }

        uint32_t heldMs() const
        {
            return _stable ? (uint32_t)(_platform.nowMs() - _downSinceMs) : 0;
        }

        uint8_t pin() const { return _pin; }

    private:
        static constexpr uint8_t EdgePress = 0x01;
        static constexpr uint8_t EdgeRelease = 0x02;

        bool consume(uint8_t edge)
        {
            update();
            const bool hit = (_edges & edge) != 0;
            _edges = static_cast<uint8_t>(_edges & ~edge);
            return hit;
        }

        bool readLevel() const
        {
            const bool v = _platform.ioDigitalRead(_pin);
            return _activeLow ? !v : v;
        }

        GuiPlatform &_platform;
        uint8_t _pin;
        bool _usePullup;
        bool _activeLow;
        uint16_t _debounceMs;

        bool _stable = false;
        bool _sampled = false;
        uint32_t _sampledAtMs = 0;
        uint32_t _downSinceMs = 0;
        uint8_t _edges = 0;
    };
}
