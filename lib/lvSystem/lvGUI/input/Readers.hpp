#pragma once

#include <stdint.h>

#include <lvCore/Button.hpp>
#include <lvCore/Touch/CST816/Driver.hpp>
#include <lvGUI/input/InputDevice.hpp>

namespace lvgui
{
    // Pointer reader backed by a CST816. A failed bus read repeats the previous sample,
    // released once MaxFailedReads reads in a row have failed.
    class TouchReader final : public InputReader
    {
    public:
        static constexpr uint8_t MaxFailedReads = 3;

        explicit TouchReader(lvcore::CST816 &touch) : _touch(touch) {}

        void read(InputSample &sample) override;

        const lvcore::TouchData &last() const { return _last; }
        lvcore::Gesture lastGesture() const { return _last.gesture; }
        lvcore::BusError lastError() const { return _lastError; }
        uint32_t errorCount() const { return _errors; }

    private:
        lvcore::CST816 &_touch;
        lvcore::TouchData _last;
        lvcore::BusError _lastError = lvcore::BusOk;
        uint32_t _errors = 0;
        uint8_t _failedInRow = 0;
    };

    // Button-type reader backed by a debounced GPIO button.
    class ButtonReader final : public InputReader
    {
    public:
        ButtonReader(lvcore::Button &button, uint32_t buttonId = 0) : _button(button), _buttonId(buttonId) {}

        void read(InputSample &sample) override;

    private:
        lvcore::Button &_button;
        uint32_t _buttonId;
    };
}
