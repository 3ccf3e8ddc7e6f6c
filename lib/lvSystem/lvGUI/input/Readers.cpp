#include <lvGUI/input/Readers.hpp>

namespace lvgui
{
    void TouchReader::read(InputSample &sample)
    {
        lvcore::TouchData data;
        _lastError = _touch.read(data);
        if (_lastError == lvcore::BusOk)
        {
            _last = data;
            _failedInRow = 0;
        }
        else
        {
            ++_errors;
            LV_LOG_WARN("touch read failed (%d)", static_cast<int>(_lastError));
            if (_failedInRow < MaxFailedReads && ++_failedInRow == MaxFailedReads)
            {
                LV_LOG_WARN("touch controller not answering, releasing");
                _last.pressed = false;
            }
        }

        sample.x = _last.x;
        sample.y = _last.y;
        sample.pressed = _last.pressed;
    }

    void ButtonReader::read(InputSample &sample)
    {
        _button.update();
        sample.buttonId = _buttonId;
        sample.pressed = _button.isDown();
    }
}
