#include <lvGUI/input/InputDevice.hpp>

#include <lvGUI/core/api/Runtime.hpp>
#include <lvGUI/display/Display.hpp>

namespace lvgui
{
    namespace detail
    {
        struct InputState
        {
            lv_indev_t *indev = nullptr;
            InputReader *reader = nullptr;
            uint32_t reads = 0;
        };
    }

    Result<InputDevice> InputDevice::create(Runtime &runtime)
    {
        if (!runtime.isInitialized())
            return Error::NotInitialized;

        std::unique_ptr<detail::InputState> state = std::make_unique<detail::InputState>();
        state->indev = lv_indev_create();
        if (!state->indev)
            return Error::OutOfMemory;

        lv_indev_set_user_data(state->indev, state.get());
        lv_indev_set_read_cb(state->indev, readTrampoline);

        return InputDevice(std::move(state));
    }

    Result<InputDevice> InputDevice::createPointer(Runtime &runtime, InputReader &reader)
    {
        Result<InputDevice> dev = create(runtime);
        if (!dev)
            return dev;

        dev->setType(InputType::Pointer);
        dev->setReader(reader);
        return dev;
    }

    InputDevice::InputDevice(std::unique_ptr<detail::InputState> state)
        : _state(std::move(state))
    {
    }

    InputDevice::InputDevice(InputDevice &&other) noexcept = default;

    InputDevice &InputDevice::operator=(InputDevice &&other) noexcept
    {
        if (this != &other)
        {
            release();
            _state = std::move(other._state);
        }
        return *this;
    }

    InputDevice::~InputDevice()
    {
        release();
    }

    void InputDevice::release()
    {
        if (!_state || !_state->indev)
            return;
        if (lv_is_initialized())
            lv_indev_delete(_state->indev);
        _state->indev = nullptr;
    }

    void InputDevice::setType(InputType type)
    {
        if (lv_indev_t *i = raw())
            lv_indev_set_type(i, static_cast<lv_indev_type_t>(type));
    }

    InputType InputDevice::type() const
    {
        lv_indev_t *i = raw();
        return i ? static_cast<InputType>(lv_indev_get_type(i)) : InputType::None;
    }

    void InputDevice::setReader(InputReader &reader)
    {
        if (_state)
            _state->reader = &reader;
    }

    void InputDevice::setDisplay(const Display &display)
    {
        lv_indev_t *i = raw();
        if (i && display.raw())
            lv_indev_set_display(i, display.raw());
    }

    void InputDevice::setButtonPoints(const lv_point_t *points)
    {
        if (lv_indev_t *i = raw())
            lv_indev_set_button_points(i, points);
    }

    void InputDevice::readNow()
    {
        if (lv_indev_t *i = raw())
            lv_indev_read(i);
    }

    uint32_t InputDevice::readCount() const
    {
        return _state ? _state->reads : 0;
    }

    lv_indev_t *InputDevice::raw() const
    {
        return _state ? _state->indev : nullptr;
    }

    void InputDevice::readTrampoline(lv_indev_t *indev, lv_indev_data_t *data)
    {
        detail::InputState *state = static_cast<detail::InputState *>(lv_indev_get_user_data(indev));
        if (!state || !state->reader)
        {
            data->state = LV_INDEV_STATE_RELEASED;
            return;
        }

        InputSample sample;
        state->reader->read(sample);
        ++state->reads;

        data->point.x = sample.x;
        data->point.y = sample.y;
        data->state = sample.pressed ? LV_INDEV_STATE_PRESSED : LV_INDEV_STATE_RELEASED;
        data->key = sample.key;
        data->enc_diff = sample.encDiff;
        data->btn_id = sample.buttonId;
        data->continue_reading = sample.continueReading;
    }
}
