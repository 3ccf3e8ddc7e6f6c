#pragma once

#include <stdint.h>
#include <memory>

#include <lvgl.h>

#include <lvGUI/core/api/Error.hpp>

namespace lvgui
{
    class Runtime;
    class Display;

    enum class InputType : uint8_t
    {
        None = LV_INDEV_TYPE_NONE,
        Pointer = LV_INDEV_TYPE_POINTER,
        Keypad = LV_INDEV_TYPE_KEYPAD,
        Button = LV_INDEV_TYPE_BUTTON,
        Encoder = LV_INDEV_TYPE_ENCODER
    };

    // Latest state of the device at poll time.
    struct InputSample
    {
        int32_t x = 0;
        int32_t y = 0;
        bool pressed = false;
        uint32_t key = 0;
        int16_t encDiff = 0;
        uint32_t buttonId = 0;
        // Ask LVGL to poll again before the next period (buffered devices).
        bool continueReading = false;
    };

    class InputReader
    {
    public:
        virtual ~InputReader() = default;
        // Called from the LVGL timer handler. Must fill the sample synchronously.
        virtual void read(InputSample &sample) = 0;
    };

    namespace detail
    {
        struct InputState;
    }

    // Owns one lv_indev_t.
    class InputDevice
    {
    public:
        static Result<InputDevice> create(Runtime &runtime);
        static Result<InputDevice> createPointer(Runtime &runtime, InputReader &reader);

        InputDevice(InputDevice &&other) noexcept;
        InputDevice &operator=(InputDevice &&other) noexcept;
        ~InputDevice();

        InputDevice(const InputDevice &) = delete;
        InputDevice &operator=(const InputDevice &) = delete;

        void setType(InputType type);
        InputType type() const;
        // reader must outlive the device.
        void setReader(InputReader &reader);
        void setDisplay(const Display &display);
        // Screen points a Button device presses, indexed by InputSample::buttonId.
        void setButtonPoints(const lv_point_t *points);

        // Polls the reader now instead of waiting for the read timer.
        void readNow();
        uint32_t readCount() const;

        lv_indev_t *raw() const;

    private:
        explicit InputDevice(std::unique_ptr<detail::InputState> state);

        void release();

        static void readTrampoline(lv_indev_t *indev, lv_indev_data_t *data);

        std::unique_ptr<detail::InputState> _state;
    };
}
