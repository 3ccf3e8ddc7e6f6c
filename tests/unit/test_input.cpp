#include <catch2/catch_test_macros.hpp>

#include <vector>

#include <lvCore/Button.hpp>
#include <lvCore/Touch/CST816/Driver.hpp>
#include <lvGUI/core/api/lvGUI.hpp>

#include "Fakes.hpp"
#include "GuiFixture.hpp"

using namespace lvgui;

namespace
{
    // Replays a fixed list of samples, then keeps repeating the last one.
    class ScriptedReader final : public InputReader
    {
    public:
        std::vector<InputSample> samples;
        size_t next = 0;

        void read(InputSample &sample) override
        {
            if (samples.empty())
                return;
            sample = samples[next < samples.size() ? next : samples.size() - 1];
            ++next;
        }
    };

    InputSample touchAt(int32_t x, int32_t y, bool pressed)
    {
        InputSample s;
        s.x = x;
        s.y = y;
        s.pressed = pressed;
        return s;
    }
}

TEST_CASE("Input device setup", "[input]")
{
    lvtest::GuiFixture gui;
    ScriptedReader reader;

    SECTION("Plain devices start without a type")
    {
        Result<InputDevice> dev = InputDevice::create(gui.runtime);
        REQUIRE(dev.ok());
        REQUIRE(dev->raw() != nullptr);
        REQUIRE(dev->type() == InputType::None);

        dev->setType(InputType::Keypad);
        REQUIRE(dev->type() == InputType::Keypad);
    }

    SECTION("Pointer devices poll their reader")
    {
        Result<InputDevice> dev = InputDevice::createPointer(gui.runtime, reader);
        REQUIRE(dev.ok());
        REQUIRE(dev->type() == InputType::Pointer);
        dev->setDisplay(*gui.display);

        REQUIRE(dev->readCount() == 0);
        dev->readNow();
        dev->readNow();
        REQUIRE(dev->readCount() == 2);
    }

    SECTION("A moved-from device is inert")
    {
        Result<InputDevice> dev = InputDevice::createPointer(gui.runtime, reader);
        REQUIRE(dev.ok());
        InputDevice owner = dev.take();
        InputDevice other = std::move(owner);
        REQUIRE(owner.raw() == nullptr);
        REQUIRE(owner.type() == InputType::None);
        REQUIRE(owner.readCount() == 0);
        REQUIRE(other.raw() != nullptr);
    }

    SECTION("Move-assigning over a live device releases the old one")
    {
        ScriptedReader other;
        other.samples.push_back(touchAt(1, 1, false));
        reader.samples.push_back(touchAt(2, 2, false));

        Result<InputDevice> first = InputDevice::createPointer(gui.runtime, reader);
        Result<InputDevice> second = InputDevice::createPointer(gui.runtime, other);
        REQUIRE(first.ok());
        REQUIRE(second.ok());
        InputDevice owner = first.take();
        lv_indev_t *fresh = second->raw();

        owner = second.take();
        REQUIRE(owner.raw() == fresh);
        REQUIRE(lv_indev_get_next(nullptr) == fresh);
        REQUIRE(lv_indev_get_next(fresh) == nullptr);

        gui.runtime.pump(0, 10);
        gui.runtime.pump(200, 10);
        REQUIRE(reader.next == 0);
        REQUIRE(other.next > 0);
        REQUIRE(owner.readCount() == other.next);
    }
}

TEST_CASE("Pointer input drives widgets", "[input]")
{
    lvtest::GuiFixture gui;
    ScriptedReader reader;
    Result<InputDevice> dev = InputDevice::createPointer(gui.runtime, reader);
    REQUIRE(dev.ok());
    dev->setDisplay(*gui.display);

    Result<Button> btn = Button::create(gui.screen());
    REQUIRE(btn.ok());
    btn->setPos(0, 0);
    btn->setSize(30, 20);
    btn->updateLayout();

    int clicks = 0;
    int pressed = 0;
    bool targetMatched = false;
    Obj self = *btn;
    btn->addEventHandler(EventCode::Clicked, [&clicks](Event &) { ++clicks; });
    btn->addEventHandler(EventCode::Pressed, [&pressed, &targetMatched, self](Event &e)
                         {
        ++pressed;
        targetMatched = e.code() == EventCode::Pressed && e.currentTarget() == self; });

    SECTION("Press and release inside the button is a click")
    {
        reader.samples = {touchAt(10, 10, true), touchAt(10, 10, false)};
        dev->readNow();
        REQUIRE(pressed == 1);
        REQUIRE(targetMatched);
        REQUIRE(btn->hasState(State::Pressed));
        dev->readNow();
        REQUIRE(clicks == 1);
        REQUIRE_FALSE(btn->hasState(State::Pressed));
    }

    SECTION("Touches elsewhere do not reach the button")
    {
        reader.samples = {touchAt(50, 25, true), touchAt(50, 25, false)};
        dev->readNow();
        dev->readNow();
        REQUIRE(pressed == 0);
        REQUIRE(clicks == 0);
    }
}

TEST_CASE("Touch reader", "[input][cst816]")
{
    lvtest::FakePlatform platform;
    lvtest::FakeI2cBus bus;
    lvcore::Cst816Config cfg;
    cfg.transform.width = 240;
    cfg.transform.height = 320;
    lvcore::CST816 touch(bus, platform, cfg);
    TouchReader reader(touch);

    bus.registers[0x01] = {0x05, 0x01, 0x00, 0x1E, 0x00, 0x28};
    InputSample sample;
    reader.read(sample);
    REQUIRE(sample.x == 30);
    REQUIRE(sample.y == 40);
    REQUIRE(sample.pressed);
    REQUIRE(reader.lastGesture() == lvcore::Gesture::SingleClick);
    REQUIRE(reader.errorCount() == 0);

    SECTION("A failed read repeats the previous sample")
    {
        bus.nextError = lvcore::BusErrTimeout;
        InputSample again;
        reader.read(again);
        REQUIRE(again.x == 30);
        REQUIRE(again.y == 40);
        REQUIRE(again.pressed);
        REQUIRE(reader.errorCount() == 1);
        REQUIRE(reader.lastError() == lvcore::BusErrTimeout);
    }

    SECTION("A controller that stops answering releases the pointer")
    {
        InputSample again;
        for (uint8_t i = 1; i < TouchReader::MaxFailedReads; ++i)
        {
            bus.nextError = lvcore::BusErrTimeout;
            reader.read(again);
            REQUIRE(again.pressed);
        }

        bus.nextError = lvcore::BusErrTimeout;
        reader.read(again);
        REQUIRE_FALSE(again.pressed);
        REQUIRE(again.x == 30);
        REQUIRE(reader.errorCount() == TouchReader::MaxFailedReads);

        bus.nextError = lvcore::BusErrTimeout;
        reader.read(again);
        REQUIRE_FALSE(again.pressed);

        // A good report after the outage is taken as is.
        reader.read(again);
        REQUIRE(again.pressed);
        REQUIRE(again.y == 40);
    }

    SECTION("An error streak is reset by a good read")
    {
        InputSample again;
        for (uint8_t i = 1; i < TouchReader::MaxFailedReads; ++i)
        {
            bus.nextError = lvcore::BusErrTimeout;
            reader.read(again);
        }
        reader.read(again);
        bus.nextError = lvcore::BusErrTimeout;
        reader.read(again);
        REQUIRE(again.pressed);
    }

    SECTION("Lifting the finger releases")
    {
        bus.registers[0x01] = {0x00, 0x00, 0x00, 0x1E, 0x00, 0x28};
        InputSample lifted;
        reader.read(lifted);
        REQUIRE_FALSE(lifted.pressed);
        REQUIRE(reader.last().x == 30);
    }
}

TEST_CASE("Button reader", "[input][button]")
{
    lvtest::FakePlatform platform;
    lvcore::Button button(platform, 4);
    button.begin();
    ButtonReader reader(button, 2);

    InputSample sample;
    reader.read(sample);
    REQUIRE(sample.buttonId == 2);
    REQUIRE_FALSE(sample.pressed);

    platform.levels[4] = false;
    reader.read(sample);
    REQUIRE_FALSE(sample.pressed);

    platform.now = 40;
    reader.read(sample);
    REQUIRE(sample.pressed);
}

TEST_CASE("Button device presses its mapped point", "[input][button]")
{
    lvtest::GuiFixture gui;
    lvtest::FakePlatform platform;
    lvcore::Button button(platform, 4);
    button.begin();
    ButtonReader reader(button);

    Result<InputDevice> dev = InputDevice::create(gui.runtime);
    REQUIRE(dev.ok());
    dev->setType(InputType::Button);
    dev->setReader(reader);
    static const lv_point_t points[1] = {{15, 10}};
    dev->setButtonPoints(points);
    dev->setDisplay(*gui.display);

    Result<Button> btn = Button::create(gui.screen());
    REQUIRE(btn.ok());
    btn->setPos(0, 0);
    btn->setSize(30, 20);
    btn->updateLayout();

    int clicks = 0;
    btn->addEventHandler(EventCode::Clicked, [&clicks](Event &) { ++clicks; });

    platform.levels[4] = false;
    dev->readNow();
    platform.now = 40;
    dev->readNow();
    platform.levels[4] = true;
    dev->readNow();
    platform.now = 80;
    dev->readNow();

    REQUIRE(clicks == 1);
}
