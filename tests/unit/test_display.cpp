#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <vector>

#include <lvCore/Displays/ST7789/Driver.hpp>
#include <lvGUI/core/api/lvGUI.hpp>

#include "Fakes.hpp"
#include "GuiFixture.hpp"

using namespace lvgui;
using lvtest::GuiFixture;

namespace
{
    void paintScreen(GuiFixture &gui, Color color)
    {
        Obj screen = gui.screen();
        screen.setStyleBgColor(color);
        screen.setStyleBgOpa(LV_OPA_COVER);
        screen.invalidate();
    }
}

TEST_CASE("Display creation", "[display]")
{
    Runtime runtime;
    REQUIRE(runtime.init() == Error::Ok);

    SECTION("Resolution must be positive")
    {
        REQUIRE(Display::create(runtime, 0, 10).error() == Error::InvalidParameter);
        REQUIRE(Display::create(runtime, 10, -1).error() == Error::InvalidParameter);
    }

    SECTION("Buffers are validated")
    {
        Result<Display> display = Display::create(runtime, 32, 16);
        REQUIRE(display.ok());
        REQUIRE(display->horizontalResolution() == 32);
        REQUIRE(display->verticalResolution() == 16);

        static DrawBuffer<bufferBytes(32, 4)> buf;
        REQUIRE(display->setBuffers(nullptr, nullptr, buf.size(), RenderMode::Partial) == Error::InvalidParameter);
        REQUIRE(display->setBuffers(buf.data, nullptr, 0, RenderMode::Partial) == Error::InvalidParameter);
        REQUIRE(display->setBuffers(buf.data, nullptr, buf.size(), RenderMode::Partial) == Error::Ok);
    }

    SECTION("A moved-from display is inert")
    {
        Result<Display> display = Display::create(runtime, 32, 16);
        REQUIRE(display.ok());
        Display owner = display.take();
        REQUIRE(owner.raw() != nullptr);

        Display other = std::move(owner);
        REQUIRE(other.raw() != nullptr);
        REQUIRE(owner.raw() == nullptr);
        REQUIRE(owner.horizontalResolution() == 0);
        REQUIRE(owner.setBuffers(nullptr, nullptr, 0, RenderMode::Full) == Error::DisplayError);
    }

    SECTION("Move-assigning over a live display releases the old one")
    {
        Result<Display> first = Display::create(runtime, 32, 16);
        Result<Display> second = Display::create(runtime, 16, 8);
        REQUIRE(first.ok());
        REQUIRE(second.ok());
        static DrawBuffer<bufferBytes(16, 8)> buf;
        REQUIRE(second->setBuffers(buf.data, nullptr, buf.size(), RenderMode::Full) == Error::Ok);

        Display owner = first.take();
        lv_display_t *fresh = second->raw();
        owner = second.take();
        REQUIRE(owner.raw() == fresh);
        REQUIRE(lv_display_get_next(nullptr) == fresh);
        REQUIRE(lv_display_get_next(fresh) == nullptr);

        runtime.pump(0, 10);
        runtime.pump(200, 10);
        REQUIRE(owner.flushCount() > 0);
        REQUIRE(owner.readyCount() == owner.flushCount());
    }
}

TEST_CASE("Buffer sizing", "[display]")
{
    REQUIRE(bufferBytes(240, 32) == 240 * 32 * 2);
    REQUIRE(bufferBytes(0, 32) == 0);
    REQUIRE(bufferBytes(240, -1) == 0);
    REQUIRE(DrawBuffer<1024>::size() == 1024);
}

TEST_CASE("Display flushing", "[display]")
{
    GuiFixture gui;
    const size_t screenBytes = static_cast<size_t>(GuiFixture::Width) * GuiFixture::Height * 2;

    SECTION("A full refresh flushes every pixel exactly once")
    {
        gui.display->refreshNow();
        REQUIRE(gui.target.flushes > 0);
        REQUIRE(gui.target.bytes == screenBytes);
        REQUIRE(gui.target.lastFlags == 1);
        REQUIRE(gui.display->flushCount() == gui.target.flushes);
        REQUIRE(gui.display->readyCount() == gui.display->flushCount());
        REQUIRE(gui.display->flushState() == FlushState::Idle);
        REQUIRE(gui.target.lastArea.y2 == GuiFixture::Height - 1);
    }

    SECTION("Nothing is flushed when nothing changed")
    {
        gui.display->refreshNow();
        const uint32_t before = gui.target.flushes;
        gui.display->refreshNow();
        REQUIRE(gui.target.flushes == before);
    }

    SECTION("A second acknowledgement is ignored")
    {
        gui.target.ackTwice = true;
        gui.display->refreshNow();
        REQUIRE(gui.display->readyCount() == gui.display->flushCount());
    }

    SECTION("Rotation swaps the logical resolution")
    {
        gui.display->setRotation(Rotation::R90);
        REQUIRE(gui.display->rotation() == Rotation::R90);
        REQUIRE(gui.display->horizontalResolution() == GuiFixture::Height);
        REQUIRE(gui.display->verticalResolution() == GuiFixture::Width);
    }
}

TEST_CASE("Display without a flush target", "[display]")
{
    Runtime runtime;
    REQUIRE(runtime.init() == Error::Ok);

    Result<Display> display = Display::create(runtime, 16, 8);
    REQUIRE(display.ok());
    static DrawBuffer<bufferBytes(16, 8)> buf;
    REQUIRE(display->setBuffers(buf.data, nullptr, buf.size(), RenderMode::Full) == Error::Ok);

    // Frames are dropped but still acknowledged, so rendering never stalls.
    display->refreshNow();
    REQUIRE(display->flushCount() > 0);
    REQUIRE(display->readyCount() == display->flushCount());
}

TEST_CASE("Direct mode flushes areas inside the frame", "[display]")
{
    constexpr int32_t W = 32;
    constexpr int32_t H = 16;
    Runtime runtime;
    REQUIRE(runtime.init() == Error::Ok);

    Result<Display> display = Display::create(runtime, W, H);
    REQUIRE(display.ok());
    static DrawBuffer<bufferBytes(W, H)> frame;
    REQUIRE(display->setBuffers(frame.data, nullptr, frame.size(), RenderMode::Direct) == Error::Ok);
    lvtest::RecordingTarget target;
    display->setFlushTarget(target);

    Obj screen = runtime.activeScreen();
    screen.setStyleBgColor(Color::hex(0xFF0000));
    screen.setStyleBgOpa(LV_OPA_COVER);
    Result<Obj> box = Obj::create(screen);
    REQUIRE(box.ok());
    box->setPos(10, 4);
    box->setSize(8, 4);
    box->setStyleRadius(0);
    box->setStyleBorderWidth(0);
    box->setStyleBgOpa(LV_OPA_COVER);
    box->setStyleBgColor(Color::hex(0x0000FF));
    display->refreshNow();
    REQUIRE(target.lastRetained);

    lvtest::FakePlatform platform;
    lvtest::FakeSpiBus bus;
    lvcore::ST7789 panel(bus, platform);
    PanelFlush flush(panel);

    SECTION("The request points into the frame at the area origin")
    {
        target.flushes = 0;
        box->setStyleBgColor(Color::hex(0xFF0000));
        display->refreshNow();

        REQUIRE(target.flushes == 1);
        REQUIRE(target.lastRetained);
        REQUIRE(target.lastArea.x1 > 0);
        REQUIRE(target.lastArea.y1 > 0);
        REQUIRE(target.lastArea.x2 < W - 1);
        REQUIRE(target.lastStride == static_cast<size_t>(W) * 2);
        REQUIRE(target.lastPixels == frame.data + static_cast<size_t>(target.lastArea.y1) * W * 2 +
                                         static_cast<size_t>(target.lastArea.x1) * 2);
    }

    SECTION("The panel gets the area rows and the frame keeps its byte order")
    {
        display->setFlushTarget(flush);
        box->setStyleBgColor(Color::hex(0xFF0000));
        display->refreshNow();

        REQUIRE(flush.errorCount() == 0);
        REQUIRE(display->readyCount() == display->flushCount());

        // Every row of the area went out as its own window, all red and big-endian.
        const std::vector<uint8_t> caset = bus.dataAfter(0x2A);
        REQUIRE(caset.size() == 4);
        REQUIRE(caset[1] > 0);
        REQUIRE(caset[3] < W - 1);
        const size_t rowBytes = static_cast<size_t>(caset[3] - caset[1] + 1) * 2;
        REQUIRE(bus.dataAfter(0x2C).size() == rowBytes);

        const std::vector<uint8_t> cmds = bus.commands();
        const auto ramwr = std::count(cmds.begin(), cmds.end(), static_cast<uint8_t>(0x2C));
        REQUIRE(ramwr > 1);
        REQUIRE(ramwr == std::count(cmds.begin(), cmds.end(), static_cast<uint8_t>(0x2A)));
        const std::vector<uint8_t> firstRow = bus.dataAfter(0x2C);
        for (size_t i = 0; i + 1 < firstRow.size(); i += 2)
        {
            REQUIRE(firstRow[i] == 0xF8);
            REQUIRE(firstRow[i + 1] == 0x00);
        }

        // The retained frame is still little-endian.
        const size_t boxPixel = (static_cast<size_t>(5) * W + 12) * 2;
        REQUIRE(frame.data[boxPixel] == 0x00);
        REQUIRE(frame.data[boxPixel + 1] == 0xF8);
    }
}

TEST_CASE("Panel flush", "[display][panel]")
{
    GuiFixture gui;
    lvtest::FakePlatform platform;
    lvtest::FakeSpiBus bus;
    lvcore::ST7789 panel(bus, platform);
    PanelFlush flush(panel);
    gui.display->setFlushTarget(flush);

    SECTION("Pixels reach the panel big-endian")
    {
        paintScreen(gui, Color::hex(0xFF0000));
        gui.display->refreshNow();

        REQUIRE(flush.errorCount() == 0);
        REQUIRE(flush.lastError() == lvcore::BusOk);
        REQUIRE(gui.display->readyCount() == gui.display->flushCount());

        const std::vector<uint8_t> first = bus.dataAfter(0x2C);
        REQUIRE(first.size() == static_cast<size_t>(GuiFixture::Width) * GuiFixture::BufLines * 2);
        for (size_t i = 0; i + 1 < first.size(); i += 2)
        {
            REQUIRE(first[i] == 0xF8);
            REQUIRE(first[i + 1] == 0x00);
        }

        REQUIRE(bus.dataAfter(0x2A) == std::vector<uint8_t>({0x00, 0x00, 0x00, GuiFixture::Width - 1}));
    }

    SECTION("Byte order can be left alone")
    {
        PanelFlush raw(panel, false);
        gui.display->setFlushTarget(raw);
        paintScreen(gui, Color::hex(0xFF0000));
        gui.display->refreshNow();

        const std::vector<uint8_t> first = bus.dataAfter(0x2C);
        REQUIRE(first.size() >= 2);
        REQUIRE(first[0] == 0x00);
        REQUIRE(first[1] == 0xF8);
    }

    SECTION("Bus failures are counted and the frame still completes")
    {
        bus.failData = true;
        gui.display->refreshNow();

        REQUIRE(flush.errorCount() == gui.display->flushCount());
        REQUIRE(flush.errorCount() > 0);
        REQUIRE(flush.lastError() == lvcore::BusErrTimeout);
        REQUIRE(gui.display->readyCount() == gui.display->flushCount());
        REQUIRE(gui.display->flushState() == FlushState::Idle);
    }
}
