#include <catch2/catch_test_macros.hpp>

#include <stddef.h>
#include <initializer_list>
#include <vector>

#include <lvCore/Displays/ILI9341/Driver.hpp>
#include <lvCore/Displays/ST7789/Driver.hpp>

#include "Fakes.hpp"

using namespace lvcore;
using lvtest::FakePlatform;
using lvtest::FakeSpiBus;

namespace
{
    std::vector<uint8_t> bytes(std::initializer_list<uint8_t> list)
    {
        return std::vector<uint8_t>(list);
    }

    std::vector<uint8_t> firstN(const std::vector<uint8_t> &v, size_t n)
    {
        const size_t count = n < v.size() ? n : v.size();
        return std::vector<uint8_t>(v.begin(), v.begin() + static_cast<long>(count));
    }
}

TEST_CASE("MADCTL byte per orientation", "[panel]")
{
    SECTION("With BGR order")
    {
        REQUIRE(madctlFor(Orientation::Portrait, true) == 0x48);
        REQUIRE(madctlFor(Orientation::Landscape, true) == 0x28);
        REQUIRE(madctlFor(Orientation::PortraitInverted, true) == 0x88);
        REQUIRE(madctlFor(Orientation::LandscapeInverted, true) == 0xE8);
    }

    SECTION("With RGB order")
    {
        REQUIRE(madctlFor(Orientation::Portrait, false) == 0x40);
        REQUIRE(madctlFor(Orientation::Landscape, false) == 0x20);
        REQUIRE(madctlFor(Orientation::PortraitInverted, false) == 0x80);
        REQUIRE(madctlFor(Orientation::LandscapeInverted, false) == 0xE0);
    }

    SECTION("Both drivers write the same byte")
    {
        FakePlatform platform;
        FakeSpiBus stBus;
        FakeSpiBus iliBus;
        ST7789 st(stBus, platform);
        ILI9341 ili(iliBus, platform);

        REQUIRE(st.setOrientation(Orientation::LandscapeInverted) == BusOk);
        REQUIRE(ili.setOrientation(Orientation::LandscapeInverted) == BusOk);
        REQUIRE(stBus.dataAfter(0x36) == bytes({0xE8}));
        REQUIRE(iliBus.dataAfter(0x36) == bytes({0xE8}));
    }
}

TEST_CASE("RGB565 helper", "[panel]")
{
    REQUIRE(rgb565(255, 0, 0) == 0xF800);
    REQUIRE(rgb565(0, 255, 0) == 0x07E0);
    REQUIRE(rgb565(0, 0, 255) == 0x001F);
    REQUIRE(color565::White == 0xFFFF);
}

TEST_CASE("ST7789 initialization sequence", "[panel][st7789]")
{
    FakePlatform platform;
    FakeSpiBus bus;
    St7789Config cfg = St7789Config::square240();
    cfg.rst = 4;
    cfg.backlight = 5;
    ST7789 panel(bus, platform, cfg);

    SECTION("Commands go out in order")
    {
        REQUIRE(panel.begin() == BusOk);
        REQUIRE(firstN(bus.commands(), 10) == bytes({0x01, 0x11, 0x3A, 0x36, 0x21, 0x13, 0x29, 0x2A, 0x2B, 0x2C}));
        REQUIRE(bus.dataAfter(0x3A) == bytes({0x55}));
        REQUIRE(bus.dataAfter(0x36) == bytes({0x48}));
        REQUIRE(bus.dataAfter(0x2A) == bytes({0x00, 0x00, 0x00, 0xEF}));
        REQUIRE(bus.dataAfter(0x2B) == bytes({0x00, 0x00, 0x00, 0xEF}));
    }

    SECTION("Reset pulse and delays")
    {
        REQUIRE(panel.begin() == BusOk);
        REQUIRE(platform.delays.size() >= 9);
        std::vector<uint32_t> head(platform.delays.begin(), platform.delays.begin() + 9);
        REQUIRE(head == std::vector<uint32_t>({10, 10, 120, 150, 50, 10, 10, 10, 50}));

        std::vector<std::pair<uint8_t, bool>> expected = {{5, false}, {4, true}, {4, false}, {4, true}, {5, true}};
        REQUIRE(platform.writes == expected);
    }

    SECTION("Screen is cleared to black")
    {
        REQUIRE(panel.begin() == BusOk);
        std::vector<uint8_t> pixels = bus.dataAfter(0x2C);
        REQUIRE(pixels.size() == 240u * 240u * 2u);
        for (uint8_t b : pixels)
            REQUIRE(b == 0);
    }

    SECTION("A failing command aborts initialization")
    {
        bus.failOnCommand = 0x11;
        REQUIRE(panel.begin() == BusErrTimeout);
        REQUIRE(bus.commands() == bytes({0x01}));
    }

    SECTION("Zero size is rejected before touching the bus")
    {
        St7789Config empty = St7789Config::square240();
        empty.width = 0;
        ST7789 bad(bus, platform, empty);
        REQUIRE(bad.begin() == BusErrInvalidArg);
        REQUIRE(bus.ops.empty());
    }

    SECTION("Inversion off")
    {
        REQUIRE(panel.setInversion(false) == BusOk);
        REQUIRE(bus.commands() == bytes({0x20}));
        REQUIRE_FALSE(panel.config().invertColors);
    }
}

TEST_CASE("ILI9341 initialization sequence", "[panel][ili9341]")
{
    FakePlatform platform;
    FakeSpiBus bus;
    Ili9341Config cfg;
    cfg.rst = 4;

    SECTION("Default configuration")
    {
        ILI9341 panel(bus, platform, cfg);
        REQUIRE(panel.begin() == BusOk);
        REQUIRE(bus.commands() == bytes({0x01, 0x11, 0x3A, 0x36, 0x29}));
        REQUIRE(bus.dataAfter(0x36) == bytes({0x48}));
        REQUIRE(platform.delays == std::vector<uint32_t>({10, 120, 120, 120, 50}));
        REQUIRE(panel.width() == 240);
        REQUIRE(panel.height() == 320);
    }

    SECTION("Inverted colors and landscape")
    {
        cfg.invertColors = true;
        cfg.orientation = Orientation::Landscape;
        ILI9341 panel(bus, platform, cfg);
        REQUIRE(panel.begin() == BusOk);
        REQUIRE(bus.commands() == bytes({0x01, 0x11, 0x3A, 0x36, 0x21, 0x29}));
        REQUIRE(bus.dataAfter(0x36) == bytes({0x28}));
        REQUIRE(panel.width() == 320);
        REQUIRE(panel.height() == 240);
    }

    SECTION("A failing command aborts initialization")
    {
        bus.failOnCommand = 0x3A;
        ILI9341 panel(bus, platform, cfg);
        REQUIRE(panel.begin() == BusErrTimeout);
        REQUIRE(bus.commands() == bytes({0x01, 0x11}));
    }
}

TEST_CASE("Address window", "[panel]")
{
    FakePlatform platform;
    FakeSpiBus bus;
    ST7789 panel(bus, platform, St7789Config::tDisplay());

    SECTION("Portrait adds column and row offsets")
    {
        REQUIRE(panel.setWindow(0, 0, 134, 239) == BusOk);
        REQUIRE(bus.commands() == bytes({0x2A, 0x2B, 0x2C}));
        REQUIRE(bus.dataAfter(0x2A) == bytes({0x00, 0x34, 0x00, 0xBA}));
        REQUIRE(bus.dataAfter(0x2B) == bytes({0x00, 0x28, 0x01, 0x17}));
    }

    SECTION("Landscape swaps the offsets")
    {
        REQUIRE(panel.setOrientation(Orientation::Landscape) == BusOk);
        bus.ops.clear();
        REQUIRE(panel.width() == 240);
        REQUIRE(panel.height() == 135);
        REQUIRE(panel.setWindow(0, 0, 9, 9) == BusOk);
        REQUIRE(bus.dataAfter(0x2A) == bytes({0x00, 40, 0x00, 49}));
        REQUIRE(bus.dataAfter(0x2B) == bytes({0x00, 52, 0x00, 61}));
    }

    SECTION("Invalid rectangles are rejected")
    {
        uint8_t px[8] = {};
        REQUIRE(panel.writeRect(5, 0, 4, 0, px, sizeof(px)) == BusErrInvalidArg);
        REQUIRE(panel.writeRect(0, 0, 1, 1, nullptr, 8) == BusErrInvalidArg);
        REQUIRE(panel.writeRect(-1, 0, 1, 1, px, sizeof(px)) == BusErrInvalidArg);
        REQUIRE(bus.ops.empty());
    }
}

TEST_CASE("Pixel streaming is chunked", "[panel]")
{
    FakePlatform platform;
    FakeSpiBus bus;
    ST7789 panel(bus, platform);

    std::vector<uint8_t> pixels(5000);
    for (size_t i = 0; i < pixels.size(); ++i)
        pixels[i] = static_cast<uint8_t>(i * 7);

    SECTION("Bus limit below the driver limit")
    {
        bus.maxBytes = 1000;
        REQUIRE(panel.chunkBytes() == 1000);
        REQUIRE(panel.writePixels(pixels.data(), pixels.size()) == BusOk);
        REQUIRE(bus.largestWrite() <= 1000);
        REQUIRE(bus.ops.size() == 5);
        REQUIRE(bus.allData() == pixels);
    }

    SECTION("Driver limit caps large buses")
    {
        bus.maxBytes = 100000;
        REQUIRE(panel.chunkBytes() == PanelDriver::MaxChunkBytes);
        REQUIRE(panel.writePixels(pixels.data(), pixels.size()) == BusOk);
        REQUIRE(bus.largestWrite() == PanelDriver::MaxChunkBytes);
        REQUIRE(bus.allData() == pixels);
    }

    SECTION("Unbounded bus falls back to the driver limit")
    {
        bus.maxBytes = 0;
        REQUIRE(panel.chunkBytes() == PanelDriver::MaxChunkBytes);
    }

    SECTION("Rect writes window then pixels")
    {
        REQUIRE(panel.writeRect(0, 0, 49, 49, pixels.data(), pixels.size()) == BusOk);
        REQUIRE(bus.commands() == bytes({0x2A, 0x2B, 0x2C}));
        REQUIRE(bus.dataAfter(0x2C) == pixels);
    }

    SECTION("A failing write stops the stream")
    {
        bus.failData = true;
        REQUIRE(panel.writePixels(pixels.data(), pixels.size()) == BusErrTimeout);
        REQUIRE(bus.ops.empty());
    }

    SECTION("Null data")
    {
        REQUIRE(forEachChunk(nullptr, 10, 4, [](const uint8_t *, size_t)
                             { return BusOk; }) == BusErrInvalidArg);
        REQUIRE(forEachChunk(nullptr, 0, 4, [](const uint8_t *, size_t)
                             { return BusOk; }) == BusOk);
    }
}

TEST_CASE("Panel fill and power", "[panel]")
{
    FakePlatform platform;
    FakeSpiBus bus;
    ST7789 panel(bus, platform);

    SECTION("fillRect sends big-endian color")
    {
        REQUIRE(panel.fillRect(0, 0, 2, 2, color565::Red) == BusOk);
        REQUIRE(bus.dataAfter(0x2C) == bytes({0xF8, 0x00, 0xF8, 0x00, 0xF8, 0x00, 0xF8, 0x00}));
    }

    SECTION("Empty fill is a no-op")
    {
        REQUIRE(panel.fillRect(0, 0, 0, 10, color565::Red) == BusOk);
        REQUIRE(bus.ops.empty());
    }

    SECTION("Sleep and wake")
    {
        REQUIRE(panel.sleep() == BusOk);
        REQUIRE(panel.wake() == BusOk);
        REQUIRE(panel.displayOff() == BusOk);
        REQUIRE(panel.displayOn() == BusOk);
        REQUIRE(bus.commands() == bytes({0x10, 0x11, 0x28, 0x29}));
        REQUIRE(platform.delays == std::vector<uint32_t>({5, 120}));
    }

    SECTION("Landscape preset reports rotated size")
    {
        ST7789 box(bus, platform, St7789Config::esp32S3Box());
        REQUIRE(box.width() == 320);
        REQUIRE(box.height() == 240);
    }
}
