#pragma once

#include <stdint.h>
#include <stddef.h>
#include <optional>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <lvGUI/core/api/lvGUI.hpp>

namespace lvtest
{
    // Acknowledges every request on the spot and keeps totals.
    class RecordingTarget final : public lvgui::FlushTarget
    {
    public:
        uint32_t flushes = 0;
        uint32_t lastFlags = 0;
        size_t bytes = 0;
        bool ackTwice = false;
        lv_area_t lastArea = {0, 0, -1, -1};
        const uint8_t *lastPixels = nullptr;
        size_t lastStride = 0;
        bool lastRetained = false;

        void flush(lvgui::FlushRequest &request) override
        {
            ++flushes;
            bytes += request.byteCount();
            lastArea = request.area();
            lastPixels = request.pixels();
            lastStride = request.stride();
            lastRetained = request.isRetained();
            if (request.isLast())
                ++lastFlags;

            request.ready();
            if (ackTwice)
                request.ready();
        }
    };

    // Initialized runtime with a small partial-mode display as the default.
    struct GuiFixture
    {
        static constexpr int32_t Width = 64;
        static constexpr int32_t Height = 32;
        static constexpr int32_t BufLines = 8;

        lvgui::Runtime runtime;
        RecordingTarget target;
        std::vector<uint8_t> buf1;
        std::vector<uint8_t> buf2;
        std::optional<lvgui::Display> display;

        GuiFixture()
            : buf1(lvgui::bufferBytes(Width, BufLines)),
              buf2(lvgui::bufferBytes(Width, BufLines))
        {
            REQUIRE(runtime.init() == lvgui::Error::Ok);

            lvgui::Result<lvgui::Display> d = lvgui::Display::create(runtime, Width, Height);
            REQUIRE(d.ok());
            display.emplace(d.take());
            REQUIRE(display->setBuffers(buf1.data(),
                                        buf2.data(),
                                        static_cast<uint32_t>(buf1.size()),
                                        lvgui::RenderMode::Partial) == lvgui::Error::Ok);
            display->setFlushTarget(target);
        }

        lvgui::Obj screen() { return runtime.activeScreen(); }
    };
}
