#pragma once

#include <stdint.h>
#include <stddef.h>

#include <lvCore/Platforms/Bus.hpp>

#if !defined(ESP32) && !defined(ESP_PLATFORM)
#error "lvcore::Esp32SpiPanelBus requires ESP32"
#endif

#include <driver/spi_master.h>

namespace lvcore
{
    struct SpiPanelBusConfig
    {
        int8_t mosi = -1;
        int8_t sclk = -1;
        int8_t cs = -1;
        int8_t dc = -1;
        uint32_t hz = 40000000;
        spi_host_device_t host = SPI2_HOST;
        size_t maxTransferBytes = 4096;
    };

    class Esp32SpiPanelBus final : public SpiPanelBus
    {
    public:
        Esp32SpiPanelBus() = default;
        ~Esp32SpiPanelBus() override;

        Esp32SpiPanelBus(const Esp32SpiPanelBus &) = delete;
        Esp32SpiPanelBus &operator=(const Esp32SpiPanelBus &) = delete;

        BusError begin(const SpiPanelBusConfig &cfg);

        BusError writeCommand(uint8_t cmd) override;
        BusError writeData(const uint8_t *data, size_t len) override;
        size_t maxTransferBytes() const override { return _cfg.maxTransferBytes; }

        // Blocks until queued DMA transfers finish.
        BusError flushQueued();

    private:
        BusError writeDataQueued(const uint8_t *data, size_t len);
        BusError waitQueued();

        SpiPanelBusConfig _cfg;
        spi_device_handle_t _dev = nullptr;
        bool _busOwned = false;

        uint8_t *_dmaBuf[2] = {nullptr, nullptr};
        spi_transaction_t _dmaTrans[2]{};
        int _dmaNext = 0;
        int _dmaInflight = 0;
    };
}
