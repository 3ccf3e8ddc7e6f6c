#include <lvCore/Platforms/ESP32/SpiBus.hpp>
#include <lvCore/Platforms/GUIPlatform.hpp>

#include <string.h>

#include <driver/gpio.h>
#include <esp_heap_caps.h>

namespace lvcore
{
    namespace
    {
        // Small writes go out with polling transactions, larger ones through the DMA queue.
        constexpr size_t PollingMaxBytes = 32;

        inline void *packDc(int8_t pin, int level)
        {
            return (void *)(intptr_t)((((intptr_t)pin) << 1) | level);
        }

        static void IRAM_ATTR lvcore_spi_pre_cb(spi_transaction_t *t)
        {
            const intptr_t packed = (intptr_t)t->user;
            const int dc = (int)(packed & 1);
            const int pin = (int)((packed >> 1) & 0xFF);
            gpio_set_level((gpio_num_t)pin, dc);
        }
    }

    Esp32SpiPanelBus::~Esp32SpiPanelBus()
    {
        if (_dev)
        {
            flushQueued();
            spi_bus_remove_device(_dev);
        }
        if (_busOwned)
            spi_bus_free(_cfg.host);
        for (uint8_t *&buf : _dmaBuf)
        {
            heap_caps_free(buf);
            buf = nullptr;
        }
    }

    BusError Esp32SpiPanelBus::begin(const SpiPanelBusConfig &cfg)
    {
        if (_dev)
            return BusErrInvalidState;
        if (!isPinValid(cfg.dc) || cfg.maxTransferBytes == 0)
            return BusErrInvalidArg;

        _cfg = cfg;

        gpio_config_t io{};
        io.intr_type = GPIO_INTR_DISABLE;
        io.mode = GPIO_MODE_OUTPUT;
        io.pull_down_en = GPIO_PULLDOWN_DISABLE;
        io.pull_up_en = GPIO_PULLUP_DISABLE;
        io.pin_bit_mask = (1ULL << static_cast<uint8_t>(_cfg.dc));
        esp_err_t err = gpio_config(&io);
        if (err != ESP_OK)
            return err;

        spi_bus_config_t bus{};
        bus.mosi_io_num = _cfg.mosi;
        bus.miso_io_num = -1;
        bus.sclk_io_num = _cfg.sclk;
        bus.quadwp_io_num = -1;
        bus.quadhd_io_num = -1;
        bus.max_transfer_sz = static_cast<int>(_cfg.maxTransferBytes);

        err = spi_bus_initialize(_cfg.host, &bus, SPI_DMA_CH_AUTO);
        if (err != ESP_OK)
            return err;
        _busOwned = true;

        spi_device_interface_config_t dev{};
        dev.mode = 0;
        dev.clock_speed_hz = static_cast<int>(_cfg.hz);
        dev.spics_io_num = _cfg.cs;
        dev.queue_size = 2;
        dev.flags = SPI_DEVICE_HALFDUPLEX;
        dev.pre_cb = lvcore_spi_pre_cb;

        err = spi_bus_add_device(_cfg.host, &dev, &_dev);
        if (err != ESP_OK)
            return err;

        for (uint8_t *&buf : _dmaBuf)
        {
            buf = static_cast<uint8_t *>(heap_caps_aligned_alloc(4, _cfg.maxTransferBytes, MALLOC_CAP_DMA | MALLOC_CAP_8BIT));
            if (!buf)
                return ESP_ERR_NO_MEM;
        }

        _dmaNext = 0;
        _dmaInflight = 0;
        return BusOk;
    }

    BusError Esp32SpiPanelBus::writeCommand(uint8_t cmd)
    {
        if (!_dev)
            return BusErrInvalidState;

        BusError err = flushQueued();
        if (err != BusOk)
            return err;

        spi_transaction_t t{};
        t.flags = SPI_TRANS_USE_TXDATA;
        t.length = 8;
        t.tx_data[0] = cmd;
        t.user = packDc(_cfg.dc, 0);

        return spi_device_polling_transmit(_dev, &t);
    }

    BusError Esp32SpiPanelBus::writeData(const uint8_t *data, size_t len)
    {
        if (!_dev)
            return BusErrInvalidState;
        if (!len)
            return BusOk;
        if (!data || len > _cfg.maxTransferBytes)
            return BusErrInvalidArg;

        if (len > PollingMaxBytes)
            return writeDataQueued(data, len);

        BusError err = flushQueued();
        if (err != BusOk)
            return err;

        spi_transaction_t t{};
        t.length = static_cast<int>(len * 8U);
        t.tx_buffer = data;
        t.user = packDc(_cfg.dc, 1);

        return spi_device_polling_transmit(_dev, &t);
    }

    BusError Esp32SpiPanelBus::flushQueued()
    {
        while (_dmaInflight > 0)
        {
            const BusError err = waitQueued();
            if (err != BusOk)
                return err;
        }
        return BusOk;
    }

    BusError IRAM_ATTR Esp32SpiPanelBus::writeDataQueued(const uint8_t *data, size_t len)
    {
        while (_dmaInflight >= 2)
        {
            const BusError err = waitQueued();
            if (err != BusOk)
                return err;
        }

        const int slot = _dmaNext & 1;
        _dmaNext = (_dmaNext + 1) & 1;

        memcpy(_dmaBuf[slot], data, len);

        spi_transaction_t &t = _dmaTrans[slot];
        memset(&t, 0, sizeof(t));
        t.length = static_cast<int>(len * 8U);
        t.tx_buffer = _dmaBuf[slot];
        t.user = packDc(_cfg.dc, 1);

        const esp_err_t err = spi_device_queue_trans(_dev, &t, portMAX_DELAY);
        if (err != ESP_OK)
            return err;
        ++_dmaInflight;
        return BusOk;
    }

    BusError Esp32SpiPanelBus::waitQueued()
    {
        spi_transaction_t *r = nullptr;
        const esp_err_t err = spi_device_get_trans_result(_dev, &r, portMAX_DELAY);
        --_dmaInflight;
        return err;
    }
}
