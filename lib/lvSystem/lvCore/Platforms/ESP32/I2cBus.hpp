#pragma once

#include <stdint.h>
#include <stddef.h>

#include <lvCore/Platforms/Bus.hpp>

#if !defined(ESP32) && !defined(ESP_PLATFORM)
#error "lvcore::Esp32I2cBus requires ESP32"
#endif

#include <driver/i2c.h>

namespace lvcore
{
    struct I2cBusConfig
    {
        int8_t sda = -1;
        int8_t scl = -1;
        uint32_t hz = 400000;
        i2c_port_t port = I2C_NUM_0;
        bool pullups = true;
    };

    class Esp32I2cBus final : public I2cBus
    {
    public:
        Esp32I2cBus() = default;
        ~Esp32I2cBus() override;

        Esp32I2cBus(const Esp32I2cBus &) = delete;
        Esp32I2cBus &operator=(const Esp32I2cBus &) = delete;

        BusError begin(const I2cBusConfig &cfg);

        BusError write(uint8_t address, const uint8_t *data, size_t len, uint32_t timeoutMs) override;
        BusError writeRead(uint8_t address,
                           const uint8_t *tx,
                           size_t txLen,
                           uint8_t *rx,
                           size_t rxLen,
                           uint32_t timeoutMs) override;

    private:
        I2cBusConfig _cfg;
        bool _installed = false;
    };
}
