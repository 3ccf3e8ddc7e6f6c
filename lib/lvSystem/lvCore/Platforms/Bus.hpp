#pragma once

#include <stdint.h>
#include <stddef.h>

namespace lvcore
{
    // Transport status. Values line up with esp_err_t so ESP-IDF codes pass through unchanged.
    using BusError = int32_t;

    constexpr BusError BusOk = 0;
    constexpr BusError BusErrFail = -1;
    constexpr BusError BusErrInvalidArg = 0x102;
    constexpr BusError BusErrInvalidState = 0x103;
    constexpr BusError BusErrTimeout = 0x107;

    // SPI panel link with a separate data/command line.
    class SpiPanelBus
    {
    public:
        virtual ~SpiPanelBus() = default;

        // D/C low for the single command byte.
        virtual BusError writeCommand(uint8_t cmd) = 0;
        // D/C high for every byte.
        virtual BusError writeData(const uint8_t *data, size_t len) = 0;

        virtual size_t maxTransferBytes() const = 0;
    };

    class I2cBus
    {
    public:
        virtual ~I2cBus() = default;

        virtual BusError write(uint8_t address, const uint8_t *data, size_t len, uint32_t timeoutMs) = 0;
        virtual BusError writeRead(uint8_t address,
                                   const uint8_t *tx,
                                   size_t txLen,
                                   uint8_t *rx,
                                   size_t rxLen,
                                   uint32_t timeoutMs) = 0;
    };
}
