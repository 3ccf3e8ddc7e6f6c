#include <lvCore/Platforms/ESP32/I2cBus.hpp>
#include <lvCore/Platforms/GUIPlatform.hpp>

#include <freertos/FreeRTOS.h>

namespace lvcore
{
    Esp32I2cBus::~Esp32I2cBus()
    {
        if (_installed)
            i2c_driver_delete(_cfg.port);
    }

    BusError Esp32I2cBus::begin(const I2cBusConfig &cfg)
    {
        if (_installed)
            return BusErrInvalidState;
        if (!isPinValid(cfg.sda) || !isPinValid(cfg.scl))
            return BusErrInvalidArg;

        _cfg = cfg;

        i2c_config_t conf{};
        conf.mode = I2C_MODE_MASTER;
        conf.sda_io_num = _cfg.sda;
        conf.scl_io_num = _cfg.scl;
        conf.sda_pullup_en = _cfg.pullups ? GPIO_PULLUP_ENABLE : GPIO_PULLUP_DISABLE;
        conf.scl_pullup_en = _cfg.pullups ? GPIO_PULLUP_ENABLE : GPIO_PULLUP_DISABLE;
        conf.master.clk_speed = _cfg.hz;

        esp_err_t err = i2c_param_config(_cfg.port, &conf);
        if (err != ESP_OK)
            return err;

        err = i2c_driver_install(_cfg.port, conf.mode, 0, 0, 0);
        if (err != ESP_OK)
            return err;

        _installed = true;
        return BusOk;
    }

    BusError Esp32I2cBus::write(uint8_t address, const uint8_t *data, size_t len, uint32_t timeoutMs)
    {
        if (!_installed)
            return BusErrInvalidState;
        return i2c_master_write_to_device(_cfg.port, address, data, len, pdMS_TO_TICKS(timeoutMs));
    }

    BusError Esp32I2cBus::writeRead(uint8_t address,
                                    const uint8_t *tx,
                                    size_t txLen,
                                    uint8_t *rx,
                                    size_t rxLen,
                                    uint32_t timeoutMs)
    {
        if (!_installed)
            return BusErrInvalidState;
        return i2c_master_write_read_device(_cfg.port, address, tx, txLen, rx, rxLen, pdMS_TO_TICKS(timeoutMs));
    }
}
