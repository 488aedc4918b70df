#pragma once

#include <driver/spi_master.h>
#include <driver/gpio.h>
#include <cstdint>

namespace adxl345
{

    struct SPIConfig
    {
        spi_host_device_t host = SPI2_HOST;
        gpio_num_t mosiPin = GPIO_NUM_NC; // SDIO in 3-wire mode
        gpio_num_t misoPin = GPIO_NUM_NC; // Unused in 3-wire mode
        gpio_num_t sclkPin = GPIO_NUM_NC;
        gpio_num_t csPin = GPIO_NUM_NC;
        uint32_t clockSpeedHz = 5000000; // 5MHz is the ADXL345 maximum

        // The device only supports CPOL=1, CPHA=1, MSB first
        uint8_t mode = 3;
        bool lsbFirst = false;

        // Half-duplex on a shared SDIO line; DATA_FORMAT SPI bit must be set on the device too
        bool threeWire = false;

        // Initialize the SPI host; false attaches to a host that is already set up
        bool initBus = true;
    };

} // namespace adxl345
