#pragma once

#include "bus-framing.hpp"
#include <driver/i2c.h>
#include <driver/gpio.h>
#include <cstdint>

namespace adxl345
{

    struct I2CConfig
    {
        i2c_port_t port = I2C_NUM_0;
        gpio_num_t sdaPin = GPIO_NUM_NC;
        gpio_num_t sclPin = GPIO_NUM_NC;
        uint32_t clockSpeed = 400000; // 400kHz is the ADXL345 maximum
        bool pullupEnable = true;
        uint32_t timeoutMs = 1000;

        // Install the ESP-IDF driver on the port; false attaches to a port
        // another device already set up
        bool installDriver = true;

        I2CAddress address = I2CAddress::PRIMARY;
    };

} // namespace adxl345
