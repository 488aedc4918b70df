#pragma once

#include <esp_err.h>
#include <cstddef>
#include <cstdint>
#include <span>

namespace adxl345
{

    /**
     * @brief Register-level transport used by the ADXL345 driver
     *
     * One implementation per physical bus (I2C_HAL, SPI_HAL). A multi-byte
     * access is a single bus transaction starting at regAddr; the device
     * auto-increments the register pointer.
     */
    class IRegisterBus
    {
    public:
        virtual ~IRegisterBus() = default;

        /**
         * @brief Read buffer.size() consecutive registers starting at regAddr
         * @return ESP_OK, or the bus driver's error unmodified
         */
        virtual esp_err_t read(uint8_t regAddr, std::span<std::byte> buffer) = 0;

        /**
         * @brief Write data to consecutive registers starting at regAddr
         * @return ESP_OK, or the bus driver's error unmodified
         */
        virtual esp_err_t write(uint8_t regAddr, std::span<const std::byte> data) = 0;

        /// Short transport name for log messages
        virtual const char *getName() const = 0;
    };

} // namespace adxl345
