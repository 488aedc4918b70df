#pragma once

#include "I2CConfig.hpp"
#include "IRegisterBus.hpp"
#include <driver/i2c.h>
#include <esp_err.h>
#include <span>
#include <cstddef> // std::size_t, std::byte
#include <cstdint>

namespace adxl345
{

    /**
     * @brief I2C transport for the ADXL345
     *
     * Uses the ESP-IDF command-link API. Reads are issued as a single
     * write-register / repeated-start / read transaction so burst reads of
     * the data registers are never split.
     */
    class [[nodiscard]] I2C_HAL final : public IRegisterBus
    {
    public:
        I2C_HAL() = default;
        ~I2C_HAL() override;

        I2C_HAL(const I2C_HAL &) = delete;
        I2C_HAL &operator=(const I2C_HAL &) = delete;

        // Validate configuration and install the ESP-IDF I2C driver
        esp_err_t init(const I2CConfig &cfg);

        // Write data to the device starting at the given register
        esp_err_t write(uint8_t regAddr, std::span<const std::byte> data) override;

        // Read consecutive registers into buffer
        esp_err_t read(uint8_t regAddr, std::span<std::byte> buffer) override;

        const char *getName() const override { return "I2C"; }

        // Delete the I2C driver if this adapter installed it
        void deinit();

        bool isInitialized() const { return initialized_; }

        uint8_t getSlaveAddress() const { return slaveAddr_; }

        static esp_err_t validateConfig(const I2CConfig &cfg);

    private:
        i2c_port_t port_ = I2C_NUM_0;
        uint8_t slaveAddr_ = static_cast<uint8_t>(I2CAddress::PRIMARY);
        uint32_t timeoutMs_ = 1000;
        bool ownsDriver_ = false;
        bool initialized_ = false;
    };

} // namespace adxl345
