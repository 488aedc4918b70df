#pragma once

#include "SPIConfig.hpp"
#include "IRegisterBus.hpp"
#include <driver/spi_master.h>
#include <esp_err.h>
#include <span>
#include <cstddef>
#include <cstdint>

namespace adxl345
{

    /**
     * @brief SPI transport for the ADXL345
     *
     * The register address goes out in the transaction's address phase with
     * the read and multi-byte bits applied (see framing::spi). Payload bytes
     * follow in the same chip-select window.
     */
    class [[nodiscard]] SPI_HAL final : public IRegisterBus
    {
    public:
        SPI_HAL() = default;
        ~SPI_HAL() override;

        SPI_HAL(const SPI_HAL &) = delete;
        SPI_HAL &operator=(const SPI_HAL &) = delete;

        esp_err_t init(const SPIConfig &cfg);

        esp_err_t write(uint8_t regAddr, std::span<const std::byte> data) override;

        esp_err_t read(uint8_t regAddr, std::span<std::byte> buffer) override;

        const char *getName() const override { return "SPI"; }

        // Remove the device, and free the host if this adapter initialized it
        void deinit();

        bool isInitialized() const { return device_ != nullptr; }

        static esp_err_t validateConfig(const SPIConfig &cfg);

    private:
        esp_err_t transmit(spi_transaction_t &trans, uint8_t regAddr);

        spi_host_device_t host_ = SPI2_HOST;
        spi_device_handle_t device_ = nullptr;
        bool threeWire_ = false;
        bool ownsBus_ = false;
    };

} // namespace adxl345
