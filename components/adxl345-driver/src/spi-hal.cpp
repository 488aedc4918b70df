#include "spi-hal.hpp"
#include "ComponentError.hpp"
#include "ConfigValidator.hpp"
#include "bus-framing.hpp"
#include <esp_log.h>
#include <cinttypes>

namespace adxl345
{

    namespace
    {
        constexpr const char *TAG = "SPI_HAL";
        constexpr int ADDRESS_BITS = 8;
    }

    SPI_HAL::~SPI_HAL()
    {
        deinit();
    }

    esp_err_t SPI_HAL::validateConfig(const SPIConfig &cfg)
    {
        if (cfg.mode != framing::spi::REQUIRED_MODE)
        {
            ADXL345_LOGE(TAG, "SPI mode %u not supported, device requires mode 3", static_cast<unsigned>(cfg.mode));
            return ESP_ERR_INVALID_ARG;
        }

        if (cfg.lsbFirst)
        {
            ADXL345_LOGE(TAG, "LSB-first bit order not supported, device is MSB first");
            return ESP_ERR_INVALID_ARG;
        }

        ADXL345_ERROR_CHECK(TAG, core::ConfigValidator::validateFrequency(
                                     cfg.clockSpeedHz, 1, framing::spi::MAX_CLOCK_HZ, "SPI clock"));

        if (!GPIO_IS_VALID_OUTPUT_GPIO(cfg.csPin))
        {
            ADXL345_LOGE(TAG, "Invalid CS pin %d", cfg.csPin);
            return ESP_ERR_INVALID_ARG;
        }

        if (cfg.initBus)
        {
            const bool misoOk = cfg.threeWire || GPIO_IS_VALID_GPIO(cfg.misoPin);
            if (!GPIO_IS_VALID_OUTPUT_GPIO(cfg.mosiPin) || !GPIO_IS_VALID_OUTPUT_GPIO(cfg.sclkPin) || !misoOk)
            {
                ADXL345_LOGE(TAG, "Invalid SPI bus pins MOSI=%d, MISO=%d, SCLK=%d",
                             cfg.mosiPin, cfg.misoPin, cfg.sclkPin);
                return ESP_ERR_INVALID_ARG;
            }
        }

        return ESP_OK;
    }

    esp_err_t SPI_HAL::init(const SPIConfig &cfg)
    {
        if (device_ != nullptr)
        {
            ESP_LOGW(TAG, "SPI HAL already initialized, deinitializing first");
            deinit();
        }

        esp_err_t err = validateConfig(cfg);
        if (err != ESP_OK)
        {
            return err;
        }

        host_ = cfg.host;
        threeWire_ = cfg.threeWire;

        if (cfg.initBus)
        {
            spi_bus_config_t busCfg = {};
            busCfg.mosi_io_num = cfg.mosiPin;
            busCfg.miso_io_num = cfg.threeWire ? -1 : cfg.misoPin;
            busCfg.sclk_io_num = cfg.sclkPin;
            busCfg.quadwp_io_num = -1;
            busCfg.quadhd_io_num = -1;
            busCfg.max_transfer_sz = static_cast<int>(framing::spi::MAX_TRANSFER_BYTES);
            busCfg.flags = SPICOMMON_BUSFLAG_MASTER;

            err = spi_bus_initialize(host_, &busCfg, SPI_DMA_DISABLED);
            if (err != ESP_OK)
            {
                ESP_LOGE(TAG, "Failed to initialize SPI host %d: %s", host_, esp_err_to_name(err));
                return err;
            }
            ownsBus_ = true;
        }

        spi_device_interface_config_t devCfg = {};
        devCfg.command_bits = 0;
        devCfg.address_bits = ADDRESS_BITS;
        devCfg.dummy_bits = 0;
        devCfg.mode = framing::spi::REQUIRED_MODE;
        devCfg.clock_speed_hz = static_cast<int>(cfg.clockSpeedHz);
        devCfg.spics_io_num = cfg.csPin;
        devCfg.queue_size = 1;
        devCfg.flags = cfg.threeWire ? (SPI_DEVICE_3WIRE | SPI_DEVICE_HALFDUPLEX) : 0;

        ESP_LOGI(TAG, "Adding ADXL345 on SPI host %d, CS=%d, clock=%" PRIu32 " Hz, %s",
                 host_, cfg.csPin, cfg.clockSpeedHz, cfg.threeWire ? "3-wire" : "4-wire");

        err = spi_bus_add_device(host_, &devCfg, &device_);
        if (err != ESP_OK)
        {
            ESP_LOGE(TAG, "Failed to add SPI device: %s", esp_err_to_name(err));
            device_ = nullptr;
            if (ownsBus_)
            {
                ADXL345_ERROR_LOG(TAG, spi_bus_free(host_));
                ownsBus_ = false;
            }
            return err;
        }

        return ESP_OK;
    }

    esp_err_t SPI_HAL::transmit(spi_transaction_t &trans, uint8_t regAddr)
    {
        esp_err_t err = spi_device_polling_transmit(device_, &trans);
        if (err != ESP_OK)
        {
            ESP_LOGE(TAG, "SPI transfer at 0x%02X failed: %s", regAddr, esp_err_to_name(err));
        }
        return err;
    }

    esp_err_t SPI_HAL::write(uint8_t regAddr, std::span<const std::byte> data)
    {
        ADXL345_ERROR_CHECK(TAG, core::ConfigValidator::validateBufferSize(
                                     data.size(), 1, framing::spi::MAX_TRANSFER_BYTES, "SPI write"));

        if (device_ == nullptr)
        {
            ESP_LOGE(TAG, "SPI HAL not initialized");
            return ESP_ERR_INVALID_STATE;
        }

        spi_transaction_t trans = {};
        trans.addr = framing::spi::writeCommand(regAddr, data.size());
        trans.length = data.size() * 8;
        trans.tx_buffer = data.data();
        trans.rx_buffer = nullptr;

        return transmit(trans, regAddr);
    }

    esp_err_t SPI_HAL::read(uint8_t regAddr, std::span<std::byte> buffer)
    {
        ADXL345_ERROR_CHECK(TAG, core::ConfigValidator::validateBufferSize(
                                     buffer.size(), 1, framing::spi::MAX_TRANSFER_BYTES, "SPI read"));

        if (device_ == nullptr)
        {
            ESP_LOGE(TAG, "SPI HAL not initialized");
            return ESP_ERR_INVALID_STATE;
        }

        spi_transaction_t trans = {};
        trans.addr = framing::spi::readCommand(regAddr, buffer.size());
        trans.tx_buffer = nullptr;
        trans.rx_buffer = buffer.data();
        if (threeWire_)
        {
            // Half duplex: no MOSI data phase, read phase only
            trans.length = 0;
            trans.rxlength = buffer.size() * 8;
        }
        else
        {
            trans.length = buffer.size() * 8;
            trans.rxlength = 0; // same as length
        }

        return transmit(trans, regAddr);
    }

    void SPI_HAL::deinit()
    {
        if (device_ != nullptr)
        {
            ADXL345_ERROR_LOG(TAG, spi_bus_remove_device(device_));
            device_ = nullptr;
        }

        if (ownsBus_)
        {
            ADXL345_ERROR_LOG(TAG, spi_bus_free(host_));
            ownsBus_ = false;
            ESP_LOGI(TAG, "SPI host %d released", host_);
        }
    }

} // namespace adxl345
