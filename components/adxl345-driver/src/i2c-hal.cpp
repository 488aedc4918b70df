#include "i2c-hal.hpp"
#include "ComponentError.hpp"
#include "ConfigValidator.hpp"
#include <esp_log.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <cinttypes>

namespace adxl345
{

    namespace
    {
        constexpr const char *TAG = "I2C_HAL";
        constexpr bool I2C_ACK_CHECK_EN = true; // Enable ACK check for master
    }

    I2C_HAL::~I2C_HAL()
    {
        deinit();
    }

    esp_err_t I2C_HAL::validateConfig(const I2CConfig &cfg)
    {
        const uint8_t addr = static_cast<uint8_t>(cfg.address);
        if (!framing::i2c::isValidAddress(addr))
        {
            ADXL345_LOGE(TAG, "Address 0x%02X is not an ADXL345 address (0x53 or 0x1D)", addr);
            return ESP_ERR_INVALID_ARG;
        }

        ADXL345_ERROR_CHECK(TAG, core::ConfigValidator::validateFrequency(
                                     cfg.clockSpeed, 1, framing::i2c::MAX_CLOCK_HZ, "I2C clock"));

        if (cfg.timeoutMs == 0)
        {
            ADXL345_LOGE(TAG, "Timeout must be at least 1 ms");
            return ESP_ERR_INVALID_ARG;
        }

        if (cfg.installDriver &&
            (!GPIO_IS_VALID_OUTPUT_GPIO(cfg.sdaPin) || !GPIO_IS_VALID_OUTPUT_GPIO(cfg.sclPin)))
        {
            ADXL345_LOGE(TAG, "Invalid I2C pins SDA=%d, SCL=%d", cfg.sdaPin, cfg.sclPin);
            return ESP_ERR_INVALID_ARG;
        }

        return ESP_OK;
    }

    esp_err_t I2C_HAL::init(const I2CConfig &cfg)
    {
        if (initialized_)
        {
            ESP_LOGW(TAG, "I2C HAL already initialized, deinitializing first");
            deinit();
            // Let the driver finish tearing down before reinstalling
            vTaskDelay(pdMS_TO_TICKS(10));
        }

        esp_err_t err = validateConfig(cfg);
        if (err != ESP_OK)
        {
            return err;
        }

        port_ = cfg.port;
        slaveAddr_ = static_cast<uint8_t>(cfg.address);
        timeoutMs_ = cfg.timeoutMs;

        if (cfg.installDriver)
        {
            i2c_config_t i2cCfg = {};
            i2cCfg.mode = I2C_MODE_MASTER;
            i2cCfg.sda_io_num = cfg.sdaPin;
            i2cCfg.scl_io_num = cfg.sclPin;
            i2cCfg.sda_pullup_en = cfg.pullupEnable ? GPIO_PULLUP_ENABLE : GPIO_PULLUP_DISABLE;
            i2cCfg.scl_pullup_en = cfg.pullupEnable ? GPIO_PULLUP_ENABLE : GPIO_PULLUP_DISABLE;
            i2cCfg.master.clk_speed = cfg.clockSpeed;
            i2cCfg.clk_flags = 0;

            ESP_LOGI(TAG, "Initializing I2C port %d with SDA=%d, SCL=%d, clock=%" PRIu32 " Hz, addr=0x%02X",
                     port_, cfg.sdaPin, cfg.sclPin, cfg.clockSpeed, slaveAddr_);

            err = i2c_param_config(port_, &i2cCfg);
            if (err != ESP_OK)
            {
                ESP_LOGE(TAG, "Failed to configure I2C parameters: %s", esp_err_to_name(err));
                return err;
            }

            err = i2c_driver_install(port_, I2C_MODE_MASTER, 0, 0, 0);
            if (err != ESP_OK)
            {
                ESP_LOGE(TAG, "Failed to install I2C driver: %s", esp_err_to_name(err));
                return err;
            }
            ownsDriver_ = true;
        }
        else
        {
            ESP_LOGI(TAG, "Attaching to I2C port %d, addr=0x%02X", port_, slaveAddr_);
        }

        initialized_ = true;
        return ESP_OK;
    }

    esp_err_t I2C_HAL::write(uint8_t regAddr, std::span<const std::byte> data)
    {
        if (data.empty())
        {
            ESP_LOGW(TAG, "Empty data span provided for write");
            return ESP_ERR_INVALID_ARG;
        }

        if (!initialized_)
        {
            ESP_LOGE(TAG, "I2C HAL not initialized");
            return ESP_ERR_INVALID_STATE;
        }

        i2c_cmd_handle_t cmd = i2c_cmd_link_create();
        if (cmd == nullptr)
        {
            ESP_LOGE(TAG, "Failed to create I2C command link");
            return ESP_ERR_NO_MEM;
        }

        esp_err_t err = i2c_master_start(cmd);
        if (err != ESP_OK)
            goto cleanup;

        err = i2c_master_write_byte(cmd, framing::i2c::writeAddressByte(slaveAddr_), I2C_ACK_CHECK_EN);
        if (err != ESP_OK)
            goto cleanup;

        err = i2c_master_write_byte(cmd, regAddr, I2C_ACK_CHECK_EN);
        if (err != ESP_OK)
            goto cleanup;

        err = i2c_master_write(cmd, reinterpret_cast<const uint8_t *>(data.data()), data.size(), I2C_ACK_CHECK_EN);
        if (err != ESP_OK)
            goto cleanup;

        err = i2c_master_stop(cmd);
        if (err != ESP_OK)
            goto cleanup;

        err = i2c_master_cmd_begin(port_, cmd, pdMS_TO_TICKS(timeoutMs_));
        if (err != ESP_OK)
        {
            ESP_LOGE(TAG, "I2C write to 0x%02X failed: %s", regAddr, esp_err_to_name(err));
        }

    cleanup:
        i2c_cmd_link_delete(cmd);
        return err;
    }

    esp_err_t I2C_HAL::read(uint8_t regAddr, std::span<std::byte> buffer)
    {
        if (buffer.empty())
        {
            ESP_LOGW(TAG, "Empty buffer provided for read");
            return ESP_ERR_INVALID_ARG;
        }

        if (!initialized_)
        {
            ESP_LOGE(TAG, "I2C HAL not initialized");
            return ESP_ERR_INVALID_STATE;
        }

        i2c_cmd_handle_t cmd = i2c_cmd_link_create();
        if (cmd == nullptr)
        {
            ESP_LOGE(TAG, "Failed to create I2C command link");
            return ESP_ERR_NO_MEM;
        }

        // Register pointer write
        esp_err_t err = i2c_master_start(cmd);
        if (err != ESP_OK)
            goto cleanup;

        err = i2c_master_write_byte(cmd, framing::i2c::writeAddressByte(slaveAddr_), I2C_ACK_CHECK_EN);
        if (err != ESP_OK)
            goto cleanup;

        err = i2c_master_write_byte(cmd, regAddr, I2C_ACK_CHECK_EN);
        if (err != ESP_OK)
            goto cleanup;

        // Repeated start for read
        err = i2c_master_start(cmd);
        if (err != ESP_OK)
            goto cleanup;

        err = i2c_master_write_byte(cmd, framing::i2c::readAddressByte(slaveAddr_), I2C_ACK_CHECK_EN);
        if (err != ESP_OK)
            goto cleanup;

        // ACK every byte but the last, NACK the last
        err = i2c_master_read(cmd, reinterpret_cast<uint8_t *>(buffer.data()), buffer.size(), I2C_MASTER_LAST_NACK);
        if (err != ESP_OK)
            goto cleanup;

        err = i2c_master_stop(cmd);
        if (err != ESP_OK)
            goto cleanup;

        err = i2c_master_cmd_begin(port_, cmd, pdMS_TO_TICKS(timeoutMs_));
        if (err != ESP_OK)
        {
            ESP_LOGE(TAG, "I2C read of %zu byte(s) from 0x%02X failed: %s",
                     buffer.size(), regAddr, esp_err_to_name(err));
        }

    cleanup:
        i2c_cmd_link_delete(cmd);
        return err;
    }

    void I2C_HAL::deinit()
    {
        if (!initialized_)
        {
            return;
        }

        if (ownsDriver_)
        {
            ADXL345_ERROR_LOG(TAG, i2c_driver_delete(port_));
            ownsDriver_ = false;
        }
        initialized_ = false;
        ESP_LOGI(TAG, "I2C HAL released port %d", port_);
    }

} // namespace adxl345
