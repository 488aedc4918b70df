#pragma once

#include <esp_err.h>
#include <cstddef>
#include <cstdint>

namespace adxl345::core
{

    /**
     * @brief Configuration validation utilities
     *
     * Static checks used by the bus configurations and the driver before
     * any hardware is touched. Every failure is logged with the caller's
     * context string and reported as ESP_ERR_INVALID_ARG.
     */
    class ConfigValidator
    {
    public:
        /**
         * @brief Validate integer value within range
         * @param value Value to validate
         * @param min_val Minimum allowed value (inclusive)
         * @param max_val Maximum allowed value (inclusive)
         * @param context Context description for error messages
         * @return ESP_OK if valid, ESP_ERR_INVALID_ARG otherwise
         */
        static esp_err_t validateRange(int value, int min_val, int max_val, const char *context);

        /**
         * @brief Validate frequency value
         * @param freq_hz Frequency in Hz to validate
         * @param min_freq Minimum allowed frequency
         * @param max_freq Maximum allowed frequency
         * @param context Context description for error messages
         * @return ESP_OK if valid, ESP_ERR_INVALID_ARG otherwise
         */
        static esp_err_t validateFrequency(uint32_t freq_hz, uint32_t min_freq, uint32_t max_freq, const char *context);

        /**
         * @brief Validate buffer size
         * @param size Buffer size to validate
         * @param min_size Minimum required size
         * @param max_size Maximum allowed size
         * @param context Context description for error messages
         * @return ESP_OK if valid, ESP_ERR_INVALID_ARG otherwise
         */
        static esp_err_t validateBufferSize(size_t size, size_t min_size, size_t max_size, const char *context);

    private:
        static const char *TAG;
    };

} // namespace adxl345::core
