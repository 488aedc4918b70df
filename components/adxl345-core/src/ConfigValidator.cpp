#include "ConfigValidator.hpp"
#include "ComponentError.hpp"

#include <cinttypes>

namespace adxl345::core
{

    const char *ConfigValidator::TAG = "ConfigValidator";

    esp_err_t ConfigValidator::validateRange(int value, int min_val, int max_val, const char *context)
    {
        if (value < min_val || value > max_val)
        {
            ADXL345_LOGE(TAG, "Value %d out of range for %s (valid range: %d-%d)",
                         value, context, min_val, max_val);
            return ESP_ERR_INVALID_ARG;
        }
        return ESP_OK;
    }

    esp_err_t ConfigValidator::validateFrequency(uint32_t freq_hz, uint32_t min_freq, uint32_t max_freq, const char *context)
    {
        if (freq_hz < min_freq || freq_hz > max_freq)
        {
            ADXL345_LOGE(TAG, "Frequency %" PRIu32 " Hz out of range for %s (valid range: %" PRIu32 "-%" PRIu32 " Hz)",
                         freq_hz, context, min_freq, max_freq);
            return ESP_ERR_INVALID_ARG;
        }
        return ESP_OK;
    }

    esp_err_t ConfigValidator::validateBufferSize(size_t size, size_t min_size, size_t max_size, const char *context)
    {
        if (size < min_size || size > max_size)
        {
            ADXL345_LOGE(TAG, "Buffer size %zu out of range for %s (valid range: %zu-%zu)",
                         size, context, min_size, max_size);
            return ESP_ERR_INVALID_ARG;
        }
        return ESP_OK;
    }

} // namespace adxl345::core
