#include "ComponentError.hpp"

namespace adxl345::core
{

    esp_err_t ComponentError::logAndReturn(esp_err_t err, const char *component, const char *operation)
    {
        if (err != ESP_OK)
        {
            ESP_LOGE(component, "Operation failed: %s - Error: %s (0x%x)",
                     operation, errorToString(err), err);
        }
        return err;
    }

    esp_err_t ComponentError::validateAndLog(esp_err_t err, const char *component, const char *context)
    {
        if (err != ESP_OK)
        {
            ESP_LOGW(component, "Error in %s: %s (0x%x)",
                     context, errorToString(err), err);
        }
        return err;
    }

    const char *ComponentError::errorToString(esp_err_t err)
    {
        switch (err)
        {
        case ESP_OK:
            return "No error";
        case ESP_FAIL:
            return "Bus transaction failed";
        case ESP_ERR_NO_MEM:
            return "Out of memory";
        case ESP_ERR_INVALID_ARG:
            return "Invalid argument";
        case ESP_ERR_INVALID_STATE:
            return "Invalid state";
        case ESP_ERR_INVALID_SIZE:
            return "Invalid size";
        case ESP_ERR_NOT_FOUND:
            return "Resource not found";
        case ESP_ERR_NOT_SUPPORTED:
            return "Operation not supported";
        case ESP_ERR_TIMEOUT:
            return "Operation timeout";
        case ESP_ERR_INVALID_RESPONSE:
            return "Invalid response";
        default:
            return esp_err_to_name(err);
        }
    }

} // namespace adxl345::core
