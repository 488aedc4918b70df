#pragma once

#include <esp_err.h>
#include <esp_log.h>

namespace adxl345::core
{

    /**
     * @brief Error logging helpers shared by the bus adapters and the driver
     *
     * Errors stay plain esp_err_t values. These helpers only add logging
     * with component and operation context; they never translate the code.
     */
    class ComponentError
    {
    public:
        /**
         * @brief Log error and return the error code
         * @param err Error code to log and return
         * @param component Component name for logging context
         * @param operation Operation that failed
         * @return The original error code
         */
        static esp_err_t logAndReturn(esp_err_t err, const char *component, const char *operation);

        /**
         * @brief Validate error code and log if not ESP_OK
         * @param err Error code to validate
         * @param component Component name for logging context
         * @param context Context description for the error
         * @return The original error code
         */
        static esp_err_t validateAndLog(esp_err_t err, const char *component, const char *context);

        /**
         * @brief Short description of the error codes this driver produces
         * @param err Error code
         * @return Error description string
         */
        static const char *errorToString(esp_err_t err);
    };

} // namespace adxl345::core

/**
 * @brief Logging macros with function context
 */
#define ADXL345_LOGW(component, format, ...) \
    ESP_LOGW(component, "[%s] " format, __func__, ##__VA_ARGS__)

#define ADXL345_LOGE(component, format, ...) \
    ESP_LOGE(component, "[%s] " format, __func__, ##__VA_ARGS__)

/**
 * @brief Evaluate an esp_err_t expression and return it on failure
 *
 * The returned code is the one produced by the operation, unchanged.
 */
#define ADXL345_ERROR_CHECK(component, operation)                                             \
    do                                                                                        \
    {                                                                                         \
        esp_err_t __err = (operation);                                                        \
        if (__err != ESP_OK)                                                                  \
        {                                                                                     \
            return adxl345::core::ComponentError::logAndReturn(__err, component, #operation); \
        }                                                                                     \
    } while (0)

/**
 * @brief Evaluate an esp_err_t expression and only log on failure
 */
#define ADXL345_ERROR_LOG(component, operation)                                          \
    do                                                                                   \
    {                                                                                    \
        esp_err_t __err = (operation);                                                   \
        if (__err != ESP_OK)                                                             \
        {                                                                                \
            adxl345::core::ComponentError::validateAndLog(__err, component, #operation); \
        }                                                                                \
    } while (0)
