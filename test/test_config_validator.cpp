#include "ConfigValidator.hpp"
#include "ComponentError.hpp"
#include <gtest/gtest.h>

using adxl345::core::ComponentError;
using adxl345::core::ConfigValidator;

TEST(ConfigValidator, RangeBoundsAreInclusive)
{
    EXPECT_EQ(ConfigValidator::validateRange(0, 0, 31, "samples"), ESP_OK);
    EXPECT_EQ(ConfigValidator::validateRange(31, 0, 31, "samples"), ESP_OK);
    EXPECT_EQ(ConfigValidator::validateRange(32, 0, 31, "samples"), ESP_ERR_INVALID_ARG);
    EXPECT_EQ(ConfigValidator::validateRange(-1, 0, 31, "samples"), ESP_ERR_INVALID_ARG);
}

TEST(ConfigValidator, Frequency)
{
    EXPECT_EQ(ConfigValidator::validateFrequency(400000, 1, 400000, "I2C clock"), ESP_OK);
    EXPECT_EQ(ConfigValidator::validateFrequency(1000000, 1, 400000, "I2C clock"), ESP_ERR_INVALID_ARG);
    EXPECT_EQ(ConfigValidator::validateFrequency(0, 1, 5000000, "SPI clock"), ESP_ERR_INVALID_ARG);
}

TEST(ConfigValidator, BufferSize)
{
    EXPECT_EQ(ConfigValidator::validateBufferSize(6, 1, 32, "read"), ESP_OK);
    EXPECT_EQ(ConfigValidator::validateBufferSize(0, 1, 32, "read"), ESP_ERR_INVALID_ARG);
    EXPECT_EQ(ConfigValidator::validateBufferSize(33, 1, 32, "read"), ESP_ERR_INVALID_ARG);
}

namespace
{
    esp_err_t checkedStep(esp_err_t first, esp_err_t second, int &reached)
    {
        ADXL345_ERROR_CHECK("test", first);
        reached = 1;
        ADXL345_ERROR_CHECK("test", second);
        reached = 2;
        return ESP_OK;
    }
}

TEST(ComponentError, ErrorCheckReturnsOriginalCode)
{
    int reached = 0;
    EXPECT_EQ(checkedStep(ESP_OK, ESP_OK, reached), ESP_OK);
    EXPECT_EQ(reached, 2);

    reached = 0;
    EXPECT_EQ(checkedStep(ESP_ERR_TIMEOUT, ESP_OK, reached), ESP_ERR_TIMEOUT);
    EXPECT_EQ(reached, 0);

    EXPECT_EQ(checkedStep(ESP_OK, ESP_FAIL, reached), ESP_FAIL);
    EXPECT_EQ(reached, 1);
}

TEST(ComponentError, LogHelpersPassCodesThrough)
{
    EXPECT_EQ(ComponentError::logAndReturn(ESP_ERR_NO_MEM, "test", "alloc"), ESP_ERR_NO_MEM);
    EXPECT_EQ(ComponentError::validateAndLog(ESP_OK, "test", "noop"), ESP_OK);
    EXPECT_STREQ(ComponentError::errorToString(ESP_ERR_INVALID_ARG), "Invalid argument");
    EXPECT_STREQ(ComponentError::errorToString(ESP_ERR_INVALID_STATE), "Invalid state");
}
