#include "adxl345.hpp"
#include "ComponentError.hpp"
#include "ConfigValidator.hpp"
#include <esp_log.h>
#include <array>
#include <utility>

namespace adxl345
{

    namespace
    {
        constexpr const char *TAG = "ADXL345";

        constexpr std::byte toByte(uint8_t value)
        {
            return static_cast<std::byte>(value);
        }

        constexpr uint8_t encodePowerControl(bool measure, const PowerControl &flags)
        {
            uint8_t value = static_cast<uint8_t>(flags.wakeup) & constants::POWER_CTL_WAKEUP_MASK;
            if (flags.link)
                value |= constants::POWER_CTL_LINK;
            if (flags.autoSleep)
                value |= constants::POWER_CTL_AUTO_SLEEP;
            if (measure)
                value |= constants::POWER_CTL_MEASURE;
            if (flags.sleep)
                value |= constants::POWER_CTL_SLEEP;
            return value;
        }

        constexpr uint8_t encodeDataFormat(Range range, bool fullResolution, const DataFormatFlags &flags)
        {
            uint8_t value = static_cast<uint8_t>(range) & constants::DATA_FORMAT_RANGE_MASK;
            if (flags.selfTest)
                value |= constants::DATA_FORMAT_SELF_TEST;
            if (flags.spi3Wire)
                value |= constants::DATA_FORMAT_SPI;
            if (flags.intInvert)
                value |= constants::DATA_FORMAT_INT_INVERT;
            if (fullResolution)
                value |= constants::DATA_FORMAT_FULL_RES;
            if (flags.justifyLeft)
                value |= constants::DATA_FORMAT_JUSTIFY;
            return value;
        }

        constexpr DataFormat decodeDataFormat(uint8_t value)
        {
            DataFormat format;
            format.range = static_cast<Range>(value & constants::DATA_FORMAT_RANGE_MASK);
            format.fullResolution = (value & constants::DATA_FORMAT_FULL_RES) != 0;
            format.flags.selfTest = (value & constants::DATA_FORMAT_SELF_TEST) != 0;
            format.flags.spi3Wire = (value & constants::DATA_FORMAT_SPI) != 0;
            format.flags.intInvert = (value & constants::DATA_FORMAT_INT_INVERT) != 0;
            format.flags.justifyLeft = (value & constants::DATA_FORMAT_JUSTIFY) != 0;
            return format;
        }
    }

    ADXL345::ADXL345(std::unique_ptr<IRegisterBus> bus) : bus_(std::move(bus))
    {
        if (bus_)
        {
            ESP_LOGI(TAG, "ADXL345 driver created on %s bus", bus_->getName());
        }
        else
        {
            ESP_LOGW(TAG, "ADXL345 driver created without a bus");
        }
    }

    // === Bus helpers ===

    esp_err_t ADXL345::checkBus() const
    {
        if (!bus_)
        {
            ADXL345_LOGE(TAG, "No bus attached");
            return ESP_ERR_INVALID_STATE;
        }
        return ESP_OK;
    }

    esp_err_t ADXL345::readBytes(Register first, std::span<std::byte> buffer)
    {
        ADXL345_ERROR_CHECK(TAG, checkBus());
        return bus_->read(registers::address(first), buffer);
    }

    esp_err_t ADXL345::writeBytes(Register first, std::span<const std::byte> data)
    {
        ADXL345_ERROR_CHECK(TAG, checkBus());
        return bus_->write(registers::address(first), data);
    }

    esp_err_t ADXL345::readByte(Register reg, uint8_t &value)
    {
        std::byte data{};
        esp_err_t err = readBytes(reg, std::span<std::byte>(&data, 1));
        if (err == ESP_OK)
        {
            value = std::to_integer<uint8_t>(data);
        }
        return err;
    }

    esp_err_t ADXL345::writeByte(Register reg, uint8_t value)
    {
        const std::byte data = toByte(value);
        return writeBytes(reg, std::span<const std::byte>(&data, 1));
    }

    // === Power and data rate ===

    esp_err_t ADXL345::setPowerControl(bool measure, const PowerControl &flags)
    {
        if (!isValid(flags.wakeup))
        {
            ADXL345_LOGE(TAG, "Invalid wake-up rate %u", static_cast<unsigned>(flags.wakeup));
            return ESP_ERR_INVALID_ARG;
        }

        ADXL345_ERROR_CHECK(TAG, writeByte(Register::POWER_CTL, encodePowerControl(measure, flags)));

        state_ = measure ? DriverState::STREAMING : DriverState::CONFIGURED;
        ESP_LOGI(TAG, "%s mode", measure ? "Measurement" : "Standby");
        return ESP_OK;
    }

    esp_err_t ADXL345::readPowerControl(bool &measure, PowerControl &flags)
    {
        uint8_t value = 0;
        ADXL345_ERROR_CHECK(TAG, readByte(Register::POWER_CTL, value));

        measure = (value & constants::POWER_CTL_MEASURE) != 0;
        flags.link = (value & constants::POWER_CTL_LINK) != 0;
        flags.autoSleep = (value & constants::POWER_CTL_AUTO_SLEEP) != 0;
        flags.sleep = (value & constants::POWER_CTL_SLEEP) != 0;
        flags.wakeup = static_cast<WakeupRate>(value & constants::POWER_CTL_WAKEUP_MASK);
        return ESP_OK;
    }

    esp_err_t ADXL345::standby()
    {
        return setPowerControl(false);
    }

    esp_err_t ADXL345::setDataRate(DataRate rate, bool lowPower)
    {
        if (!isValid(rate))
        {
            ADXL345_LOGE(TAG, "Invalid data rate code 0x%02X", static_cast<unsigned>(rate));
            return ESP_ERR_INVALID_ARG;
        }

        uint8_t value = static_cast<uint8_t>(rate);
        if (lowPower)
        {
            value |= constants::BW_RATE_LOW_POWER;
        }
        return writeByte(Register::BW_RATE, value);
    }

    esp_err_t ADXL345::readDataRate(DataRate &rate, bool &lowPower)
    {
        uint8_t value = 0;
        ADXL345_ERROR_CHECK(TAG, readByte(Register::BW_RATE, value));

        rate = static_cast<DataRate>(value & constants::BW_RATE_RATE_MASK);
        lowPower = (value & constants::BW_RATE_LOW_POWER) != 0;
        return ESP_OK;
    }

    // === Data format ===

    esp_err_t ADXL345::setDataFormat(Range range, bool fullResolution, const DataFormatFlags &flags)
    {
        if (!isValid(range))
        {
            ADXL345_LOGE(TAG, "Invalid range code %u", static_cast<unsigned>(range));
            return ESP_ERR_INVALID_ARG;
        }

        ADXL345_ERROR_CHECK(TAG, writeByte(Register::DATA_FORMAT, encodeDataFormat(range, fullResolution, flags)));

        if (state_ == DriverState::UNINITIALIZED)
        {
            state_ = DriverState::CONFIGURED;
        }
        ESP_LOGI(TAG, "Data format: +/-%dg, %s resolution", rangeInG(range), fullResolution ? "full" : "10-bit");
        return ESP_OK;
    }

    esp_err_t ADXL345::readDataFormat(DataFormat &format)
    {
        uint8_t value = 0;
        ADXL345_ERROR_CHECK(TAG, readByte(Register::DATA_FORMAT, value));
        format = decodeDataFormat(value);
        return ESP_OK;
    }

    // === Offset trim ===

    esp_err_t ADXL345::setOffset(int8_t x, int8_t y, int8_t z)
    {
        const std::array<std::byte, constants::OFFSET_BYTES> data = {
            toByte(static_cast<uint8_t>(x)),
            toByte(static_cast<uint8_t>(y)),
            toByte(static_cast<uint8_t>(z))};
        return writeBytes(Register::OFSX, data);
    }

    esp_err_t ADXL345::setOffsetAdjustment(std::optional<int8_t> x, std::optional<int8_t> y, std::optional<int8_t> z)
    {
        if (x)
        {
            ADXL345_ERROR_CHECK(TAG, writeByte(Register::OFSX, static_cast<uint8_t>(*x)));
        }
        if (y)
        {
            ADXL345_ERROR_CHECK(TAG, writeByte(Register::OFSY, static_cast<uint8_t>(*y)));
        }
        if (z)
        {
            ADXL345_ERROR_CHECK(TAG, writeByte(Register::OFSZ, static_cast<uint8_t>(*z)));
        }
        return ESP_OK;
    }

    esp_err_t ADXL345::readOffset(int8_t &x, int8_t &y, int8_t &z)
    {
        std::array<std::byte, constants::OFFSET_BYTES> data{};
        ADXL345_ERROR_CHECK(TAG, readBytes(Register::OFSX, data));

        x = static_cast<int8_t>(std::to_integer<uint8_t>(data[0]));
        y = static_cast<int8_t>(std::to_integer<uint8_t>(data[1]));
        z = static_cast<int8_t>(std::to_integer<uint8_t>(data[2]));
        return ESP_OK;
    }

    // === Tap, activity and free-fall detection ===

    esp_err_t ADXL345::setTap(uint8_t threshold, uint8_t duration, uint8_t latency, uint8_t window)
    {
        ADXL345_ERROR_CHECK(TAG, writeByte(Register::THRESH_TAP, threshold));

        // DUR, LATENT and WINDOW are consecutive
        const std::array<std::byte, 3> timing = {toByte(duration), toByte(latency), toByte(window)};
        return writeBytes(Register::DUR, timing);
    }

    esp_err_t ADXL345::tapControl(uint8_t tapMode)
    {
        if ((tapMode & ~constants::TAP_AXES_MASK) != 0)
        {
            ADXL345_LOGE(TAG, "Unknown tap mode bits 0x%02X", tapMode);
            return ESP_ERR_INVALID_ARG;
        }
        return writeByte(Register::TAP_AXES, tapMode);
    }

    esp_err_t ADXL345::setActivity(uint8_t threshold)
    {
        return writeByte(Register::THRESH_ACT, threshold);
    }

    esp_err_t ADXL345::setInactivity(uint8_t threshold, uint8_t timeSeconds)
    {
        const std::array<std::byte, 2> data = {toByte(threshold), toByte(timeSeconds)};
        return writeBytes(Register::THRESH_INACT, data);
    }

    esp_err_t ADXL345::activityControl(uint8_t activityMode)
    {
        return writeByte(Register::ACT_INACT_CTL, activityMode);
    }

    esp_err_t ADXL345::setFreeFall(uint8_t threshold, uint8_t time)
    {
        const std::array<std::byte, 2> data = {toByte(threshold), toByte(time)};
        return writeBytes(Register::THRESH_FF, data);
    }

    // === Interrupts ===

    esp_err_t ADXL345::setInterruptEnable(uint8_t mask)
    {
        return writeByte(Register::INT_ENABLE, mask);
    }

    esp_err_t ADXL345::setInterruptMap(uint8_t mask)
    {
        return writeByte(Register::INT_MAP, mask);
    }

    esp_err_t ADXL345::readInterruptSource(uint8_t &source)
    {
        return readByte(Register::INT_SOURCE, source);
    }

    esp_err_t ADXL345::readActTapStatus(uint8_t &status)
    {
        return readByte(Register::ACT_TAP_STATUS, status);
    }

    // === FIFO ===

    esp_err_t ADXL345::setFifoControl(FifoMode mode, bool triggerInt2, uint8_t samples)
    {
        if (!isValid(mode))
        {
            ADXL345_LOGE(TAG, "Invalid FIFO mode %u", static_cast<unsigned>(mode));
            return ESP_ERR_INVALID_ARG;
        }
        ADXL345_ERROR_CHECK(TAG, core::ConfigValidator::validateRange(
                                     samples, 0, constants::FIFO_CTL_SAMPLES_MASK, "FIFO samples"));

        uint8_t value = static_cast<uint8_t>(static_cast<uint8_t>(mode) << constants::FIFO_CTL_MODE_SHIFT);
        value |= samples;
        if (triggerInt2)
        {
            value |= constants::FIFO_CTL_TRIGGER;
        }
        return writeByte(Register::FIFO_CTL, value);
    }

    esp_err_t ADXL345::readFifoStatus(uint8_t &entries, bool &triggered)
    {
        uint8_t value = 0;
        ADXL345_ERROR_CHECK(TAG, readByte(Register::FIFO_STATUS, value));

        entries = value & constants::FIFO_STATUS_ENTRIES_MASK;
        triggered = (value & constants::FIFO_STATUS_TRIGGERED) != 0;
        return ESP_OK;
    }

    // === Generic register access ===

    esp_err_t ADXL345::readRegister(Register reg, uint8_t &value)
    {
        const RegisterInfo *info = registers::find(reg);
        if (info == nullptr)
        {
            ADXL345_LOGE(TAG, "Unknown register 0x%02X", registers::address(reg));
            return ESP_ERR_INVALID_ARG;
        }
        if (!registers::isReadable(*info))
        {
            ADXL345_LOGE(TAG, "Register %s is write-only", info->name);
            return ESP_ERR_INVALID_ARG;
        }
        return readByte(reg, value);
    }

    esp_err_t ADXL345::writeRegister(Register reg, uint8_t value)
    {
        const RegisterInfo *info = registers::find(reg);
        if (info == nullptr)
        {
            ADXL345_LOGE(TAG, "Unknown register 0x%02X", registers::address(reg));
            return ESP_ERR_INVALID_ARG;
        }
        if (!registers::isWritable(*info))
        {
            ADXL345_LOGE(TAG, "Register %s is read-only", info->name);
            return ESP_ERR_INVALID_ARG;
        }
        return writeByte(reg, value);
    }

    // === Data ===

    esp_err_t ADXL345::readDeviceId(uint8_t &id)
    {
        ADXL345_ERROR_CHECK(TAG, readByte(Register::DEVID, id));
        if (!isKnownDeviceId(id))
        {
            ADXL345_LOGW(TAG, "Unexpected device ID 0x%02X", id);
        }
        return ESP_OK;
    }

    esp_err_t ADXL345::readRawAxes(RawAxes &raw)
    {
        if (state_ != DriverState::STREAMING)
        {
            ESP_LOGD(TAG, "Reading axes while not in measurement mode");
        }

        std::array<std::byte, constants::AXIS_DATA_BYTES> data{};
        ADXL345_ERROR_CHECK(TAG, readBytes(Register::DATAX0, data));

        raw = decodeAxes(data);
        ESP_LOGD(TAG, "Raw axes: x=%d y=%d z=%d", raw.x, raw.y, raw.z);
        return ESP_OK;
    }

    esp_err_t ADXL345::readAcceleration(Acceleration &accel)
    {
        RawAxes raw;
        ADXL345_ERROR_CHECK(TAG, readRawAxes(raw));

        DataFormat format;
        ADXL345_ERROR_CHECK(TAG, readDataFormat(format));

        accel = convert(raw, format);
        return ESP_OK;
    }

    esp_err_t ADXL345::readAcceleration(const DataFormat &format, Acceleration &accel)
    {
        if (!isValid(format.range))
        {
            ADXL345_LOGE(TAG, "Invalid range code %u", static_cast<unsigned>(format.range));
            return ESP_ERR_INVALID_ARG;
        }

        RawAxes raw;
        ADXL345_ERROR_CHECK(TAG, readRawAxes(raw));

        accel = convert(raw, format);
        return ESP_OK;
    }

} // namespace adxl345
