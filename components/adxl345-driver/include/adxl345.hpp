#pragma once

#include "IRegisterBus.hpp"
#include "adxl345-defs.hpp"
#include "adxl345-conversion.hpp"
#include <esp_err.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>

namespace adxl345
{

    /// Which configuration calls have succeeded so far
    enum class DriverState : uint8_t
    {
        UNINITIALIZED,
        CONFIGURED,
        STREAMING
    };

    /**
     * @brief ADXL345/ADXL346 accelerometer driver
     *
     * Works over any IRegisterBus. The driver keeps no copy of the device
     * configuration: every query goes to the device registers. All calls are
     * blocking and the class is not thread-safe.
     *
     * Typical use:
     * @code
     *   auto bus = std::make_unique<adxl345::I2C_HAL>();
     *   bus->init(cfg);
     *   adxl345::ADXL345 accel(std::move(bus));
     *   accel.setDataFormat(adxl345::Range::RANGE_16G, true);
     *   accel.setPowerControl(true);
     *   accel.readAcceleration(sample);
     * @endcode
     */
    class ADXL345 final
    {
    public:
        explicit ADXL345(std::unique_ptr<IRegisterBus> bus);
        ~ADXL345() = default;

        ADXL345(const ADXL345 &) = delete;
        ADXL345 &operator=(const ADXL345 &) = delete;
        ADXL345(ADXL345 &&) = delete;
        ADXL345 &operator=(ADXL345 &&) = delete;

        // === Power and data rate ===

        /**
         * @brief Write POWER_CTL
         * @param measure true for measurement mode, false for standby
         * @param flags Link, auto-sleep, sleep and wake-up rate
         * @return ESP_ERR_INVALID_ARG for an unknown wake-up rate, else the bus result
         */
        esp_err_t setPowerControl(bool measure, const PowerControl &flags = {});
        esp_err_t readPowerControl(bool &measure, PowerControl &flags);

        /// Enter standby (POWER_CTL = 0)
        esp_err_t standby();

        esp_err_t setDataRate(DataRate rate, bool lowPower = false);
        esp_err_t readDataRate(DataRate &rate, bool &lowPower);

        // === Data format ===

        /**
         * @brief Write DATA_FORMAT
         * @param range g-range
         * @param fullResolution true keeps 4 mg/LSB across ranges
         * @param flags Self-test, 3-wire SPI, interrupt polarity, justification
         * @return ESP_ERR_INVALID_ARG for an unknown range (nothing is written)
         *
         * The whole register is rewritten. On a 3-wire SPI_HAL, flags.spi3Wire
         * must be set or the device drops back to 4-wire and later reads fail.
         */
        esp_err_t setDataFormat(Range range, bool fullResolution, const DataFormatFlags &flags = {});
        esp_err_t readDataFormat(DataFormat &format);

        // === Offset trim (15.6 mg/LSB) ===

        /// Write OFSX..OFSZ in one burst
        esp_err_t setOffset(int8_t x, int8_t y, int8_t z);

        /// Write only the axes given; std::nullopt leaves that axis unchanged
        esp_err_t setOffsetAdjustment(std::optional<int8_t> x, std::optional<int8_t> y, std::optional<int8_t> z);

        esp_err_t readOffset(int8_t &x, int8_t &y, int8_t &z);

        // === Tap, activity and free-fall detection ===

        /**
         * @brief Configure tap detection
         * @param threshold THRESH_TAP, 62.5 mg/LSB
         * @param duration DUR, 625 us/LSB
         * @param latency LATENT, 1.25 ms/LSB
         * @param window WINDOW, 1.25 ms/LSB
         */
        esp_err_t setTap(uint8_t threshold, uint8_t duration, uint8_t latency, uint8_t window);

        /// Write TAP_AXES from TapMode flags; bits outside the mask are rejected
        esp_err_t tapControl(uint8_t tapMode);

        esp_err_t setActivity(uint8_t threshold);
        esp_err_t setInactivity(uint8_t threshold, uint8_t timeSeconds);

        /// Write ACT_INACT_CTL from ActivityMode flags
        esp_err_t activityControl(uint8_t activityMode);

        /**
         * @brief Configure free-fall detection
         * @param threshold THRESH_FF, 62.5 mg/LSB
         * @param time TIME_FF, 5 ms/LSB
         */
        esp_err_t setFreeFall(uint8_t threshold, uint8_t time);

        // === Interrupts ===

        esp_err_t setInterruptEnable(uint8_t mask);

        /// Bits set route the matching interrupt to INT2, clear to INT1
        esp_err_t setInterruptMap(uint8_t mask);

        /// Reading INT_SOURCE clears the latched tap/activity/free-fall bits
        esp_err_t readInterruptSource(uint8_t &source);

        esp_err_t readActTapStatus(uint8_t &status);

        // === FIFO ===

        esp_err_t setFifoControl(FifoMode mode, bool triggerInt2, uint8_t samples);
        esp_err_t readFifoStatus(uint8_t &entries, bool &triggered);

        // === Generic register access ===

        esp_err_t readRegister(Register reg, uint8_t &value);
        esp_err_t writeRegister(Register reg, uint8_t value);

        // === Data ===

        /// Read DEVID as is; use isKnownDeviceId() to check wiring
        esp_err_t readDeviceId(uint8_t &id);

        /// One burst read of DATAX0..DATAZ1
        esp_err_t readRawAxes(RawAxes &raw);

        /// Raw burst, then DATA_FORMAT, then conversion to m/s²
        esp_err_t readAcceleration(Acceleration &accel);

        /// Same as readAcceleration(Acceleration &) with a known data format
        esp_err_t readAcceleration(const DataFormat &format, Acceleration &accel);

        DriverState state() const { return state_; }

    private:
        std::unique_ptr<IRegisterBus> bus_;
        DriverState state_ = DriverState::UNINITIALIZED;

        esp_err_t checkBus() const;
        esp_err_t readByte(Register reg, uint8_t &value);
        esp_err_t writeByte(Register reg, uint8_t value);
        esp_err_t readBytes(Register first, std::span<std::byte> buffer);
        esp_err_t writeBytes(Register first, std::span<const std::byte> data);
    };

} // namespace adxl345
