#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace adxl345
{

    /**
     * @brief ADXL345/ADXL346 register identifiers
     *
     * The enumerator value is the register address. Reserved addresses
     * (0x01-0x1C) have no identifier.
     */
    enum class Register : uint8_t
    {
        DEVID = 0x00,          // Device ID
        THRESH_TAP = 0x1D,     // Tap threshold
        OFSX = 0x1E,           // X-axis offset
        OFSY = 0x1F,           // Y-axis offset
        OFSZ = 0x20,           // Z-axis offset
        DUR = 0x21,            // Tap duration
        LATENT = 0x22,         // Tap latency
        WINDOW = 0x23,         // Tap window
        THRESH_ACT = 0x24,     // Activity threshold
        THRESH_INACT = 0x25,   // Inactivity threshold
        TIME_INACT = 0x26,     // Inactivity time
        ACT_INACT_CTL = 0x27,  // Axis enable control for activity and inactivity detection
        THRESH_FF = 0x28,      // Free-fall threshold
        TIME_FF = 0x29,        // Free-fall time
        TAP_AXES = 0x2A,       // Axis control for single/double tap
        ACT_TAP_STATUS = 0x2B, // Source of single/double tap
        BW_RATE = 0x2C,        // Data rate and power mode control
        POWER_CTL = 0x2D,      // Power-saving features control
        INT_ENABLE = 0x2E,     // Interrupt enable control
        INT_MAP = 0x2F,        // Interrupt mapping control
        INT_SOURCE = 0x30,     // Source of interrupts
        DATA_FORMAT = 0x31,    // Data format control
        DATAX0 = 0x32,         // X-axis data 0
        DATAX1 = 0x33,         // X-axis data 1
        DATAY0 = 0x34,         // Y-axis data 0
        DATAY1 = 0x35,         // Y-axis data 1
        DATAZ0 = 0x36,         // Z-axis data 0
        DATAZ1 = 0x37,         // Z-axis data 1
        FIFO_CTL = 0x38,       // FIFO control
        FIFO_STATUS = 0x39,    // FIFO status
        TAP_SIGN = 0x3A,       // Sign and source for single/double tap (ADXL346)
        ORIENT_CONF = 0x3B,    // Orientation configuration (ADXL346)
        ORIENT = 0x3C          // Orientation status (ADXL346)
    };

    enum class Access : uint8_t
    {
        READ_ONLY,
        WRITE_ONLY,
        READ_WRITE
    };

    struct RegisterInfo
    {
        Register reg;
        uint8_t address;
        uint8_t width; ///< Bytes covered by one access (2 for the low byte of an axis pair)
        Access access;
        const char *name;
    };

    namespace registers
    {
        inline constexpr std::array<RegisterInfo, 33> MAP{{
            {Register::DEVID, 0x00, 1, Access::READ_ONLY, "DEVID"},
            {Register::THRESH_TAP, 0x1D, 1, Access::READ_WRITE, "THRESH_TAP"},
            {Register::OFSX, 0x1E, 1, Access::READ_WRITE, "OFSX"},
            {Register::OFSY, 0x1F, 1, Access::READ_WRITE, "OFSY"},
            {Register::OFSZ, 0x20, 1, Access::READ_WRITE, "OFSZ"},
            {Register::DUR, 0x21, 1, Access::READ_WRITE, "DUR"},
            {Register::LATENT, 0x22, 1, Access::READ_WRITE, "LATENT"},
            {Register::WINDOW, 0x23, 1, Access::READ_WRITE, "WINDOW"},
            {Register::THRESH_ACT, 0x24, 1, Access::READ_WRITE, "THRESH_ACT"},
            {Register::THRESH_INACT, 0x25, 1, Access::READ_WRITE, "THRESH_INACT"},
            {Register::TIME_INACT, 0x26, 1, Access::READ_WRITE, "TIME_INACT"},
            {Register::ACT_INACT_CTL, 0x27, 1, Access::READ_WRITE, "ACT_INACT_CTL"},
            {Register::THRESH_FF, 0x28, 1, Access::READ_WRITE, "THRESH_FF"},
            {Register::TIME_FF, 0x29, 1, Access::READ_WRITE, "TIME_FF"},
            {Register::TAP_AXES, 0x2A, 1, Access::READ_WRITE, "TAP_AXES"},
            {Register::ACT_TAP_STATUS, 0x2B, 1, Access::READ_ONLY, "ACT_TAP_STATUS"},
            {Register::BW_RATE, 0x2C, 1, Access::READ_WRITE, "BW_RATE"},
            {Register::POWER_CTL, 0x2D, 1, Access::READ_WRITE, "POWER_CTL"},
            {Register::INT_ENABLE, 0x2E, 1, Access::READ_WRITE, "INT_ENABLE"},
            {Register::INT_MAP, 0x2F, 1, Access::READ_WRITE, "INT_MAP"},
            {Register::INT_SOURCE, 0x30, 1, Access::READ_ONLY, "INT_SOURCE"},
            {Register::DATA_FORMAT, 0x31, 1, Access::READ_WRITE, "DATA_FORMAT"},
            {Register::DATAX0, 0x32, 2, Access::READ_ONLY, "DATAX0"},
            {Register::DATAX1, 0x33, 1, Access::READ_ONLY, "DATAX1"},
            {Register::DATAY0, 0x34, 2, Access::READ_ONLY, "DATAY0"},
            {Register::DATAY1, 0x35, 1, Access::READ_ONLY, "DATAY1"},
            {Register::DATAZ0, 0x36, 2, Access::READ_ONLY, "DATAZ0"},
            {Register::DATAZ1, 0x37, 1, Access::READ_ONLY, "DATAZ1"},
            {Register::FIFO_CTL, 0x38, 1, Access::READ_WRITE, "FIFO_CTL"},
            {Register::FIFO_STATUS, 0x39, 1, Access::READ_ONLY, "FIFO_STATUS"},
            {Register::TAP_SIGN, 0x3A, 1, Access::READ_ONLY, "TAP_SIGN"},
            {Register::ORIENT_CONF, 0x3B, 1, Access::READ_WRITE, "ORIENT_CONF"},
            {Register::ORIENT, 0x3C, 1, Access::READ_ONLY, "ORIENT"},
        }};

        constexpr uint8_t FIRST_RESERVED = 0x01;
        constexpr uint8_t LAST_RESERVED = 0x1C;

        constexpr uint8_t address(Register reg)
        {
            return static_cast<uint8_t>(reg);
        }

        /// @return Table entry for reg, or nullptr for a value outside the identifier set
        constexpr const RegisterInfo *find(Register reg)
        {
            for (const auto &info : MAP)
            {
                if (info.reg == reg)
                {
                    return &info;
                }
            }
            return nullptr;
        }

        constexpr bool isReadable(const RegisterInfo &info)
        {
            return info.access != Access::WRITE_ONLY;
        }

        constexpr bool isWritable(const RegisterInfo &info)
        {
            return info.access != Access::READ_ONLY;
        }

        /**
         * @brief Check the table against the hardware address layout
         *
         * Entries must be strictly ascending, match their identifier, stay
         * out of the reserved block and be one or two bytes wide.
         */
        constexpr bool isConsistent()
        {
            for (std::size_t i = 0; i < MAP.size(); ++i)
            {
                const RegisterInfo &info = MAP[i];
                if (info.address != address(info.reg))
                    return false;
                if (info.width != 1 && info.width != 2)
                    return false;
                if (info.address >= FIRST_RESERVED && info.address <= LAST_RESERVED)
                    return false;
                if (i > 0 && MAP[i - 1].address >= info.address)
                    return false;
            }
            return true;
        }

        static_assert(isConsistent(), "ADXL345 register table does not match the device address map");
    }

    /**
     * @brief ADXL345 constants and register bit fields
     */
    namespace constants
    {
        // Device identification
        constexpr uint8_t DEVID_ADXL345 = 0xE5;
        constexpr uint8_t DEVID_ADXL346 = 0xE6;

        // Data registers
        constexpr std::size_t AXIS_DATA_BYTES = 6; // DATAX0..DATAZ1
        constexpr std::size_t OFFSET_BYTES = 3;    // OFSX..OFSZ

        // POWER_CTL
        constexpr uint8_t POWER_CTL_LINK = 0x20;
        constexpr uint8_t POWER_CTL_AUTO_SLEEP = 0x10;
        constexpr uint8_t POWER_CTL_MEASURE = 0x08;
        constexpr uint8_t POWER_CTL_SLEEP = 0x04;
        constexpr uint8_t POWER_CTL_WAKEUP_MASK = 0x03;

        // BW_RATE
        constexpr uint8_t BW_RATE_LOW_POWER = 0x10;
        constexpr uint8_t BW_RATE_RATE_MASK = 0x0F;

        // DATA_FORMAT
        constexpr uint8_t DATA_FORMAT_SELF_TEST = 0x80;
        constexpr uint8_t DATA_FORMAT_SPI = 0x40;
        constexpr uint8_t DATA_FORMAT_INT_INVERT = 0x20;
        constexpr uint8_t DATA_FORMAT_FULL_RES = 0x08;
        constexpr uint8_t DATA_FORMAT_JUSTIFY = 0x04;
        constexpr uint8_t DATA_FORMAT_RANGE_MASK = 0x03;

        // FIFO_CTL / FIFO_STATUS
        constexpr uint8_t FIFO_CTL_MODE_SHIFT = 6;
        constexpr uint8_t FIFO_CTL_TRIGGER = 0x20;
        constexpr uint8_t FIFO_CTL_SAMPLES_MASK = 0x1F;
        constexpr uint8_t FIFO_STATUS_TRIGGERED = 0x80;
        constexpr uint8_t FIFO_STATUS_ENTRIES_MASK = 0x3F;

        // INT_ENABLE / INT_MAP / INT_SOURCE
        constexpr uint8_t INT_DATA_READY = 0x80;
        constexpr uint8_t INT_SINGLE_TAP = 0x40;
        constexpr uint8_t INT_DOUBLE_TAP = 0x20;
        constexpr uint8_t INT_ACTIVITY = 0x10;
        constexpr uint8_t INT_INACTIVITY = 0x08;
        constexpr uint8_t INT_FREE_FALL = 0x04;
        constexpr uint8_t INT_WATERMARK = 0x02;
        constexpr uint8_t INT_OVERRUN = 0x01;

        // TAP_AXES (see TapMode)
        constexpr uint8_t TAP_AXES_MASK = 0x0F;

        // Register scale factors, for callers converting thresholds
        constexpr float THRESH_MG_PER_LSB = 62.5f;     // THRESH_TAP, THRESH_ACT, THRESH_INACT, THRESH_FF
        constexpr float OFFSET_MG_PER_LSB = 15.6f;     // OFSX, OFSY, OFSZ
        constexpr float DUR_US_PER_LSB = 625.0f;       // DUR
        constexpr float LATENT_MS_PER_LSB = 1.25f;     // LATENT, WINDOW
        constexpr float TIME_FF_MS_PER_LSB = 5.0f;     // TIME_FF
        constexpr float TIME_INACT_S_PER_LSB = 1.0f;   // TIME_INACT
    }

    /// Measurement range (DATA_FORMAT bits 1:0)
    enum class Range : uint8_t
    {
        RANGE_2G = 0,
        RANGE_4G = 1,
        RANGE_8G = 2,
        RANGE_16G = 3
    };

    /// Output data rate (BW_RATE bits 3:0)
    enum class DataRate : uint8_t
    {
        HZ_0_10 = 0x0,
        HZ_0_20 = 0x1,
        HZ_0_39 = 0x2,
        HZ_0_78 = 0x3,
        HZ_1_56 = 0x4,
        HZ_3_13 = 0x5,
        HZ_6_25 = 0x6,
        HZ_12_5 = 0x7,
        HZ_25 = 0x8,
        HZ_50 = 0x9,
        HZ_100 = 0xA,
        HZ_200 = 0xB,
        HZ_400 = 0xC,
        HZ_800 = 0xD,
        HZ_1600 = 0xE,
        HZ_3200 = 0xF
    };

    /// Sampling frequency while in sleep mode (POWER_CTL bits 1:0)
    enum class WakeupRate : uint8_t
    {
        HZ_8 = 0,
        HZ_4 = 1,
        HZ_2 = 2,
        HZ_1 = 3
    };

    /// FIFO_CTL bits 7:6
    enum class FifoMode : uint8_t
    {
        BYPASS = 0,
        FIFO = 1,
        STREAM = 2,
        TRIGGER = 3
    };

    /// TAP_AXES bit flags
    namespace TapMode
    {
        constexpr uint8_t SUPPRESS = 0x08; ///< Suppress double tap if acceleration exceeds threshold between taps
        constexpr uint8_t X_ENABLE = 0x04;
        constexpr uint8_t Y_ENABLE = 0x02;
        constexpr uint8_t Z_ENABLE = 0x01;
    }

    /// ACT_INACT_CTL bit flags
    namespace ActivityMode
    {
        constexpr uint8_t ACT_AC = 0x80;
        constexpr uint8_t ACT_X_ENABLE = 0x40;
        constexpr uint8_t ACT_Y_ENABLE = 0x20;
        constexpr uint8_t ACT_Z_ENABLE = 0x10;
        constexpr uint8_t INACT_AC = 0x08;
        constexpr uint8_t INACT_X_ENABLE = 0x04;
        constexpr uint8_t INACT_Y_ENABLE = 0x02;
        constexpr uint8_t INACT_Z_ENABLE = 0x01;
    }

    /// POWER_CTL fields other than the measure bit
    struct PowerControl
    {
        bool link = false;
        bool autoSleep = false;
        bool sleep = false;
        WakeupRate wakeup = WakeupRate::HZ_8;
    };

    /// DATA_FORMAT fields other than range and resolution
    struct DataFormatFlags
    {
        bool selfTest = false;
        bool spi3Wire = false;
        bool intInvert = false;  ///< Interrupts active low
        bool justifyLeft = false; ///< MSB-aligned output
    };

    /// Decoded DATA_FORMAT register
    struct DataFormat
    {
        Range range = Range::RANGE_2G;
        bool fullResolution = false;
        DataFormatFlags flags{};
    };

    /// Raw axis counts as stored in DATAX0..DATAZ1
    struct RawAxes
    {
        int16_t x = 0;
        int16_t y = 0;
        int16_t z = 0;
    };

    /// Acceleration in m/s²
    struct Acceleration
    {
        double x = 0.0;
        double y = 0.0;
        double z = 0.0;
    };

    constexpr bool isValid(Range range)
    {
        return static_cast<uint8_t>(range) <= static_cast<uint8_t>(Range::RANGE_16G);
    }

    constexpr bool isValid(DataRate rate)
    {
        return static_cast<uint8_t>(rate) <= static_cast<uint8_t>(DataRate::HZ_3200);
    }

    constexpr bool isValid(WakeupRate rate)
    {
        return static_cast<uint8_t>(rate) <= static_cast<uint8_t>(WakeupRate::HZ_1);
    }

    constexpr bool isValid(FifoMode mode)
    {
        return static_cast<uint8_t>(mode) <= static_cast<uint8_t>(FifoMode::TRIGGER);
    }

    /// Advisory wiring check for the value returned by ADXL345::readDeviceId()
    constexpr bool isKnownDeviceId(uint8_t id)
    {
        return id == constants::DEVID_ADXL345 || id == constants::DEVID_ADXL346;
    }

    /// g-range magnitude in g (2, 4, 8 or 16)
    constexpr int rangeInG(Range range)
    {
        return 2 << static_cast<uint8_t>(range);
    }

} // namespace adxl345
