#pragma once

#include "adxl345-defs.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace adxl345
{

    /// Standard gravity in m/s²
    constexpr double STANDARD_GRAVITY = 9.80665;

    struct ScaleEntry
    {
        bool fullResolution;
        Range range;
        double mgPerLsb;
    };

    /**
     * @brief Output scale factors in mg/LSB
     *
     * Full-resolution mode keeps 4 mg/LSB for every range by widening the
     * output word. In 10-bit mode the scale doubles with each range step.
     */
    inline constexpr std::array<ScaleEntry, 8> SCALE_TABLE{{
        {true, Range::RANGE_2G, 4.0},
        {true, Range::RANGE_4G, 4.0},
        {true, Range::RANGE_8G, 4.0},
        {true, Range::RANGE_16G, 4.0},
        {false, Range::RANGE_2G, 3.9},
        {false, Range::RANGE_4G, 7.8},
        {false, Range::RANGE_8G, 15.6},
        {false, Range::RANGE_16G, 31.2},
    }};

    /**
     * @brief Look up the output scale for a resolution/range pair
     * @return Scale in mg/LSB, or 0.0 when range is not a valid Range value
     */
    constexpr double scaleMgPerLsb(bool fullResolution, Range range)
    {
        for (const auto &entry : SCALE_TABLE)
        {
            if (entry.fullResolution == fullResolution && entry.range == range)
            {
                return entry.mgPerLsb;
            }
        }
        return 0.0;
    }

    /// Convert one raw count to m/s² using a scale in mg/LSB
    constexpr double toMetersPerSecondSquared(int16_t raw, double mgPerLsb)
    {
        return static_cast<double>(raw) * ((mgPerLsb / 1000.0) * STANDARD_GRAVITY);
    }

    /// Significant output bits for a data format (10 in 10-bit mode, 10-13 in full resolution)
    constexpr int outputBits(const DataFormat &format)
    {
        return format.fullResolution ? 10 + static_cast<int>(format.range) : 10;
    }

    /**
     * @brief Bring a raw count into right-justified form
     *
     * With the justify bit set the device aligns the sample to the MSB of
     * the 16-bit word; the count is shifted back down keeping its sign.
     */
    int16_t rightJustify(int16_t raw, const DataFormat &format);

    /// Decode DATAX0..DATAZ1 (little-endian, two's complement)
    RawAxes decodeAxes(std::span<const std::byte, constants::AXIS_DATA_BYTES> bytes);

    /**
     * @brief Convert raw counts to m/s² for the given data format
     *
     * No argument checking: a format.range outside the four Range values has
     * no scale and yields 0.0 on every axis. Check isValid(format.range)
     * first when the format did not come from the device.
     */
    Acceleration convert(const RawAxes &raw, const DataFormat &format);

} // namespace adxl345
