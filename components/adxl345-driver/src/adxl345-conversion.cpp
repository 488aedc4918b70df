#include "adxl345-conversion.hpp"

namespace adxl345
{

    namespace
    {
        int16_t decodeWord(std::byte low, std::byte high)
        {
            const uint16_t word = static_cast<uint16_t>(std::to_integer<uint8_t>(low)) |
                                  static_cast<uint16_t>(std::to_integer<uint8_t>(high) << 8);
            return static_cast<int16_t>(word);
        }
    }

    int16_t rightJustify(int16_t raw, const DataFormat &format)
    {
        if (!format.flags.justifyLeft)
        {
            return raw;
        }
        // Arithmetic shift keeps the sign of negative samples
        return static_cast<int16_t>(raw >> (16 - outputBits(format)));
    }

    RawAxes decodeAxes(std::span<const std::byte, constants::AXIS_DATA_BYTES> bytes)
    {
        RawAxes raw;
        raw.x = decodeWord(bytes[0], bytes[1]);
        raw.y = decodeWord(bytes[2], bytes[3]);
        raw.z = decodeWord(bytes[4], bytes[5]);
        return raw;
    }

    Acceleration convert(const RawAxes &raw, const DataFormat &format)
    {
        const double scale = scaleMgPerLsb(format.fullResolution, format.range);

        Acceleration accel;
        accel.x = toMetersPerSecondSquared(rightJustify(raw.x, format), scale);
        accel.y = toMetersPerSecondSquared(rightJustify(raw.y, format), scale);
        accel.z = toMetersPerSecondSquared(rightJustify(raw.z, format), scale);
        return accel;
    }

} // namespace adxl345
