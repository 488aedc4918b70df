#pragma once

#include <cstddef>
#include <cstdint>

namespace adxl345
{

    /// 7-bit I2C device address selected by the ALT ADDRESS pin
    enum class I2CAddress : uint8_t
    {
        PRIMARY = 0x53,  // ALT ADDRESS low
        ALTERNATE = 0x1D // ALT ADDRESS high
    };

    namespace framing
    {

        namespace i2c
        {
            constexpr uint32_t MAX_CLOCK_HZ = 400000;

            constexpr bool isValidAddress(uint8_t addr)
            {
                return addr == static_cast<uint8_t>(I2CAddress::PRIMARY) ||
                       addr == static_cast<uint8_t>(I2CAddress::ALTERNATE);
            }

            /// Address byte for the write phase (R/W bit clear)
            constexpr uint8_t writeAddressByte(uint8_t addr7)
            {
                return static_cast<uint8_t>(addr7 << 1);
            }

            /// Address byte for the read phase (R/W bit set)
            constexpr uint8_t readAddressByte(uint8_t addr7)
            {
                return static_cast<uint8_t>((addr7 << 1) | 0x01);
            }
        }

        namespace spi
        {
            constexpr uint8_t READ_BIT = 0x80;
            constexpr uint8_t MULTI_BYTE_BIT = 0x40;
            constexpr uint8_t ADDRESS_MASK = 0x3F;

            constexpr uint8_t REQUIRED_MODE = 3; // CPOL = 1, CPHA = 1
            constexpr uint32_t MAX_CLOCK_HZ = 5000000;
            constexpr std::size_t MAX_TRANSFER_BYTES = 32;

            constexpr uint8_t readCommand(uint8_t regAddr, std::size_t len)
            {
                uint8_t cmd = static_cast<uint8_t>((regAddr & ADDRESS_MASK) | READ_BIT);
                if (len > 1)
                {
                    cmd |= MULTI_BYTE_BIT;
                }
                return cmd;
            }

            constexpr uint8_t writeCommand(uint8_t regAddr, std::size_t len)
            {
                uint8_t cmd = static_cast<uint8_t>(regAddr & ADDRESS_MASK);
                if (len > 1)
                {
                    cmd |= MULTI_BYTE_BIT;
                }
                return cmd;
            }
        }

    } // namespace framing

} // namespace adxl345
