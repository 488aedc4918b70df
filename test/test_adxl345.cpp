#include "adxl345.hpp"
#include "FakeRegisterBus.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <optional>

using namespace adxl345;
using adxl345::test::FakeRegisterBus;

namespace
{
    class ADXL345Test : public ::testing::Test
    {
    protected:
        ADXL345Test()
        {
            auto fake = std::make_unique<FakeRegisterBus>();
            bus = fake.get();
            driver = std::make_unique<ADXL345>(std::move(fake));
        }

        uint8_t reg(Register r) const { return bus->regs[registers::address(r)]; }
        void setReg(Register r, uint8_t value) { bus->regs[registers::address(r)] = value; }

        FakeRegisterBus *bus = nullptr;
        std::unique_ptr<ADXL345> driver;
    };
}

// === Lifecycle ===

TEST_F(ADXL345Test, StartsUninitialized)
{
    EXPECT_EQ(driver->state(), DriverState::UNINITIALIZED);
    EXPECT_EQ(bus->callCount(), 0u);
}

TEST_F(ADXL345Test, StateFollowsSuccessfulCalls)
{
    ASSERT_EQ(driver->setDataFormat(Range::RANGE_2G, false), ESP_OK);
    EXPECT_EQ(driver->state(), DriverState::CONFIGURED);

    ASSERT_EQ(driver->setPowerControl(true), ESP_OK);
    EXPECT_EQ(driver->state(), DriverState::STREAMING);

    // A data format change while measuring keeps streaming
    ASSERT_EQ(driver->setDataFormat(Range::RANGE_4G, false), ESP_OK);
    EXPECT_EQ(driver->state(), DriverState::STREAMING);

    ASSERT_EQ(driver->standby(), ESP_OK);
    EXPECT_EQ(driver->state(), DriverState::CONFIGURED);
    EXPECT_EQ(reg(Register::POWER_CTL), 0x00);
}

TEST_F(ADXL345Test, FailedCallLeavesStateUnchanged)
{
    bus->failOnCall = 0;
    EXPECT_EQ(driver->setPowerControl(true), ESP_FAIL);
    EXPECT_EQ(driver->state(), DriverState::UNINITIALIZED);
}

TEST(ADXL345NoBus, OperationsReportInvalidState)
{
    ADXL345 driver(nullptr);
    uint8_t id = 0;
    EXPECT_EQ(driver.readDeviceId(id), ESP_ERR_INVALID_STATE);
    EXPECT_EQ(driver.setPowerControl(true), ESP_ERR_INVALID_STATE);
    EXPECT_EQ(driver.state(), DriverState::UNINITIALIZED);
}

// === Power and data rate ===

TEST_F(ADXL345Test, PowerControlEncodesAllFields)
{
    PowerControl flags;
    flags.link = true;
    flags.autoSleep = true;
    flags.sleep = true;
    flags.wakeup = WakeupRate::HZ_2;
    ASSERT_EQ(driver->setPowerControl(true, flags), ESP_OK);
    EXPECT_EQ(reg(Register::POWER_CTL), 0x20 | 0x10 | 0x08 | 0x04 | 0x02);

    bool measure = false;
    PowerControl read;
    ASSERT_EQ(driver->readPowerControl(measure, read), ESP_OK);
    EXPECT_TRUE(measure);
    EXPECT_TRUE(read.link);
    EXPECT_TRUE(read.autoSleep);
    EXPECT_TRUE(read.sleep);
    EXPECT_EQ(read.wakeup, WakeupRate::HZ_2);
}

TEST_F(ADXL345Test, InvalidWakeupRateIsRejectedWithoutBusAccess)
{
    PowerControl flags;
    flags.wakeup = static_cast<WakeupRate>(4);
    EXPECT_EQ(driver->setPowerControl(true, flags), ESP_ERR_INVALID_ARG);
    EXPECT_EQ(bus->callCount(), 0u);
}

TEST_F(ADXL345Test, DataRateAndLowPower)
{
    ASSERT_EQ(driver->setDataRate(DataRate::HZ_100, true), ESP_OK);
    EXPECT_EQ(reg(Register::BW_RATE), 0x1A);

    DataRate rate = DataRate::HZ_0_10;
    bool lowPower = false;
    ASSERT_EQ(driver->readDataRate(rate, lowPower), ESP_OK);
    EXPECT_EQ(rate, DataRate::HZ_100);
    EXPECT_TRUE(lowPower);

    EXPECT_EQ(driver->setDataRate(static_cast<DataRate>(0x10)), ESP_ERR_INVALID_ARG);
    EXPECT_EQ(bus->callCount(), 2u);
}

// === Data format ===

TEST_F(ADXL345Test, DataFormatEncodesAndDecodes)
{
    DataFormatFlags flags;
    flags.intInvert = true;
    flags.justifyLeft = true;
    ASSERT_EQ(driver->setDataFormat(Range::RANGE_16G, true, flags), ESP_OK);
    EXPECT_EQ(reg(Register::DATA_FORMAT), 0x20 | 0x08 | 0x04 | 0x03);

    DataFormat format;
    ASSERT_EQ(driver->readDataFormat(format), ESP_OK);
    EXPECT_EQ(format.range, Range::RANGE_16G);
    EXPECT_TRUE(format.fullResolution);
    EXPECT_TRUE(format.flags.intInvert);
    EXPECT_TRUE(format.flags.justifyLeft);
    EXPECT_FALSE(format.flags.selfTest);
    EXPECT_FALSE(format.flags.spi3Wire);
}

TEST_F(ADXL345Test, DataFormatRewritesThreeWireBit)
{
    DataFormatFlags threeWire;
    threeWire.spi3Wire = true;
    ASSERT_EQ(driver->setDataFormat(Range::RANGE_8G, false, threeWire), ESP_OK);
    EXPECT_EQ(reg(Register::DATA_FORMAT), 0x40 | 0x02);

    // Default flags clear the SPI bit along with everything else
    ASSERT_EQ(driver->setDataFormat(Range::RANGE_8G, false), ESP_OK);
    EXPECT_EQ(reg(Register::DATA_FORMAT), 0x02);
}

TEST_F(ADXL345Test, InvalidRangeIsRejectedWithoutBusAccess)
{
    EXPECT_EQ(driver->setDataFormat(static_cast<Range>(4), true), ESP_ERR_INVALID_ARG);
    EXPECT_EQ(bus->callCount(), 0u);
    EXPECT_EQ(driver->state(), DriverState::UNINITIALIZED);
}

// === Offsets ===

TEST_F(ADXL345Test, SetOffsetIsOneBurstWrite)
{
    ASSERT_EQ(driver->setOffset(1, -1, -128), ESP_OK);
    ASSERT_EQ(bus->transactions.size(), 1u);
    const auto &t = bus->transactions[0];
    EXPECT_FALSE(t.isRead);
    EXPECT_EQ(t.regAddr, 0x1E);
    EXPECT_EQ(t.bytes, (std::vector<uint8_t>{0x01, 0xFF, 0x80}));

    int8_t x = 0, y = 0, z = 0;
    ASSERT_EQ(driver->readOffset(x, y, z), ESP_OK);
    EXPECT_EQ(x, 1);
    EXPECT_EQ(y, -1);
    EXPECT_EQ(z, -128);
}

TEST_F(ADXL345Test, OffsetAdjustmentWritesOnlyGivenAxes)
{
    setReg(Register::OFSX, 0x11);
    setReg(Register::OFSY, 0x22);
    setReg(Register::OFSZ, 0x33);

    ASSERT_EQ(driver->setOffsetAdjustment(std::nullopt, -2, std::nullopt), ESP_OK);
    ASSERT_EQ(bus->transactions.size(), 1u);
    EXPECT_EQ(bus->transactions[0].regAddr, 0x1F);
    EXPECT_EQ(reg(Register::OFSX), 0x11);
    EXPECT_EQ(reg(Register::OFSY), 0xFE);
    EXPECT_EQ(reg(Register::OFSZ), 0x33);

    ASSERT_EQ(driver->setOffsetAdjustment(std::nullopt, std::nullopt, std::nullopt), ESP_OK);
    EXPECT_EQ(bus->callCount(), 1u);
}

// === Detection settings ===

TEST_F(ADXL345Test, SetTapWritesThresholdThenTiming)
{
    ASSERT_EQ(driver->setTap(0x30, 0x10, 0x20, 0xF0), ESP_OK);
    EXPECT_EQ(reg(Register::THRESH_TAP), 0x30);
    EXPECT_EQ(reg(Register::DUR), 0x10);
    EXPECT_EQ(reg(Register::LATENT), 0x20);
    EXPECT_EQ(reg(Register::WINDOW), 0xF0);
}

TEST_F(ADXL345Test, TransportFailureStopsMultiRegisterWrite)
{
    bus->failOnCall = 0;
    bus->failCode = ESP_ERR_TIMEOUT;
    EXPECT_EQ(driver->setTap(0x30, 0x10, 0x20, 0xF0), ESP_ERR_TIMEOUT);
    EXPECT_EQ(bus->callCount(), 1u);
    EXPECT_EQ(reg(Register::DUR), 0x00);
}

TEST_F(ADXL345Test, TapControlRejectsUnknownBits)
{
    ASSERT_EQ(driver->tapControl(TapMode::SUPPRESS | TapMode::Z_ENABLE), ESP_OK);
    EXPECT_EQ(reg(Register::TAP_AXES), 0x09);

    EXPECT_EQ(driver->tapControl(0x10), ESP_ERR_INVALID_ARG);
    EXPECT_EQ(bus->callCount(), 1u);
}

TEST_F(ADXL345Test, ActivityInactivityAndFreeFall)
{
    ASSERT_EQ(driver->setActivity(0x08), ESP_OK);
    ASSERT_EQ(driver->setInactivity(0x04, 5), ESP_OK);
    ASSERT_EQ(driver->activityControl(ActivityMode::ACT_AC | ActivityMode::ACT_X_ENABLE | ActivityMode::INACT_Z_ENABLE), ESP_OK);
    ASSERT_EQ(driver->setFreeFall(0x07, 0x28), ESP_OK);

    EXPECT_EQ(reg(Register::THRESH_ACT), 0x08);
    EXPECT_EQ(reg(Register::THRESH_INACT), 0x04);
    EXPECT_EQ(reg(Register::TIME_INACT), 5);
    EXPECT_EQ(reg(Register::ACT_INACT_CTL), 0xC1);
    EXPECT_EQ(reg(Register::THRESH_FF), 0x07);
    EXPECT_EQ(reg(Register::TIME_FF), 0x28);
}

// === Interrupts and FIFO ===

TEST_F(ADXL345Test, InterruptRegisters)
{
    ASSERT_EQ(driver->setInterruptEnable(constants::INT_DATA_READY | constants::INT_WATERMARK), ESP_OK);
    ASSERT_EQ(driver->setInterruptMap(constants::INT_WATERMARK), ESP_OK);
    EXPECT_EQ(reg(Register::INT_ENABLE), 0x82);
    EXPECT_EQ(reg(Register::INT_MAP), 0x02);

    setReg(Register::INT_SOURCE, 0x83);
    setReg(Register::ACT_TAP_STATUS, 0x44);
    uint8_t source = 0, status = 0;
    ASSERT_EQ(driver->readInterruptSource(source), ESP_OK);
    ASSERT_EQ(driver->readActTapStatus(status), ESP_OK);
    EXPECT_EQ(source, 0x83);
    EXPECT_EQ(status, 0x44);
}

TEST_F(ADXL345Test, FifoControlAndStatus)
{
    ASSERT_EQ(driver->setFifoControl(FifoMode::STREAM, true, 31), ESP_OK);
    EXPECT_EQ(reg(Register::FIFO_CTL), 0x80 | 0x20 | 0x1F);

    EXPECT_EQ(driver->setFifoControl(FifoMode::FIFO, false, 32), ESP_ERR_INVALID_ARG);
    EXPECT_EQ(driver->setFifoControl(static_cast<FifoMode>(4), false, 0), ESP_ERR_INVALID_ARG);
    EXPECT_EQ(bus->callCount(), 1u);

    setReg(Register::FIFO_STATUS, 0x80 | 0x21);
    uint8_t entries = 0;
    bool triggered = false;
    ASSERT_EQ(driver->readFifoStatus(entries, triggered), ESP_OK);
    EXPECT_EQ(entries, 33);
    EXPECT_TRUE(triggered);
}

// === Generic register access ===

TEST_F(ADXL345Test, GenericAccessHonorsAccessMode)
{
    EXPECT_EQ(driver->writeRegister(Register::DEVID, 0x00), ESP_ERR_INVALID_ARG);
    EXPECT_EQ(driver->writeRegister(Register::DATAX0, 0x00), ESP_ERR_INVALID_ARG);
    EXPECT_EQ(driver->writeRegister(Register::INT_SOURCE, 0x00), ESP_ERR_INVALID_ARG);
    EXPECT_EQ(bus->callCount(), 0u);

    ASSERT_EQ(driver->writeRegister(Register::THRESH_ACT, 0x42), ESP_OK);
    uint8_t value = 0;
    ASSERT_EQ(driver->readRegister(Register::THRESH_ACT, value), ESP_OK);
    EXPECT_EQ(value, 0x42);
}

TEST_F(ADXL345Test, GenericAccessRejectsUnknownRegister)
{
    uint8_t value = 0;
    EXPECT_EQ(driver->readRegister(static_cast<Register>(0x05), value), ESP_ERR_INVALID_ARG);
    EXPECT_EQ(driver->writeRegister(static_cast<Register>(0x3F), 0x00), ESP_ERR_INVALID_ARG);
    EXPECT_EQ(bus->callCount(), 0u);
}

// === Data ===

TEST_F(ADXL345Test, DeviceIdIsPassedThrough)
{
    uint8_t id = 0;
    setReg(Register::DEVID, 0xE5);
    ASSERT_EQ(driver->readDeviceId(id), ESP_OK);
    EXPECT_EQ(id, 0xE5);
    EXPECT_TRUE(isKnownDeviceId(id));

    setReg(Register::DEVID, 0x00);
    ASSERT_EQ(driver->readDeviceId(id), ESP_OK);
    EXPECT_EQ(id, 0x00);
    EXPECT_FALSE(isKnownDeviceId(id));

    setReg(Register::DEVID, 0xE6);
    ASSERT_EQ(driver->readDeviceId(id), ESP_OK);
    EXPECT_TRUE(isKnownDeviceId(id));
}

TEST_F(ADXL345Test, RawAxesAreOneBurstRead)
{
    const uint8_t sample[] = {0x10, 0x00, 0x20, 0x00, 0x30, 0x00};
    for (std::size_t i = 0; i < sizeof(sample); ++i)
    {
        bus->regs[0x32 + i] = sample[i];
    }

    RawAxes raw;
    ASSERT_EQ(driver->readRawAxes(raw), ESP_OK);
    EXPECT_EQ(raw.x, 16);
    EXPECT_EQ(raw.y, 32);
    EXPECT_EQ(raw.z, 48);

    ASSERT_EQ(bus->transactions.size(), 1u);
    EXPECT_TRUE(bus->transactions[0].isRead);
    EXPECT_EQ(bus->transactions[0].regAddr, 0x32);
    EXPECT_EQ(bus->transactions[0].bytes.size(), 6u);
}

TEST_F(ADXL345Test, FailedBurstLeavesOutputUntouched)
{
    bus->failOnCall = 0;
    bus->failCode = ESP_ERR_TIMEOUT;
    RawAxes raw{7, 8, 9};
    EXPECT_EQ(driver->readRawAxes(raw), ESP_ERR_TIMEOUT);
    EXPECT_EQ(raw.x, 7);
    EXPECT_EQ(raw.y, 8);
    EXPECT_EQ(raw.z, 9);
}

TEST_F(ADXL345Test, ReadAccelerationRereadsDataFormat)
{
    // 250 counts on z, full resolution +/-16g
    bus->regs[0x36] = 0xFA;
    bus->regs[0x37] = 0x00;
    setReg(Register::DATA_FORMAT, 0x0B);

    Acceleration accel;
    ASSERT_EQ(driver->readAcceleration(accel), ESP_OK);
    EXPECT_EQ(accel.x, 0.0);
    EXPECT_EQ(accel.y, 0.0);
    EXPECT_NEAR(accel.z, STANDARD_GRAVITY, 1e-9);

    ASSERT_EQ(bus->transactions.size(), 2u);
    EXPECT_EQ(bus->transactions[0].regAddr, 0x32);
    EXPECT_EQ(bus->transactions[1].regAddr, 0x31);
}

TEST_F(ADXL345Test, ReadAccelerationWithKnownFormatSkipsReread)
{
    bus->regs[0x32] = 0x64; // 100 counts on x

    DataFormat format;
    format.range = Range::RANGE_2G;
    Acceleration accel;
    ASSERT_EQ(driver->readAcceleration(format, accel), ESP_OK);
    EXPECT_NEAR(accel.x, 100 * 0.0039 * STANDARD_GRAVITY, 1e-9);
    EXPECT_EQ(bus->callCount(), 1u);

    format.range = static_cast<Range>(9);
    EXPECT_EQ(driver->readAcceleration(format, accel), ESP_ERR_INVALID_ARG);
    EXPECT_EQ(bus->callCount(), 1u);
}

TEST_F(ADXL345Test, DataFormatReadFailureSurfacesFromReadAcceleration)
{
    bus->failOnCall = 1;
    bus->failCode = ESP_ERR_INVALID_RESPONSE;
    Acceleration accel;
    EXPECT_EQ(driver->readAcceleration(accel), ESP_ERR_INVALID_RESPONSE);
    EXPECT_EQ(bus->callCount(), 2u);
}
