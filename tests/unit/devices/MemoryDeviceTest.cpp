/**
 * @file MemoryDeviceTest.cpp
 * @brief Unit tests for MemoryDevice and its accessor
 */

#include "devices/MemoryDevice.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace {
constexpr uint64_t MiB = 1'024 * 1'024;
}

class MemoryDeviceTest : public ::testing::Test {
protected:
    std::shared_ptr<devices::MemoryDevice> device =
        std::make_shared<devices::MemoryDevice>(3 * MiB + 100, 0xA5);
    devices::MemoryDeviceAccessor accessor{device};

    void SetUp() override { ASSERT_TRUE(accessor.open().has_value()); }
};

// Test: writes spanning block boundaries read back unchanged
TEST_F(MemoryDeviceTest, WriteRead_AcrossBlockBoundary) {
    std::vector<uint8_t> data(4'096);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i * 7);
    }
    const uint64_t offset = MiB - 1'000;

    ASSERT_TRUE(accessor.write_chunk(offset, data).has_value());

    std::vector<uint8_t> back(data.size());
    ASSERT_TRUE(accessor.read_chunk(offset, back).has_value());
    EXPECT_EQ(back, data);
    EXPECT_EQ(device->byte_at(offset - 1), 0xA5);
    EXPECT_EQ(device->byte_at(offset + data.size()), 0xA5);
}

// Test: uniform writes keep statistics and content
TEST_F(MemoryDeviceTest, UniformWrites_TrackStatistics) {
    std::vector<uint8_t> zeros(MiB, 0x00);
    ASSERT_TRUE(accessor.write_chunk(0, zeros).has_value());
    ASSERT_TRUE(accessor.write_chunk(MiB, zeros).has_value());

    EXPECT_EQ(device->write_calls(), 2u);
    EXPECT_EQ(device->bytes_written(), 2 * MiB);
    EXPECT_TRUE(device->all_equal(0x00, 0, 2 * MiB));
    EXPECT_FALSE(device->all_equal(0x00));
}

// Test: out-of-range accesses are refused
TEST_F(MemoryDeviceTest, WriteChunk_PastCapacity_OutOfRange) {
    std::vector<uint8_t> data(200, 0x00);

    auto written = accessor.write_chunk(device->capacity() - 100, data);

    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().kind, util::ErrorKind::OUT_OF_RANGE);
    EXPECT_EQ(device->write_calls(), 0u);
}

// Test: a flipped byte is inverted once
TEST_F(MemoryDeviceTest, FlipByte_InvertsStoredByte) {
    device->fill(0x00);
    device->flip_byte(2 * MiB + 5);

    EXPECT_EQ(device->byte_at(2 * MiB + 5), 0xFF);
    EXPECT_TRUE(device->all_equal(0x00, 0, 2 * MiB + 5));
}

// Test: a stuck byte overrides whatever is written
TEST_F(MemoryDeviceTest, StuckByte_OverridesWrites) {
    device->set_stuck_byte(10, 0x11);
    std::vector<uint8_t> zeros(64, 0x00);
    ASSERT_TRUE(accessor.write_chunk(0, zeros).has_value());

    std::vector<uint8_t> back(64);
    ASSERT_TRUE(accessor.read_chunk(0, back).has_value());
    EXPECT_EQ(back[10], 0x11);
    EXPECT_EQ(back[9], 0x00);
}

// Test: injected write failures fire only for the targeted range
TEST_F(MemoryDeviceTest, InjectedWriteFailure_TargetsOffset) {
    device->inject_write_failures(1, false, MiB + 10);
    std::vector<uint8_t> data(MiB, 0x00);

    EXPECT_TRUE(accessor.write_chunk(0, data).has_value());
    auto failed = accessor.write_chunk(MiB, data);
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().kind, util::ErrorKind::DEVICE_IO);
    EXPECT_FALSE(failed.error().transient);
    EXPECT_TRUE(accessor.write_chunk(MiB, data).has_value());
}

// Test: a second accessor cannot open a locked device
TEST_F(MemoryDeviceTest, Open_SecondAccessor_AccessDenied) {
    devices::MemoryDeviceAccessor second{device};

    auto opened = second.open();

    ASSERT_FALSE(opened.has_value());
    EXPECT_EQ(opened.error().kind, util::ErrorKind::ACCESS_DENIED);

    accessor.close();
    EXPECT_TRUE(second.open().has_value());
}

// Test: a denied device refuses detection
TEST_F(MemoryDeviceTest, AccessDenied_DetectFails) {
    device->set_access_denied(true);
    devices::MemoryDeviceAccessor other{device};

    auto caps = other.detect_capability();

    ASSERT_FALSE(caps.has_value());
    EXPECT_EQ(caps.error().kind, util::ErrorKind::ACCESS_DENIED);
}

// Test: the factory knows only registered devices and has no fallback
TEST(MemoryAccessorFactoryTest, CreateRaw_UnknownDevice_Null) {
    devices::MemoryAccessorFactory factory;
    factory.add_device("sdb", std::make_shared<devices::MemoryDevice>(MiB));
    DeviceInfo known{.id = "sdb", .path = "memory://sdb", .capacity_bytes = MiB};
    DeviceInfo unknown{.id = "sdz", .path = "memory://sdz", .capacity_bytes = MiB};

    EXPECT_NE(factory.create_raw(known), nullptr);
    EXPECT_EQ(factory.create_raw(unknown), nullptr);
    EXPECT_EQ(factory.create_fallback(known), nullptr);
}
