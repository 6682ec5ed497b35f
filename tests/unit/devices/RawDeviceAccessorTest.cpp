/**
 * @file RawDeviceAccessorTest.cpp
 * @brief Unit tests for RawDeviceAccessor over image files
 */

#include "devices/RawDeviceAccessor.hpp"

#include "fixtures/TestFixtures.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

class RawDeviceAccessorTest : public ::testing::Test {
protected:
    static constexpr size_t IMAGE_SIZE = 256 * 1'024;

    TempDirectory dir;
    TempImageFile image{dir, "disk.img", IMAGE_SIZE};

    DeviceInfo MakeDevice(uint64_t capacity = IMAGE_SIZE) const {
        DeviceInfo device;
        device.id = "img0";
        device.path = image.path().string();
        device.capacity_bytes = capacity;
        return device;
    }
};

// Test: an image file is detected as a direct, verifiable path
TEST_F(RawDeviceAccessorTest, DetectCapability_ImageFile) {
    devices::RawDeviceAccessor accessor(MakeDevice());

    auto caps = accessor.detect_capability();

    ASSERT_TRUE(caps.has_value()) << caps.error().message;
    EXPECT_EQ(caps->mode, AccessMode::DIRECT);
    EXPECT_TRUE(caps->addressable);
    EXPECT_TRUE(caps->can_verify);
}

// Test: data written through the accessor lands in the file
TEST_F(RawDeviceAccessorTest, WriteChunk_PersistsToFile) {
    devices::RawDeviceAccessor accessor(MakeDevice());
    ASSERT_TRUE(accessor.open().has_value());
    EXPECT_EQ(accessor.capacity(), IMAGE_SIZE);

    std::vector<uint8_t> data(8'192, 0x3C);
    ASSERT_TRUE(accessor.write_chunk(4'096, data).has_value());
    ASSERT_TRUE(accessor.flush().has_value());

    std::vector<uint8_t> back(data.size());
    ASSERT_TRUE(accessor.read_chunk(4'096, back).has_value());
    EXPECT_EQ(back, data);

    accessor.close();
    auto content = image.ReadAll();
    ASSERT_EQ(content.size(), IMAGE_SIZE);
    EXPECT_EQ(content[4'095], 0xA5);
    EXPECT_EQ(content[4'096], 0x3C);
    EXPECT_EQ(content[4'096 + 8'191], 0x3C);
    EXPECT_EQ(content[4'096 + 8'192], 0xA5);
}

// Test: writes beyond the capacity are refused
TEST_F(RawDeviceAccessorTest, WriteChunk_PastCapacity_OutOfRange) {
    devices::RawDeviceAccessor accessor(MakeDevice());
    ASSERT_TRUE(accessor.open().has_value());

    std::vector<uint8_t> data(1'024, 0x00);
    auto written = accessor.write_chunk(IMAGE_SIZE - 512, data);

    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().kind, util::ErrorKind::OUT_OF_RANGE);
}

// Test: the inventory capacity clamps the writable range
TEST_F(RawDeviceAccessorTest, Open_SmallerInventoryCapacity_Clamped) {
    devices::RawDeviceAccessor accessor(MakeDevice(64 * 1'024));
    ASSERT_TRUE(accessor.open().has_value());

    EXPECT_EQ(accessor.capacity(), 64u * 1'024);
}

// Test: a second exclusive open of the same image is a sharing violation
TEST_F(RawDeviceAccessorTest, Open_AlreadyLocked_AccessDenied) {
    devices::RawDeviceAccessor first(MakeDevice());
    devices::RawDeviceAccessor second(MakeDevice());
    ASSERT_TRUE(first.open().has_value());

    auto opened = second.open();

    ASSERT_FALSE(opened.has_value());
    EXPECT_EQ(opened.error().kind, util::ErrorKind::ACCESS_DENIED);
    EXPECT_FALSE(second.is_open());
}

// Test: zero_fill_device writes zeros across the whole capacity
TEST_F(RawDeviceAccessorTest, ZeroFillDevice_ZeroesImage) {
    devices::RawDeviceAccessor accessor(MakeDevice());
    ASSERT_TRUE(accessor.open().has_value());
    std::atomic<bool> cancel{false};

    ASSERT_TRUE(accessor.zero_fill_device(cancel).has_value());
    accessor.close();

    auto content = image.ReadAll();
    EXPECT_TRUE(std::all_of(content.begin(), content.end(), [](uint8_t b) { return b == 0; }));
}

// Test: a missing path is reported as an I/O problem, not as access denied
TEST_F(RawDeviceAccessorTest, DetectCapability_MissingPath_DeviceIo) {
    DeviceInfo device = MakeDevice();
    device.path = (dir.path() / "missing.img").string();
    devices::RawDeviceAccessor accessor(device);

    auto caps = accessor.detect_capability();

    ASSERT_FALSE(caps.has_value());
    EXPECT_EQ(caps.error().kind, util::ErrorKind::DEVICE_IO);
}

// Test: operations on a closed accessor fail cleanly
TEST_F(RawDeviceAccessorTest, WriteChunk_NotOpen_Fails) {
    devices::RawDeviceAccessor accessor(MakeDevice());
    std::vector<uint8_t> data(512, 0x00);

    auto written = accessor.write_chunk(0, data);

    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().kind, util::ErrorKind::DEVICE_IO);
}
