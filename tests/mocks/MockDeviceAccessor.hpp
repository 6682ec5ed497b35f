/**
 * @file MockDeviceAccessor.hpp
 * @brief Google Mock implementations of the device access interfaces
 */

#pragma once

#include "devices/IDeviceAccessor.hpp"
#include <gmock/gmock.h>

class MockDeviceAccessor : public devices::IDeviceAccessor {
public:
    MOCK_METHOD((std::expected<devices::AccessCapabilities, util::Error>), detect_capability, (),
                (override));
    MOCK_METHOD((std::expected<void, util::Error>), open, (), (override));
    MOCK_METHOD((std::expected<void, util::Error>), write_chunk,
                (uint64_t offset, std::span<const uint8_t> data), (override));
    MOCK_METHOD((std::expected<void, util::Error>), read_chunk,
                (uint64_t offset, std::span<uint8_t> out), (override));
    MOCK_METHOD((std::expected<void, util::Error>), zero_fill_device,
                (const std::atomic<bool>& cancel_flag), (override));
    MOCK_METHOD((std::expected<void, util::Error>), flush, (), (override));
    MOCK_METHOD(void, close, (), (override));
    MOCK_METHOD(uint64_t, capacity, (), (const, override));
    MOCK_METHOD(AccessMode, mode, (), (const, override));
    MOCK_METHOD(bool, is_open, (), (const, override));
    MOCK_METHOD(bool, is_addressable, (), (const, override));

    // Factory for an accessor that denies raw access on detection
    static std::unique_ptr<MockDeviceAccessor> CreateDenied(uint64_t capacity) {
        auto mock = std::make_unique<testing::NiceMock<MockDeviceAccessor>>();

        ON_CALL(*mock, detect_capability())
            .WillByDefault(testing::Return(std::unexpected(
                util::Error::access_denied("Raw access denied by controller", EACCES))));
        ON_CALL(*mock, open())
            .WillByDefault(testing::Return(std::unexpected(
                util::Error::access_denied("Raw access denied by controller", EACCES))));
        ON_CALL(*mock, capacity()).WillByDefault(testing::Return(capacity));
        ON_CALL(*mock, mode()).WillByDefault(testing::Return(AccessMode::DIRECT));
        ON_CALL(*mock, is_addressable()).WillByDefault(testing::Return(true));

        return mock;
    }
};

class MockAccessorFactory : public devices::IAccessorFactory {
public:
    MOCK_METHOD(std::unique_ptr<devices::IDeviceAccessor>, create_raw, (const DeviceInfo& device),
                (override));
    MOCK_METHOD(std::unique_ptr<devices::IDeviceAccessor>, create_fallback,
                (const DeviceInfo& device), (override));
};
