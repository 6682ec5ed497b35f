/**
 * @file MockUtilityRunner.hpp
 * @brief Google Mock implementation of IUtilityRunner
 */

#pragma once

#include "devices/UtilityFallbackAccessor.hpp"
#include <gmock/gmock.h>

class MockUtilityRunner : public devices::IUtilityRunner {
public:
    MOCK_METHOD((std::expected<int, util::Error>), run,
                (const std::vector<std::string>& argv, const std::atomic<bool>& cancel_flag),
                (override));
    MOCK_METHOD(bool, is_available, (const std::string& program), (const, override));

    // Factory for a runner whose utility exists and exits with status 0
    static std::shared_ptr<MockUtilityRunner> CreateDefault() {
        auto mock = std::make_shared<testing::NiceMock<MockUtilityRunner>>();

        ON_CALL(*mock, is_available(testing::_)).WillByDefault(testing::Return(true));
        ON_CALL(*mock, run(testing::_, testing::_))
            .WillByDefault(testing::Return(std::expected<int, util::Error>{0}));

        return mock;
    }
};
