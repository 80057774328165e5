#include <gtest/gtest.h>

#include <cstring>

#include "oepl/config.hpp"
#include "oepl/result.hpp"

using namespace oepl;

// ============================================================================
// DeviceAddress
// ============================================================================

TEST(DeviceAddressTest, ParsesAndLowercases) {
    const auto address = DeviceAddress::parse("3C:60:55:84:A0:4f");

    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->view(), "3c:60:55:84:a0:4f");
    EXPECT_STREQ(address->c_str(), "3c:60:55:84:a0:4f");
    EXPECT_FALSE(address->empty());
}

TEST(DeviceAddressTest, EqualityIgnoresInputCase) {
    EXPECT_EQ(*DeviceAddress::parse("AA:BB:CC:DD:EE:FF"), *DeviceAddress::parse("aa:bb:cc:dd:ee:ff"));
}

TEST(DeviceAddressTest, RejectsMalformedText) {
    EXPECT_FALSE(DeviceAddress::parse("").has_value());
    EXPECT_FALSE(DeviceAddress::parse("3c:60:55:84:a0").has_value());
    EXPECT_FALSE(DeviceAddress::parse("3c:60:55:84:a0:42:").has_value());
    EXPECT_FALSE(DeviceAddress::parse("3c-60-55-84-a0-42").has_value());
    EXPECT_FALSE(DeviceAddress::parse("3g:60:55:84:a0:42").has_value());
    EXPECT_FALSE(DeviceAddress::parse("3c:60:55:84:a0: 2").has_value());
}

TEST(DeviceAddressTest, DefaultIsEmpty) {
    const DeviceAddress address;
    EXPECT_TRUE(address.empty());
    EXPECT_EQ(std::strlen(address.c_str()), 0u);
}

// ============================================================================
// validateConfig
// ============================================================================

class ValidateConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.target = *DeviceAddress::parse("3c:60:55:84:a0:42");
    }

    UploadConfig config;
};

TEST_F(ValidateConfigTest, DefaultsWithTargetAreValid) {
    EXPECT_EQ(validateConfig(config), nullptr);
}

TEST_F(ValidateConfigTest, DefaultsMatchDeviceTolerances) {
    const UploadConfig defaults;
    EXPECT_EQ(defaults.data_type, 0x21);
    EXPECT_EQ(defaults.connect_retries, 200u);
    EXPECT_EQ(defaults.connect_retry_delay_ms, 1200u);
    EXPECT_EQ(defaults.mtu, 247);
    EXPECT_EQ(defaults.settle_delay_ms, 300u);
    EXPECT_EQ(defaults.notification_timeout_ms, 20000u);
    EXPECT_EQ(defaults.max_part_resends, 0u);
}

TEST_F(ValidateConfigTest, RequiresTarget) {
    config.target = {};
    EXPECT_NE(validateConfig(config), nullptr);
}

TEST_F(ValidateConfigTest, RequiresAtLeastOneConnectAttempt) {
    config.connect_retries = 0;
    EXPECT_NE(validateConfig(config), nullptr);
}

TEST_F(ValidateConfigTest, RejectsZeroTimeouts) {
    UploadConfig c = config;
    c.scan_duration_ms = 0;
    EXPECT_NE(validateConfig(c), nullptr);

    c = config;
    c.connect_timeout_ms = 0;
    EXPECT_NE(validateConfig(c), nullptr);

    c = config;
    c.notification_timeout_ms = 0;
    EXPECT_NE(validateConfig(c), nullptr);

    c = config;
    c.response_timeout_ms = 0;
    EXPECT_NE(validateConfig(c), nullptr);
}

TEST_F(ValidateConfigTest, MtuMustCarryOneBlockPart) {
    config.mtu = protocol::MAX_COMMAND_SIZE + 3;
    EXPECT_EQ(validateConfig(config), nullptr);

    config.mtu = protocol::MAX_COMMAND_SIZE + 2;
    EXPECT_NE(validateConfig(config), nullptr);
}

TEST_F(ValidateConfigTest, MtuCappedAtAttMaximum) {
    config.mtu = protocol::MAX_MTU;
    EXPECT_EQ(validateConfig(config), nullptr);

    config.mtu = protocol::MAX_MTU + 1;
    EXPECT_NE(validateConfig(config), nullptr);
}

// ============================================================================
// Result helpers
// ============================================================================

TEST(UploadResultTest, DefaultIsSuccess) {
    const UploadResult result;
    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.block_id, UploadResult::NO_ID);
    EXPECT_EQ(result.last_response, UploadResult::NO_ID);
}

TEST(UploadResultTest, OnlyTransientErrorsAreRetryable) {
    EXPECT_TRUE(isRetryable(UploadError::discovery_timeout));
    EXPECT_TRUE(isRetryable(UploadError::notification_timeout));
    EXPECT_TRUE(isRetryable(UploadError::protocol_error));
    EXPECT_FALSE(isRetryable(UploadError::none));
    EXPECT_FALSE(isRetryable(UploadError::invalid_config));
    EXPECT_FALSE(isRetryable(UploadError::cancelled));
}

TEST(UploadResultTest, NamesAreStable) {
    EXPECT_STREQ(errorName(UploadError::part_retry_exhausted), "part_retry_exhausted");
    EXPECT_STREQ(transportStatusName(TransportStatus::connect_failed), "connect_failed");
}
