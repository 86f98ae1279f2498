// ============================================================================
// CONFIG LOADER UNIT TESTS
// ============================================================================
// Tests for YAML configuration loading and validation
// ============================================================================

#include <gtest/gtest.h>
#include <hookstream/core/config/loader.hpp>
#include <hookstream/core/config/app_config.hpp>
#include <stdexcept>
#include <string>

using namespace HookStream;

#ifndef HOOKSTREAM_TEST_DATA_DIR
#define HOOKSTREAM_TEST_DATA_DIR "unittest"
#endif

static std::string dataPath(const std::string& relative) {
    return std::string(HOOKSTREAM_TEST_DATA_DIR) + "/" + relative;
}

// ============================================================================
// SUCCESSFUL LOADING TESTS
// ============================================================================

TEST(ConfigLoader, LoadValidConfiguration) {
    AppConfig::AppConfiguration config = ConfigLoader::loadConfig(dataPath("config/config.yaml"));

    EXPECT_EQ(config.app_name, "HookStreamCore");
    EXPECT_EQ(config.version, "1.0.0");

    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.preferred_port, 4100);
    EXPECT_EQ(config.server.fallback_port_start, 4101);
    EXPECT_EQ(config.server.fallback_port_end, 4105);
    EXPECT_EQ(config.server.worker_threads, 2u);

    EXPECT_EQ(config.storage.max_events, 200u);
    EXPECT_EQ(config.storage.recent_limit, 50u);

    EXPECT_EQ(config.notifier.subscriber, AppConfig::SubscriberKind::LOG);
    EXPECT_EQ(config.notifier.channel_capacity, 16u);
    EXPECT_EQ(config.logging.level, "debug");
}

TEST(ConfigLoader, MinimalConfigurationKeepsDefaults) {
    AppConfig::AppConfiguration config = ConfigLoader::loadConfig(dataPath("config/minimal.yaml"));

    EXPECT_EQ(config.server.preferred_port, 4000);
    EXPECT_EQ(config.server.fallback_port_start, 4001);
    EXPECT_EQ(config.server.fallback_port_end, 4010);
    EXPECT_EQ(config.storage.max_events, 1000u);
    EXPECT_EQ(config.storage.recent_limit, 500u);
    EXPECT_EQ(config.notifier.subscriber, AppConfig::SubscriberKind::STDOUT);
    EXPECT_EQ(config.logging.level, "info");
}

TEST(ConfigLoader, DefaultsPassValidation) {
    EXPECT_NO_THROW(ConfigLoader::validate(AppConfig::AppConfiguration{}));
}

// ============================================================================
// ERROR HANDLING TESTS
// ============================================================================

TEST(ConfigLoader, ThrowsOnFileNotFound) {
    EXPECT_THROW(
        ConfigLoader::loadConfig(dataPath("config/non_existent.yaml")),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnMissingRequiredField) {
    EXPECT_THROW(
        ConfigLoader::loadConfig(dataPath("invalidConfig/missing_field.yaml")),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnInvalidFieldType) {
    EXPECT_THROW(
        ConfigLoader::loadConfig(dataPath("invalidConfig/invalid_type.yaml")),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnInvalidFieldValue) {
    EXPECT_THROW(
        ConfigLoader::loadConfig(dataPath("invalidConfig/invalid_value.yaml")),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnNonLoopbackHost) {
    EXPECT_THROW(
        ConfigLoader::loadConfig(dataPath("invalidConfig/non_loopback.yaml")),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnEmptyFallbackRange) {
    EXPECT_THROW(
        ConfigLoader::loadConfig(dataPath("invalidConfig/empty_range.yaml")),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnUnknownSubscriber) {
    EXPECT_THROW(
        ConfigLoader::loadConfig(dataPath("invalidConfig/unknown_subscriber.yaml")),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsWhenRecentLimitExceedsCapacity) {
    EXPECT_THROW(
        ConfigLoader::loadConfig(dataPath("invalidConfig/recent_over_capacity.yaml")),
        std::runtime_error
    );
}

TEST(ConfigLoader, MissingFieldMessageNamesTheField) {
    try {
        ConfigLoader::loadConfig(dataPath("invalidConfig/missing_field.yaml"));
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("app_name"), std::string::npos);
    }
}
