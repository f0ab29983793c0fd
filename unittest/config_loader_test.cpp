// ============================================================================
// CONFIG LOADER UNIT TESTS
// ============================================================================
// Tests for YAML configuration loading and validation
// ============================================================================

#include <gtest/gtest.h>
#include <eventwire/core/config/loader.hpp>
#include <eventwire/core/config/app_config.hpp>

// ============================================================================
// SUCCESSFUL LOADING TESTS
// ============================================================================

TEST(ConfigLoader, LoadValidConfiguration) {
    AppConfig::AppConfiguration config = ConfigLoader::loadConfig("config/config.yaml");

    // Verify basic app info
    EXPECT_EQ(config.app_name, "EventWire");
    EXPECT_EQ(config.version, "1.0.0");

    // Verify logging and reader config
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_EQ(config.reader.inputPath, "-");
    EXPECT_EQ(config.reader.chunkSize, 4096u);
    EXPECT_EQ(config.reader.maxFrameLength, 16777216u);
}

TEST(ConfigLoader, OptionalFieldsTakeDefaults) {
    AppConfig::AppConfiguration config = ConfigLoader::loadConfig("unittest/config/minimal.yaml");

    EXPECT_EQ(config.app_name, "EventWire");
    EXPECT_EQ(config.version, "0.0.0");
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_EQ(config.reader.inputPath, "-");
    EXPECT_EQ(config.reader.chunkSize, 3u);
    EXPECT_EQ(config.reader.maxFrameLength, 16u * 1024 * 1024);
}

// ============================================================================
// ERROR HANDLING TESTS
// ============================================================================

TEST(ConfigLoader, ThrowsOnFileNotFound) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("config/non_existent.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnMissingRequiredField) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/missing_field.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnInvalidFieldType) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/invalid_type.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnInvalidFieldValue) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/invalid_value.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnUnknownLogLevel) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/invalid_log_level.yaml"),
        std::runtime_error
    );
}
