// Tessera Core Tests
// logger_test.cpp - Logger and error name unit tests

#include <gtest/gtest.h>

#include <tessera/core/config.hpp>
#include <tessera/core/error.hpp>
#include <tessera/core/logger.hpp>

namespace tessera::core::test {

TEST(LogLevelTest, ParsesKnownNames) {
    EXPECT_EQ(parse_log_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("info"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_EQ(parse_log_level("critical"), LogLevel::Critical);
    EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
    EXPECT_FALSE(parse_log_level("loud").has_value());
}

TEST(LogLevelTest, NamesParseBack) {
    for (LogLevel level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error,
                           LogLevel::Critical, LogLevel::Off}) {
        EXPECT_EQ(parse_log_level(log_level_name(level)), level);
    }
}

TEST(LoggerConfigTest, ReadsLogLevelFromConfig) {
    Config config;
    EXPECT_EQ(LoggerConfig::from_config(config).console_level, LogLevel::Info);

    ASSERT_TRUE(config.load_from_string(R"({"debug": {"log_level": "error"}})"));
    EXPECT_EQ(LoggerConfig::from_config(config).console_level, LogLevel::Error);

    config.set_string(config_section::DEBUG, config_key::LOG_LEVEL, "warning");
    EXPECT_EQ(LoggerConfig::from_config(config).console_level, LogLevel::Warn);
}

TEST(LoggerConfigTest, UnknownLogLevelKeepsDefault) {
    Config config;
    config.set_string(config_section::DEBUG, config_key::LOG_LEVEL, "verbose");
    LoggerConfig result = LoggerConfig::from_config(config);
    EXPECT_EQ(result.console_level, LogLevel::Info);
    EXPECT_EQ(result.file_level, LogLevel::Debug);
}

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        LoggerConfig config;
        config.file_output = false;
        config.console_level = LogLevel::Warn;
        Logger::initialize(config);
    }

    void TearDown() override { Logger::shutdown(); }
};

TEST_F(LoggerTest, InitializeAndShutdown) {
    EXPECT_TRUE(Logger::is_initialized());
    Logger::shutdown();
    EXPECT_FALSE(Logger::is_initialized());
}

TEST_F(LoggerTest, CategoryLevelsOverrideGlobal) {
    Logger::set_global_level(LogLevel::Info);
    Logger::set_category_level(log_category::RENDERING, LogLevel::Error);

    EXPECT_EQ(Logger::get_global_level(), LogLevel::Info);
    EXPECT_EQ(Logger::get_category_level(log_category::RENDERING), LogLevel::Error);
    EXPECT_EQ(Logger::get_category_level(log_category::CONFIG), LogLevel::Info);
}

TEST_F(LoggerTest, MacrosFormatWithoutThrowing) {
    EXPECT_NO_THROW(TESSERA_LOG_INFO(log_category::CORE, "grid {}x{}", 80, 25));
    EXPECT_NO_THROW(TESSERA_LOG_WARN(log_category::RENDERING, "glyph {} remapped", 9999));
    EXPECT_NO_THROW(Logger::flush());
}

TEST(RenderErrorTest, NamesAndSuccess) {
    EXPECT_STREQ(render_error_name(RenderError::None), "None");
    EXPECT_STREQ(render_error_name(RenderError::OutOfBounds), "OutOfBounds");
    EXPECT_STREQ(render_error_name(RenderError::ResourceCreationFailed), "ResourceCreationFailed");
    EXPECT_STREQ(render_error_name(RenderError::MissingBinding), "MissingBinding");
    EXPECT_STREQ(render_error_name(RenderError::InvalidGlyphIndex), "InvalidGlyphIndex");

    static_assert(succeeded(RenderError::None));
    EXPECT_FALSE(succeeded(RenderError::MissingBinding));
}

}  // namespace tessera::core::test
