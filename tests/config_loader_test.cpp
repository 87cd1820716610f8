#include "analyzer/config_loader/config_loader.hpp"
#include "analyzer/data_structures/analysis_errors.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using StockAdvisor::Config::SystemConfig;
using StockAdvisor::Core::ConfigError;
using StockAdvisor::Testing::TemporaryDirectory;

TEST(ConfigLoaderTest, DefaultConfigurationValidates) {
    SystemConfig config;
    std::string error_message;
    EXPECT_TRUE(validate_config(config, error_message)) << error_message;
}

TEST(ConfigLoaderTest, CsvOverridesOnlyListedKeys) {
    TemporaryDirectory config_directory("config_loader_override");
    std::string csv_path = config_directory.write_file("analysis_config.csv",
        "# comment line\n"
        "\n"
        "indicators.rsi_period,21\n"
        "indicators.sma_periods,10;30\n"
        "recommendation.technical_weight,0.7\n"
        "logging.file_logging_enabled,false\n");

    SystemConfig config;
    ASSERT_TRUE(load_config_from_csv(config, csv_path));
    EXPECT_EQ(config.indicators.rsi_period, 21);
    EXPECT_EQ(config.indicators.sma_periods, (std::vector<int>{10, 30}));
    EXPECT_DOUBLE_EQ(config.recommendation.technical_weight, 0.7);
    EXPECT_FALSE(config.logging.file_logging_enabled);
    EXPECT_EQ(config.indicators.macd_slow_period, 26);
}

TEST(ConfigLoaderTest, UnparsableValueThrowsConfigError) {
    TemporaryDirectory config_directory("config_loader_bad_value");
    std::string csv_path = config_directory.write_file("analysis_config.csv", "indicators.rsi_period,fourteen\n");

    SystemConfig config;
    EXPECT_THROW(load_config_from_csv(config, csv_path), ConfigError);
}

TEST(ConfigLoaderTest, LoadSystemConfigReportsTheBadKeyAndLine) {
    TemporaryDirectory config_directory("config_loader_bad_system_value");
    config_directory.write_file("analysis_config.csv",
        "# periods\n"
        "indicators.rsi_period,abc\n");

    SystemConfig config;
    try {
        load_system_config(config, config_directory.path());
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& config_error) {
        std::string error_text = config_error.what();
        EXPECT_NE(error_text.find("indicators.rsi_period"), std::string::npos);
        EXPECT_NE(error_text.find(":2"), std::string::npos);
    }
}

TEST(ConfigLoaderTest, BooleanValuesIgnoreCase) {
    TemporaryDirectory config_directory("config_loader_bool");
    std::string csv_path = config_directory.write_file("logging_config.csv",
        "logging.file_logging_enabled,TRUE\n"
        "logging.log_indicator_table,Yes\n");

    SystemConfig config;
    config.logging.file_logging_enabled = false;
    config.logging.log_indicator_table = false;
    ASSERT_TRUE(load_config_from_csv(config, csv_path));
    EXPECT_TRUE(config.logging.file_logging_enabled);
    EXPECT_TRUE(config.logging.log_indicator_table);
}

TEST(ConfigLoaderTest, MissingFileIsReportedByLoadConfigFromCsv) {
    SystemConfig config;
    EXPECT_FALSE(load_config_from_csv(config, "/nonexistent/analysis_config.csv"));
}

TEST(ConfigLoaderTest, MissingDirectoryKeepsDefaults) {
    SystemConfig config;
    EXPECT_NO_THROW(load_system_config(config, "/nonexistent_config_directory"));
    EXPECT_EQ(config.indicators.rsi_period, 14);
}

TEST(ConfigLoaderTest, LoadSystemConfigRejectsInvalidCombination) {
    TemporaryDirectory config_directory("config_loader_invalid");
    config_directory.write_file("analysis_config.csv",
        "indicators.macd_fast_period,30\n"
        "indicators.macd_slow_period,26\n");

    SystemConfig config;
    EXPECT_THROW(load_system_config(config, config_directory.path()), ConfigError);
}

TEST(ConfigLoaderTest, ValidateRejectsCrossedMovingAverages) {
    SystemConfig config;
    config.signals.ma_fast_period = 50;
    config.signals.ma_slow_period = 20;
    std::string error_message;
    EXPECT_FALSE(validate_config(config, error_message));
    EXPECT_NE(error_message.find("signals.ma_fast_period"), std::string::npos);
}

TEST(ConfigLoaderTest, ValidateRequiresSignalAveragesToBeComputed) {
    SystemConfig config;
    config.signals.ma_slow_period = 60;
    std::string error_message;
    EXPECT_FALSE(validate_config(config, error_message));
    EXPECT_NE(error_message.find("indicators.sma_periods"), std::string::npos);

    config = SystemConfig();
    config.signals.volume_average_period = 30;
    EXPECT_FALSE(validate_config(config, error_message));
    EXPECT_NE(error_message.find("signals.volume_average_period"), std::string::npos);
}

TEST(ConfigLoaderTest, ValidateRejectsOutOfRangeRecommendationSettings) {
    SystemConfig config;
    std::string error_message;

    config.recommendation.technical_weight = 1.5;
    EXPECT_FALSE(validate_config(config, error_message));

    config = SystemConfig();
    config.recommendation.decision_threshold = 0.0;
    EXPECT_FALSE(validate_config(config, error_message));

    config = SystemConfig();
    config.recommendation.single_branch_strength_cap = 0.0;
    EXPECT_FALSE(validate_config(config, error_message));
}

TEST(ConfigLoaderTest, ValidateRejectsAllZeroSignalWeights) {
    SystemConfig config;
    config.signals.rsi_weight = 0.0;
    config.signals.macd_weight = 0.0;
    config.signals.bollinger_weight = 0.0;
    config.signals.moving_average_weight = 0.0;
    config.signals.volume_weight = 0.0;
    config.signals.pattern_weight = 0.0;
    config.signals.level_weight = 0.0;
    std::string error_message;
    EXPECT_FALSE(validate_config(config, error_message));
}

TEST(ConfigLoaderTest, ValidateRejectsTerminalGrowthAboveDiscountRate) {
    SystemConfig config;
    config.valuation.terminal_growth_rate = 0.2;
    std::string error_message;
    EXPECT_FALSE(validate_config(config, error_message));
}

TEST(ConfigLoaderTest, ShippedConfigFilesValidate) {
    SystemConfig config;
    EXPECT_NO_THROW(load_system_config(config, STOCK_ADVISOR_SOURCE_DIR "/config"));
}
