/**
 * @file test_configuration.cpp
 * @brief YAML configuration loading and typed section conversion
 */

#include <gtest/gtest.h>
#include <bayerflow/core/Configuration.hpp>
#include <bayerflow/core/exception.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace bayerflow::core;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLevel(LogLevel::CRITICAL);
        Configuration::getInstance().clear();
    }

    void TearDown() override {
        Configuration::getInstance().clear();
        Logger::getInstance().setLevel(LogLevel::WARNING);
    }
};

/**
 * Test 1: Defaults with no document
 */
TEST_F(ConfigurationTest, DefaultsWhenEmpty) {
    auto& config = Configuration::getInstance();
    const CoreConfig core = config.getCoreConfig();

    EXPECT_EQ(core.bufferCount, 5u);
    EXPECT_EQ(core.maxLineWidth, 4096u);
    EXPECT_EQ(core.sampleBits, 8u);
    EXPECT_EQ(core.pattern, CfaPattern::RGGB);
    EXPECT_EQ(core.divideByThree, DivisionMode::APPROXIMATE);

    const auto logging = config.getLoggingConfig();
    EXPECT_EQ(logging.level, LogLevel::INFO);
    EXPECT_TRUE(logging.console);
    EXPECT_TRUE(logging.file.empty());
    EXPECT_FALSE(config.has("core.sample_bits"));
}

/**
 * Test 2: Full document
 */
TEST_F(ConfigurationTest, ParsesAllSections) {
    auto& config = Configuration::getInstance();
    ASSERT_TRUE(config.loadFromString(
        "core:\n"
        "  buffer_count: 6\n"
        "  max_line_width: 1920\n"
        "  sample_bits: 12\n"
        "  cfa_pattern: bggr\n"
        "  divide_by_three: exact\n"
        "logging:\n"
        "  level: debug\n"
        "  console: false\n"
        "  file: /tmp/bayerflow.log\n"));

    const CoreConfig core = config.getCoreConfig();
    EXPECT_EQ(core.bufferCount, 6u);
    EXPECT_EQ(core.maxLineWidth, 1920u);
    EXPECT_EQ(core.sampleBits, 12u);
    EXPECT_EQ(core.pattern, CfaPattern::BGGR);
    EXPECT_EQ(core.divideByThree, DivisionMode::EXACT);
    EXPECT_EQ(core.maxSample(), 4095);

    const auto logging = config.getLoggingConfig();
    EXPECT_EQ(logging.level, LogLevel::DEBUG);
    EXPECT_FALSE(logging.console);
    EXPECT_EQ(logging.file, "/tmp/bayerflow.log");

    EXPECT_TRUE(config.has("core.cfa_pattern"));
    EXPECT_FALSE(config.has("core.missing"));
    EXPECT_EQ(config.get<int>("core.sample_bits", 0), 12);
    EXPECT_EQ(config.get<std::string>("core.missing", "fallback"), "fallback");
}

/**
 * Test 3: Partial sections keep defaults
 */
TEST_F(ConfigurationTest, PartialSectionKeepsDefaults) {
    auto& config = Configuration::getInstance();
    ASSERT_TRUE(config.loadFromString("core:\n  cfa_pattern: GRBG\n"));

    const CoreConfig core = config.getCoreConfig();
    EXPECT_EQ(core.pattern, CfaPattern::GRBG);
    EXPECT_EQ(core.bufferCount, 5u);
    EXPECT_EQ(core.divideByThree, DivisionMode::APPROXIMATE);
}

/**
 * Test 4: Bad values raise ConfigurationException
 */
TEST_F(ConfigurationTest, RejectsMalformedValues) {
    auto& config = Configuration::getInstance();

    ASSERT_TRUE(config.loadFromString("core:\n  cfa_pattern: RGBW\n"));
    EXPECT_THROW(config.getCoreConfig(), ConfigurationException);

    ASSERT_TRUE(config.loadFromString("core:\n  divide_by_three: sometimes\n"));
    EXPECT_THROW(config.getCoreConfig(), ConfigurationException);

    ASSERT_TRUE(config.loadFromString("core:\n  buffer_count: many\n"));
    EXPECT_THROW(config.getCoreConfig(), ConfigurationException);

    ASSERT_TRUE(config.loadFromString("logging:\n  level: chatty\n"));
    EXPECT_THROW(config.getLoggingConfig(), ConfigurationException);

    try {
        Configuration::parseCfaPattern("XYZW");
        FAIL() << "Unknown pattern must throw";
    } catch (const ConfigurationException& e) {
        EXPECT_EQ(e.getResultCode(), ResultCode::ERROR_INVALID_PARAMETER);
        EXPECT_NE(e.getMessage().find("XYZW"), std::string::npos);
    }
}

/**
 * Test 5: Unparseable documents leave the previous one in place
 */
TEST_F(ConfigurationTest, ParseErrorKeepsPreviousDocument) {
    auto& config = Configuration::getInstance();
    ASSERT_TRUE(config.loadFromString("core:\n  sample_bits: 10\n"));

    EXPECT_FALSE(config.loadFromString("core: [unterminated\n"));
    EXPECT_EQ(config.getCoreConfig().sampleBits, 10u);
}

/**
 * Test 6: File loading and reload
 */
TEST_F(ConfigurationTest, LoadsAndReloadsFile) {
    const std::string path = ::testing::TempDir() + "bayerflow_config_test.yaml";
    {
        std::ofstream out(path);
        out << "core:\n  buffer_count: 7\n";
    }

    auto& config = Configuration::getInstance();
    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.getFilename(), path);
    EXPECT_EQ(config.getCoreConfig().bufferCount, 7u);

    {
        std::ofstream out(path);
        out << "core:\n  buffer_count: 9\n";
    }
    ASSERT_TRUE(config.reload());
    EXPECT_EQ(config.getCoreConfig().bufferCount, 9u);

    std::remove(path.c_str());
    EXPECT_FALSE(config.load(path));
    EXPECT_EQ(config.getCoreConfig().bufferCount, 9u);
}

/**
 * Test 7: Filename queries while another thread reloads
 */
TEST_F(ConfigurationTest, FilenameReadableDuringLoads) {
    const std::string path = ::testing::TempDir() + "bayerflow_config_race.yaml";
    {
        std::ofstream out(path);
        out << "core:\n  sample_bits: 10\n";
    }

    auto& config = Configuration::getInstance();
    std::thread loader([&config, &path]() {
        for (int i = 0; i < 200; ++i) {
            EXPECT_TRUE(config.load(path));
            config.clear();
        }
    });

    for (int i = 0; i < 2000; ++i) {
        const std::string name = config.getFilename();
        EXPECT_TRUE(name.empty() || name == path) << name;
    }
    loader.join();

    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.getFilename(), path);
    std::remove(path.c_str());
}

/**
 * Test 8: Enum names match the configuration spelling
 */
TEST(CoreTypesTest, EnumNames) {
    EXPECT_EQ(cfaPatternToString(CfaPattern::RGGB), "RGGB");
    EXPECT_EQ(cfaPatternToString(CfaPattern::GRBG), "GRBG");
    EXPECT_EQ(cfaPatternToString(CfaPattern::GBRG), "GBRG");
    EXPECT_EQ(cfaPatternToString(CfaPattern::BGGR), "BGGR");
    EXPECT_EQ(divisionModeToString(DivisionMode::APPROXIMATE), "approximate");
    EXPECT_EQ(divisionModeToString(DivisionMode::EXACT), "exact");

    for (CfaPattern p : {CfaPattern::RGGB, CfaPattern::GRBG, CfaPattern::GBRG, CfaPattern::BGGR}) {
        EXPECT_EQ(Configuration::parseCfaPattern(cfaPatternToString(p)), p);
    }
    EXPECT_EQ(Configuration::parseDivisionMode(divisionModeToString(DivisionMode::EXACT)),
              DivisionMode::EXACT);
}
