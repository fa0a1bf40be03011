// ==============================================================================
// test_config_gtest.cpp - Тесты YAML конфигурации
// ==============================================================================

#include <winevtrc/config.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <string>

namespace winevtrc::config::test {

using winevtrc::test::TempFile;

TEST(ConfigTest, EmptyDocument_UsesDefaults) {
    auto result = parse_config("");

    ASSERT_TRUE(result);
    EXPECT_EQ(result.config.lcid, windows::DEFAULT_LCID);
    EXPECT_EQ(result.config.cache_capacity, resources::DEFAULT_CACHE_CAPACITY);
    EXPECT_TRUE(result.config.data_location.empty());
    EXPECT_FALSE(result.config.storage_path.has_value());
    EXPECT_TRUE(result.config.environment.empty());
}

TEST(ConfigTest, AllKeys_Parsed) {
    // Arrange
    const std::string text =
        "data_location: /usr/share/winevtrc\n"
        "lcid: 0x0407\n"
        "storage: case.sqlite\n"
        "cache_capacity: 128\n"
        "environment:\n"
        "  SystemRoot: D:\\Windows\n";

    // Act
    auto result = parse_config(text);

    // Assert
    ASSERT_TRUE(result) << result.error.format();
    EXPECT_EQ(result.config.data_location.string(), "/usr/share/winevtrc");
    EXPECT_EQ(result.config.lcid, 0x0407u);
    EXPECT_EQ(result.config.storage_path.value_or("").string(), "case.sqlite");
    EXPECT_EQ(result.config.cache_capacity, 128u);
    ASSERT_EQ(result.config.environment.count("SystemRoot"), 1u);
    EXPECT_EQ(result.config.environment.at("SystemRoot"), "D:\\Windows");
}

TEST(ConfigTest, LcidForms) {
    EXPECT_EQ(parse_config("lcid: 1031\n").config.lcid, 0x0407u);
    EXPECT_EQ(parse_config("lcid: de-DE\n").config.lcid, 0x0407u);
    EXPECT_EQ(parse_config("lcid: 0x0409\n").config.lcid, 0x0409u);

    EXPECT_EQ(parse_lcid("0xffffffff").value_or(0), 0xffffffffu);
    EXPECT_FALSE(parse_lcid("0x100000000").has_value());
    EXPECT_FALSE(parse_lcid("klingon").has_value());
    EXPECT_FALSE(parse_lcid("").has_value());
}

TEST(ConfigTest, InvalidValues_AreValueErrors) {
    const char* documents[] = {
        "- a\n- b\n",                      // не отображение
        "lcid: klingon\n",                 // неизвестный тег
        "cache_capacity: 0\n",             // нулевая емкость
        "cache_capacity: many\n",          // не число
        "environment: [SystemRoot]\n",     // окружение не отображение
        "environment:\n  SystemRoot: [a, b]\n",
    };

    for (const char* document : documents) {
        auto result = parse_config(document);
        EXPECT_FALSE(result) << document;
        EXPECT_EQ(result.error.kind, ConfigErrorKind::Value) << document;
    }
}

TEST(ConfigTest, InvalidValue_MessageNamesKey) {
    auto result = parse_config("cache_capacity: 0\n");

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.message, "invalid cache_capacity: 0");
    EXPECT_EQ(result.error.format(), "invalid cache_capacity: 0");
}

TEST(ConfigTest, BrokenYaml_IsSyntaxError) {
    auto result = parse_config("lcid: [0x0409\n");

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.kind, ConfigErrorKind::Syntax);
}

TEST(ConfigTest, LoadConfig_MissingFile) {
    auto result = load_config("/nonexistent/winevtrc/config.yml");

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.kind, ConfigErrorKind::Io);
    EXPECT_EQ(result.error.format(),
              "configuration file not found in /nonexistent/winevtrc/config.yml");
}

TEST(ConfigTest, LoadConfig_ReadsFile) {
    TempFile file("winevtrc_config");
    {
        std::ofstream out(file.path());
        out << "lcid: en-US\n"
               "cache_capacity: 0x10\n";
    }

    auto result = load_config(file.path());

    ASSERT_TRUE(result) << result.error.format();
    EXPECT_EQ(result.config.lcid, 0x0409u);
    EXPECT_EQ(result.config.cache_capacity, 16u);
}

TEST(ConfigTest, LoadConfig_ValueErrorCarriesPath) {
    TempFile file("winevtrc_config");
    {
        std::ofstream out(file.path());
        out << "lcid: klingon\n";
    }

    auto result = load_config(file.path());

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.kind, ConfigErrorKind::Value);
    EXPECT_EQ(result.error.path, file.path().string());
    EXPECT_EQ(result.error.format(), "invalid lcid: klingon in " + file.path().string());
}

}  // namespace winevtrc::config::test
