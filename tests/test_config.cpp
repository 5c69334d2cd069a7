#include <gtest/gtest.h>

#include <cstdlib>

#include "config.h"
#include "zlib_utils.h"

// 本文件包含针对环境变量配置加载的单元测试

TEST(ConfigTest, DefaultsWhenUnset) {
    unsetenv("MINIODB_OBJECTS_DIR");
    unsetenv("MINIODB_LOG_LEVEL");
    unsetenv("MINIODB_COMPRESSION_LEVEL");

    miniodb::Config config = miniodb::load_config_from_env();
    EXPECT_EQ(config.objects_dir, ".mini-odb/objects");
    EXPECT_EQ(config.log_level, spdlog::level::info);
    EXPECT_EQ(config.compression_level, miniodb::kDefaultCompressionLevel);
}

TEST(ConfigTest, EnvOverridesDefaults) {
    setenv("MINIODB_OBJECTS_DIR", "/tmp/objects", 1);
    setenv("MINIODB_LOG_LEVEL", "debug", 1);
    setenv("MINIODB_COMPRESSION_LEVEL", "3", 1);

    miniodb::Config config = miniodb::load_config_from_env();
    EXPECT_EQ(config.objects_dir, "/tmp/objects");
    EXPECT_EQ(config.log_level, spdlog::level::debug);
    EXPECT_EQ(config.compression_level, 3);

    unsetenv("MINIODB_OBJECTS_DIR");
    unsetenv("MINIODB_LOG_LEVEL");
    unsetenv("MINIODB_COMPRESSION_LEVEL");
}

// 空字符串视同未设置
TEST(ConfigTest, EmptyValueFallsBack) {
    setenv("MINIODB_OBJECTS_DIR", "", 1);
    miniodb::Config config = miniodb::load_config_from_env();
    EXPECT_EQ(config.objects_dir, ".mini-odb/objects");
    unsetenv("MINIODB_OBJECTS_DIR");
}

TEST(ConfigTest, ParseLogLevel) {
    EXPECT_EQ(miniodb::parse_log_level("trace"), spdlog::level::trace);
    EXPECT_EQ(miniodb::parse_log_level("warning"), spdlog::level::warn);
    EXPECT_EQ(miniodb::parse_log_level("err"), spdlog::level::err);
    EXPECT_EQ(miniodb::parse_log_level("off"), spdlog::level::off);
    EXPECT_EQ(miniodb::parse_log_level("loud"), spdlog::level::info);
}

TEST(ConfigTest, ParseCompressionLevel) {
    EXPECT_EQ(miniodb::parse_compression_level("0"), 0);
    EXPECT_EQ(miniodb::parse_compression_level("9"), 9);
    EXPECT_EQ(miniodb::parse_compression_level("10"), miniodb::kDefaultCompressionLevel);
    EXPECT_EQ(miniodb::parse_compression_level("-1"), miniodb::kDefaultCompressionLevel);
    EXPECT_EQ(miniodb::parse_compression_level("fast"), miniodb::kDefaultCompressionLevel);
    EXPECT_EQ(miniodb::parse_compression_level(""), miniodb::kDefaultCompressionLevel);
}

TEST(ConfigTest, ApplyLogLevel) {
    miniodb::Config config = miniodb::load_config_from_env();
    config.log_level = spdlog::level::warn;
    miniodb::apply_log_level(config);
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
    spdlog::set_level(spdlog::level::info);
}
