#pragma once

#include <string>

#include <spdlog/spdlog.h>

// 本文件声明从环境变量加载的运行配置
namespace miniodb {

/// 默认对象根目录。
const char kDefaultObjectsDir[] = ".mini-odb/objects";

/**
 * @brief 对象库运行配置。
 */
struct Config {
    /// 对象根目录，来自 MINIODB_OBJECTS_DIR。
    std::string objects_dir;
    /// 日志级别，来自 MINIODB_LOG_LEVEL。
    spdlog::level::level_enum log_level;
    /// zlib 压缩级别 0~9，来自 MINIODB_COMPRESSION_LEVEL。
    int compression_level;
};

/**
 * @brief 解析日志级别名称。
 *
 * 接受 trace、debug、info、warn、warning、err、error、critical、off，
 * 其他名称返回 info。
 */
spdlog::level::level_enum parse_log_level(const std::string& name);

/**
 * @brief 解析压缩级别，非数字或超出 0~9 时返回默认级别。
 */
int parse_compression_level(const std::string& text);

/**
 * @brief 从环境变量读取配置，未设置或为空的变量使用默认值。
 */
Config load_config_from_env();

/// 将配置中的日志级别应用到 spdlog 默认日志器。
void apply_log_level(const Config& config);

}  // namespace miniodb
