#include "config.h"

#include <cstdlib>

#include "object_header.h"
#include "zlib_utils.h"

// 本文件实现基于环境变量的配置加载
namespace {

std::string env_or(const char* key, const std::string& defval) {
    const char* v = std::getenv(key);
    if (v && v[0] != '\0') return std::string(v);
    return defval;
}

}  // namespace

namespace miniodb {

spdlog::level::level_enum parse_log_level(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "err" || name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return spdlog::level::info;
}

int parse_compression_level(const std::string& text) {
    std::size_t level = 0;
    if (!parse_decimal_size(text, level) || level > 9U) {
        return kDefaultCompressionLevel;
    }
    return static_cast<int>(level);
}

Config load_config_from_env() {
    Config config;
    config.objects_dir = env_or("MINIODB_OBJECTS_DIR", kDefaultObjectsDir);
    config.log_level = parse_log_level(env_or("MINIODB_LOG_LEVEL", "info"));
    config.compression_level =
        parse_compression_level(env_or("MINIODB_COMPRESSION_LEVEL", ""));
    return config;
}

void apply_log_level(const Config& config) {
    spdlog::set_level(config.log_level);
}

}  // namespace miniodb
