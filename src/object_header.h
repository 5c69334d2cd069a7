#pragma once

#include <cstddef>
#include <string>
#include <vector>

// 本文件声明序列化对象头部 "<type> <size>\0" 的构造与拆分
namespace miniodb {

/// blob 对象类型标签。
const char kBlobType[] = "blob";
/// tree 对象类型标签。
const char kTreeType[] = "tree";

/// 目录条目的固定模式。
const char kTreeMode[] = "040000";
/// 普通文件模式。
const char kRegularFileMode[] = "100644";
/// 可执行文件模式。
const char kExecutableFileMode[] = "100755";
/// 所有文件类模式共有的前缀。
const char kFileModePrefix[] = "100";

/**
 * @brief 拆分后的对象头部。
 */
struct ObjectHeader {
    /// 头部文本，不含结尾的 '\0'。
    std::string text;
    /// 头部结尾 '\0' 的下标，亦即头部文本的字节数。
    std::size_t terminator = 0;
    /// 按单个空格拆分得到的字段，连续空格会产生空字段。
    std::vector<std::string> fields;
};

/**
 * @brief 构造 "<type> <payload_size>\\0" 形式的对象头部。
 */
std::string make_object_header(const std::string& type, std::size_t payload_size);

/**
 * @brief 定位第一个 '\\0' 并拆分其前的头部文本。
 *
 * @param bytes  完整的序列化对象字节。
 * @param header 输出参数，用于接收拆分结果。
 * @return 找不到 '\\0' 时返回 false。
 */
bool split_object_header(const std::string& bytes, ObjectHeader& header);

/**
 * @brief 解析十进制长度字段。
 *
 * 只接受非空的纯数字串，超出 std::size_t 范围视为失败。
 */
bool parse_decimal_size(const std::string& text, std::size_t& value);

}  // namespace miniodb
