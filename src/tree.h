#pragma once

#include <string>
#include <vector>

#include "result.h"

// 本文件声明 tree 对象（目录清单）的编码与解码
namespace miniodb {

/**
 * @brief 条目所引用对象的类别，由条目模式推导。
 */
enum class EntryType {
    Blob,     ///< 以 "100" 开头的文件模式
    Tree,     ///< 固定目录模式 "040000"
    Unknown   ///< 其他无法识别的模式，不视为解析错误
};

/// 返回条目类别的名称："blob"、"tree" 或 "unknown"。
const char* entry_type_name(EntryType type);

/// 根据条目模式推导条目类别。
EntryType classify_mode(const std::string& mode);

/**
 * @brief 表示 tree 对象中的单个条目。
 *
 * 条目只通过哈希引用其他对象，解析 tree 时不会读取或校验被引用的对象。
 */
struct TreeEntry {
    /// 条目名称，对应文件名或目录名。
    std::string path;
    /// 文件模式，例如 "100644" 表示普通文件，"040000" 表示目录。
    std::string mode;
    /// 由 mode 推导出的类别，编码时不使用。
    EntryType type = EntryType::Unknown;
    /// 被引用对象的 SHA-1 哈希（40 位十六进制字符串）。
    std::string sha;
};

/**
 * @brief 解码后的 tree 对象。
 *
 * 条目按序列化顺序保存，不要求名称唯一。
 */
struct Tree {
    std::vector<TreeEntry> entries;
    /// 对完整序列化字节重新计算得到的 SHA-1 哈希。
    std::string sha;
};

/**
 * @brief 根据条目列表构造 tree 对象的序列化字节。
 *
 * 按调用方给定的顺序，每个条目输出 "<mode> <path>\\0<20 字节二进制哈希>"，
 * 整体加上 "tree <size>\\0" 头部。
 *
 * @param entries tree 中包含的条目列表。
 * @return 完整的 tree 对象序列化字节。
 * @throws std::invalid_argument 当条目哈希不合法、mode 含有空格或 '\\0'、
 *         path 含有 '\\0' 时抛出。
 */
std::string encode_tree(const std::vector<TreeEntry>& entries);

/**
 * @brief 解析 tree 对象的序列化字节。
 *
 * 头部只要求以 '\\0' 结尾，不校验类型标签与长度。任一条目缺少空格或 '\\0'
 * 分隔符、哈希不足 20 字节时整体失败，返回 TreeParseError。
 */
Result<Tree> decode_tree(const std::string& bytes);

}  // namespace miniodb
