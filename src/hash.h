#pragma once

#include <cstddef>
#include <string>

// 本文件声明对象寻址所用的 SHA-1 哈希及十六进制转换接口
namespace miniodb {

/// SHA-1 摘要的字节长度。
const std::size_t kRawHashSize = 20;
/// SHA-1 摘要十六进制表示的长度。
const std::size_t kHexHashSize = 40;

/**
 * @brief 计算输入数据的 SHA-1 摘要（20 字节原始形式）。
 *
 * @param data 输入的原始字节。
 * @return 长度为 20 的二进制字符串。
 */
std::string sha1_raw(const std::string& data);

/**
 * @brief 计算输入数据的 SHA-1 哈希值。
 *
 * 对象寻址时输入应为完整的 "<type> <size>\\0<payload>" 序列化字节。
 *
 * @param data 输入的原始字节。
 * @return 长度为 40 的小写十六进制字符串。
 */
std::string sha1_hex(const std::string& data);

/**
 * @brief 判断字符串是否为合法的对象哈希。
 *
 * 要求恰好 40 个字符且全部属于 [0-9a-fA-F]。
 */
bool is_valid_hash(const std::string& hash);

/// 将十六进制哈希转换为小写形式，不做合法性校验。
std::string to_lower_hex(const std::string& hash);

/**
 * @brief 将 40 位十六进制哈希转换为 20 字节二进制形式。
 *
 * @throws std::invalid_argument 当长度或字符不合法时抛出。
 */
std::string hex_to_raw(const std::string& hex);

/**
 * @brief 将 20 字节二进制哈希转换为 40 位小写十六进制字符串。
 *
 * @throws std::invalid_argument 当长度不是 20 时抛出。
 */
std::string raw_to_hex(const std::string& raw);

}  // namespace miniodb
