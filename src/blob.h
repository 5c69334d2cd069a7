#pragma once

#include <string>

#include "result.h"

// 本文件声明 blob 对象的编码与解码
namespace miniodb {

/**
 * @brief 解码后的 blob 对象。
 */
struct Blob {
    /// 原始文件字节，不含头部。
    std::string content;
    /// 对完整序列化字节重新计算得到的 SHA-1 哈希。
    std::string sha;
};

/**
 * @brief 根据原始数据构造 blob 对象的序列化字节。
 *
 * 生成的二进制内容格式为："blob <size>\\0<data>"，其中 size 为字节数。
 *
 * @param content 原始文件数据。
 * @return 包含对象头部和正文的完整序列化字节。
 */
std::string encode_blob(const std::string& content);

/**
 * @brief 解析 blob 对象的序列化字节。
 *
 * 头部必须恰好为 "blob" 与十进制长度两个字段，且长度与 '\\0' 之后的
 * 字节数一致，否则返回 ParseBlobHeaderError；缺少头部结尾 '\\0' 时返回
 * BlobParseError。成功时 sha 总是对输入重新计算得到。
 */
Result<Blob> decode_blob(const std::string& bytes);

}  // namespace miniodb
