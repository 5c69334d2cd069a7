#pragma once

#include <cstddef>
#include <string>

// 本文件声明对象落盘时使用的 zlib 压缩与解压工具函数
namespace miniodb {

/// 默认压缩级别，对应 zlib 的 Z_BEST_COMPRESSION。
const int kDefaultCompressionLevel = 9;

/**
 * @brief 使用 zlib 对输入数据进行压缩。
 *
 * 内部使用 zlib 的 compress2 接口，输出为标准 zlib 流。相同输入与相同级别
 * 总是得到相同输出，因此重复写入同一对象得到同一文件。
 *
 * @param input 原始未压缩数据，可以为空。
 * @param level 压缩级别 0~9。
 * @return 压缩后的二进制数据。
 * @throws std::runtime_error 当压缩失败时抛出异常。
 */
std::string zlib_compress(const std::string& input,
                          int level = kDefaultCompressionLevel);

/**
 * @brief 使用 zlib 对输入数据进行解压。
 *
 * 基于 inflate 流式接口逐块输出，无需预知解压后大小。
 *
 * @param input 压缩后的二进制数据。
 * @return 解压得到的原始数据。
 * @throws std::runtime_error 当输入为空、数据损坏、流被截断或流结束后
 *         仍有多余字节时抛出异常。
 */
std::string zlib_decompress(const std::string& input);

/**
 * @brief 同 zlib_decompress，但每次最多向 inflate 送入 max_slice 字节输入。
 *
 * z_stream::avail_in 只有 32 位，单参数版本以 uInt 的最大值分段，
 * 从而支持超过 4 GiB 的输入。max_slice 为 0 或超过该上限时按上限处理。
 */
std::string zlib_decompress(const std::string& input, std::size_t max_slice);

}  // namespace miniodb
