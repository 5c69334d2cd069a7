#include "zlib_utils.h"

#include <algorithm>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <vector>

#include <zlib.h>

// 本文件实现基于 zlib 的压缩与解压工具函数
namespace {

const std::size_t kChunkSize = 16384;
const std::size_t kMaxInflateInput = std::numeric_limits<uInt>::max();

// 持有 inflate 流，离开作用域时释放 zlib 内部状态
class InflateStream {
public:
    InflateStream() {
        std::memset(&stream_, 0, sizeof(stream_));
        int ret = inflateInit(&stream_);
        if (ret != Z_OK) {
            throw std::runtime_error("inflateInit failed with code " +
                                     std::to_string(ret));
        }
    }

    ~InflateStream() { inflateEnd(&stream_); }

    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;

    z_stream* get() { return &stream_; }

private:
    z_stream stream_;
};

// 根据 zlib 返回码与流内消息生成错误描述
std::string describe_inflate_error(int ret, const z_stream* stream) {
    if (ret == Z_BUF_ERROR) {
        return "truncated stream";
    }
    std::string msg = "inflate failed with code " + std::to_string(ret);
    if (stream->msg != nullptr) {
        msg += ": ";
        msg += stream->msg;
    }
    return msg;
}

}  // namespace

namespace miniodb {

// 使用 compress2 按指定级别一次性压缩输入
std::string zlib_compress(const std::string& input, int level) {
    uLong source_len = static_cast<uLong>(input.size());
    uLong dest_len = compressBound(source_len);
    std::vector<unsigned char> buffer(dest_len);

    int ret = compress2(buffer.data(), &dest_len,
                        reinterpret_cast<const Bytef*>(input.data()),
                        source_len, level);

    if (ret != Z_OK) {
        throw std::runtime_error("zlib_compress failed with code " +
                                 std::to_string(ret));
    }

    return std::string(reinterpret_cast<char*>(buffer.data()), dest_len);
}

// 流式解压 zlib 数据，截断、损坏或带有多余字节时抛出 std::runtime_error
std::string zlib_decompress(const std::string& input) {
    return zlib_decompress(input, kMaxInflateInput);
}

// 按 max_slice 分段送入输入的解压实现
std::string zlib_decompress(const std::string& input, std::size_t max_slice) {
    if (max_slice == 0 || max_slice > kMaxInflateInput) {
        max_slice = kMaxInflateInput;
    }
    if (input.empty()) {
        throw std::runtime_error("empty input is not a zlib stream");
    }

    InflateStream inflater;
    z_stream* stream = inflater.get();
    const char* next = input.data();
    std::size_t remaining = input.size();

    std::string output;
    std::vector<char> chunk(kChunkSize);
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        // avail_in 只有 32 位，超大输入分段送入
        if (stream->avail_in == 0 && remaining > 0) {
            std::size_t slice = std::min(remaining, max_slice);
            stream->next_in = reinterpret_cast<Bytef*>(const_cast<char*>(next));
            stream->avail_in = static_cast<uInt>(slice);
            next += slice;
            remaining -= slice;
        }
        stream->next_out = reinterpret_cast<Bytef*>(chunk.data());
        stream->avail_out = static_cast<uInt>(chunk.size());

        // 输入耗尽而流未结束时 inflate 返回 Z_BUF_ERROR，即数据被截断
        ret = inflate(stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            throw std::runtime_error(describe_inflate_error(ret, stream));
        }
        output.append(chunk.data(), chunk.size() - stream->avail_out);
    }

    if (stream->avail_in != 0 || remaining != 0) {
        throw std::runtime_error("trailing bytes after end of zlib stream");
    }

    return output;
}

}  // namespace miniodb
