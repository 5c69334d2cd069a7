#include "hash.h"

#include <algorithm>
#include <cstdint>
#include <stdexcept>

// 本文件实现 SHA-1 哈希算法以及哈希的十六进制编解码
namespace {

const char* kHexDigits = "0123456789abcdef";

inline uint32_t left_rotate(uint32_t value, uint32_t bits) {
    return (value << bits) | (value >> (32U - bits));
}

// 将单个十六进制字符转换为数值，非法字符返回 -1
int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

// SHA-1 计算上下文，按 64 字节分块处理输入
class Sha1Context {
public:
    Sha1Context() : total_len_(0) {
        state_[0] = 0x67452301U;
        state_[1] = 0xEFCDAB89U;
        state_[2] = 0x98BADCFEU;
        state_[3] = 0x10325476U;
        state_[4] = 0xC3D2E1F0U;
    }

    // 先补齐上次残留的不完整块，再直接处理完整块，只缓存末尾不足 64 字节的部分
    void update(const std::string& data) {
        total_len_ += data.size();
        const uint8_t* p = reinterpret_cast<const uint8_t*>(data.data());
        std::size_t len = data.size();

        if (!pending_.empty()) {
            std::size_t take = std::min(len, 64U - pending_.size());
            pending_.append(reinterpret_cast<const char*>(p), take);
            p += take;
            len -= take;
            if (pending_.size() < 64U) {
                return;
            }
            transform(reinterpret_cast<const uint8_t*>(pending_.data()));
            pending_.clear();
        }

        while (len >= 64U) {
            transform(p);
            p += 64;
            len -= 64U;
        }
        pending_.assign(reinterpret_cast<const char*>(p), len);
    }

    // 追加填充与长度字段后输出 20 字节摘要
    std::string finish() {
        uint64_t bit_len = static_cast<uint64_t>(total_len_) * 8U;

        std::string tail(pending_);
        tail.push_back(static_cast<char>(0x80U));
        while ((tail.size() % 64U) != 56U) {
            tail.push_back('\0');
        }
        for (int i = 7; i >= 0; --i) {
            tail.push_back(static_cast<char>((bit_len >> (i * 8)) & 0xFFU));
        }
        for (std::size_t i = 0; i < tail.size(); i += 64U) {
            transform(reinterpret_cast<const uint8_t*>(tail.data() + i));
        }

        std::string digest;
        digest.reserve(miniodb::kRawHashSize);
        for (int i = 0; i < 5; ++i) {
            digest.push_back(static_cast<char>((state_[i] >> 24) & 0xFFU));
            digest.push_back(static_cast<char>((state_[i] >> 16) & 0xFFU));
            digest.push_back(static_cast<char>((state_[i] >> 8) & 0xFFU));
            digest.push_back(static_cast<char>(state_[i] & 0xFFU));
        }
        return digest;
    }

private:
    void transform(const uint8_t block[64]) {
        uint32_t w[80];

        for (int i = 0; i < 16; ++i) {
            w[i] = (static_cast<uint32_t>(block[i * 4]) << 24) |
                   (static_cast<uint32_t>(block[i * 4 + 1]) << 16) |
                   (static_cast<uint32_t>(block[i * 4 + 2]) << 8) |
                   (static_cast<uint32_t>(block[i * 4 + 3]));
        }
        for (int i = 16; i < 80; ++i) {
            w[i] = left_rotate(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);
        }

        uint32_t a = state_[0];
        uint32_t b = state_[1];
        uint32_t c = state_[2];
        uint32_t d = state_[3];
        uint32_t e = state_[4];

        for (int i = 0; i < 80; ++i) {
            uint32_t f;
            uint32_t k;
            if (i < 20) {
                f = (b & c) | ((~b) & d);
                k = 0x5A827999U;
            } else if (i < 40) {
                f = b ^ c ^ d;
                k = 0x6ED9EBA1U;
            } else if (i < 60) {
                f = (b & c) | (b & d) | (c & d);
                k = 0x8F1BBCDCU;
            } else {
                f = b ^ c ^ d;
                k = 0xCA62C1D6U;
            }

            uint32_t temp = left_rotate(a, 5) + f + e + k + w[i];
            e = d;
            d = c;
            c = left_rotate(b, 30);
            b = a;
            a = temp;
        }

        state_[0] += a;
        state_[1] += b;
        state_[2] += c;
        state_[3] += d;
        state_[4] += e;
    }

    uint32_t state_[5];
    std::string pending_;
    std::size_t total_len_;
};

}  // namespace

namespace miniodb {

// 计算数据的 20 字节二进制 SHA-1 摘要
std::string sha1_raw(const std::string& data) {
    Sha1Context ctx;
    ctx.update(data);
    return ctx.finish();
}

// 计算数据的 SHA-1 并以 40 位小写十六进制返回
std::string sha1_hex(const std::string& data) {
    return raw_to_hex(sha1_raw(data));
}

// 判断字符串是否恰好为 40 位十六进制字符（大小写均可）
bool is_valid_hash(const std::string& hash) {
    if (hash.size() != kHexHashSize) {
        return false;
    }
    for (std::size_t i = 0; i < hash.size(); ++i) {
        if (hex_value(hash[i]) < 0) {
            return false;
        }
    }
    return true;
}

// 将十六进制字符串中的大写字母转为小写
std::string to_lower_hex(const std::string& hash) {
    std::string out(hash);
    for (std::size_t i = 0; i < out.size(); ++i) {
        if (out[i] >= 'A' && out[i] <= 'F') {
            out[i] = static_cast<char>(out[i] - 'A' + 'a');
        }
    }
    return out;
}

// 将 40 位十六进制哈希转换为 20 字节二进制形式
std::string hex_to_raw(const std::string& hex) {
    if (hex.size() != kHexHashSize) {
        throw std::invalid_argument("invalid sha1 hex length: " +
                                    std::to_string(hex.size()));
    }

    std::string out;
    out.resize(kRawHashSize);
    for (std::size_t i = 0; i < kRawHashSize; ++i) {
        int high = hex_value(hex[i * 2U]);
        int low = hex_value(hex[i * 2U + 1U]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("invalid hex character in '" + hex +
                                        "'");
        }
        out[i] = static_cast<char>((high << 4) | low);
    }
    return out;
}

// 将 20 字节二进制哈希转换为 40 位小写十六进制
std::string raw_to_hex(const std::string& raw) {
    if (raw.size() != kRawHashSize) {
        throw std::invalid_argument("invalid sha1 raw length: " +
                                    std::to_string(raw.size()));
    }

    std::string out;
    out.resize(kHexHashSize);
    for (std::size_t i = 0; i < kRawHashSize; ++i) {
        uint8_t v = static_cast<uint8_t>(raw[i]);
        out[i * 2U] = kHexDigits[(v >> 4U) & 0x0FU];
        out[i * 2U + 1U] = kHexDigits[v & 0x0FU];
    }
    return out;
}

}  // namespace miniodb
