#include "blob.h"

#include "hash.h"
#include "object_header.h"

// 本文件实现 blob 对象的编码以及带长度校验的解码
namespace miniodb {

// 在内容前拼接 "blob <字节数>\0" 头部
std::string encode_blob(const std::string& content) {
    std::string bytes = make_object_header(kBlobType, content.size());
    bytes.append(content);
    return bytes;
}

// 解析 blob 字节，校验头部后返回内容与重新计算的哈希
Result<Blob> decode_blob(const std::string& bytes) {
    ObjectHeader header;
    if (!split_object_header(bytes, header)) {
        return errors::blob_parse_error("missing header terminator");
    }

    // 类型标签与声明长度作为一个整体校验
    std::size_t declared = 0;
    if (header.fields.size() != 2 || header.fields[0] != kBlobType ||
        !parse_decimal_size(header.fields[1], declared) ||
        declared != bytes.size() - header.terminator - 1) {
        return errors::parse_blob_header_error();
    }

    Blob blob;
    blob.content = bytes.substr(header.terminator + 1);
    blob.sha = sha1_hex(bytes);
    return blob;
}

}  // namespace miniodb
