#include "result.h"

// 本文件实现错误类别名称以及各类错误的构造
namespace miniodb {

// 返回错误类别的名称
const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidHash:
            return "InvalidHash";
        case ErrorKind::NotFound:
            return "NotFound";
        case ErrorKind::DecompressionFailure:
            return "DecompressionFailure";
        case ErrorKind::BlobDecodeFailure:
            return "BlobDecodeFailure";
        case ErrorKind::TreeDecodeFailure:
            return "TreeDecodeFailure";
        case ErrorKind::WriteFailure:
            return "WriteFailure";
        case ErrorKind::ReadFailure:
            return "ReadFailure";
        case ErrorKind::InvalidEntry:
            return "InvalidEntry";
    }
    return "Unknown";
}

// 生成 "<code>: <message>" 形式的错误描述
std::string describe(const Error& error) {
    return error.code + ": " + error.message;
}

namespace errors {

Error invalid_hash_format(const std::string& hash) {
    return Error{ErrorKind::InvalidHash, "InvalidShaFormat",
                 "the SHA-1 hash must be exactly 40 hex characters, got '" +
                     hash + "'"};
}

Error not_found(const std::string& path) {
    return Error{ErrorKind::NotFound, "NotFound", "not found: " + path};
}

Error decompression_error(const std::string& cause) {
    return Error{ErrorKind::DecompressionFailure, "DecompressionError",
                 "failed to decompress: " + cause};
}

Error parse_blob_header_error() {
    return Error{ErrorKind::BlobDecodeFailure, "ParseBlobHeaderError",
                 "failed to parse blob header or length mismatch"};
}

Error blob_parse_error(const std::string& cause) {
    return Error{ErrorKind::BlobDecodeFailure, "BlobParseError",
                 "failed to parse blob: " + cause};
}

Error tree_parse_error(const std::string& cause) {
    return Error{ErrorKind::TreeDecodeFailure, "TreeParseError",
                 "failed to parse tree: " + cause};
}

Error writing_file_error(const std::string& cause) {
    return Error{ErrorKind::WriteFailure, "WritingFileError",
                 "error while writing object: " + cause};
}

Error reading_file_error(const std::string& cause) {
    return Error{ErrorKind::ReadFailure, "ReadingFileError",
                 "error while reading file: " + cause};
}

Error invalid_tree_entry(const std::string& cause) {
    return Error{ErrorKind::InvalidEntry, "InvalidTreeEntry",
                 "invalid tree entry: " + cause};
}

}  // namespace errors

}  // namespace miniodb
