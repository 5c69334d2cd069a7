#include "object_store.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "hash.h"

// 本文件实现对象存储逻辑：路径推导、压缩落盘以及读取后的解压与解码
namespace {

// 对象文件相对于根目录的路径："ab/cdef..."
std::string object_relative_path(const std::string& hash) {
    return hash.substr(0, 2) + "/" + hash.substr(2);
}

// 读取 generate_blob 的源文件，文件不存在时返回 NotFound
miniodb::Result<std::string> read_source_file(const std::string& file_path) {
    if (!miniodb::is_regular_file(file_path)) {
        return miniodb::errors::not_found(file_path);
    }

    std::string content;
    if (!miniodb::read_whole_file(file_path, content)) {
        return miniodb::errors::reading_file_error(file_path + ": " +
                                                   std::strerror(errno));
    }
    spdlog::debug("read {} bytes from {}", content.size(), file_path);
    return content;
}

}  // namespace

namespace miniodb {

// 以根目录与压缩级别构造对象存储
ObjectStore::ObjectStore(const std::string& root, int compression_level)
    : fs_(root), compression_level_(compression_level) {}

const std::string& ObjectStore::root() const {
    return fs_.root();
}

// 读取并解码 blob 对象
Result<Blob> ObjectStore::get_blob(const std::string& hash) const {
    return read_object(hash)
        .and_then(decode_blob)
        .on_success([](const Blob& blob) {
            spdlog::debug("blob {} parsed and validated", blob.sha);
        })
        .on_failure([&hash](const Error& error) {
            spdlog::error("error reading blob {}: {}", hash, describe(error));
        });
}

// 读取并解码 tree 对象
Result<Tree> ObjectStore::get_tree(const std::string& hash) const {
    return read_object(hash)
        .and_then(decode_tree)
        .on_success([](const Tree& tree) {
            spdlog::debug("tree {} parsed with {} entries", tree.sha,
                          tree.entries.size());
        })
        .on_failure([&hash](const Error& error) {
            spdlog::error("error reading tree {}: {}", hash, describe(error));
        });
}

// 按内容哈希压缩写入对象，已存在时覆盖为相同字节
Result<void> ObjectStore::store(const std::string& raw) const {
    std::string hash = sha1_hex(raw);
    spdlog::debug("generated sha {}", hash);

    return prepare_shard(hash)
        .and_then([this, &raw](const std::string& relative) {
            return write_compressed(relative, raw);
        })
        .on_failure([&hash](const Error& error) {
            spdlog::error("error storing object {}: {}", hash, describe(error));
        });
}

// 由磁盘文件构造 blob，不写入存储
Result<Blob> ObjectStore::generate_blob(const std::string& file_path) const {
    return read_source_file(file_path)
        .map(encode_blob)
        .and_then(decode_blob)
        .on_success([](const Blob& blob) {
            spdlog::debug("generated blob {}", blob.sha);
        });
}

Result<std::string> ObjectStore::store_blob(const std::string& content) const {
    std::string raw = encode_blob(content);
    std::string hash = sha1_hex(raw);
    return store(raw).map([&hash]() { return hash; });
}

// 编码并写入 tree，条目不合法时返回 InvalidEntry
Result<std::string> ObjectStore::store_tree(
    const std::vector<TreeEntry>& entries) const {
    std::string raw;
    try {
        raw = encode_tree(entries);
    } catch (const std::invalid_argument& e) {
        return errors::invalid_tree_entry(e.what());
    }

    std::string hash = sha1_hex(raw);
    return store(raw).map([&hash]() { return hash; });
}

// 读取对象并返回解压后的完整序列化字节
Result<std::string> ObjectStore::read_object(const std::string& hash) const {
    return resolve_path(hash)
        .on_success([](const std::string& path) {
            spdlog::debug("path validated: {}", path);
        })
        .and_then([this](const std::string& path) {
            return decompress_file(path);
        })
        .on_success([&hash](const std::string& bytes) {
            spdlog::debug("object {} decompressed, {} bytes", hash, bytes.size());
        });
}

Result<std::string> ObjectStore::object_path(const std::string& hash) const {
    if (!is_valid_hash(hash)) {
        return errors::invalid_hash_format(hash);
    }
    return fs_.make_path(object_relative_path(to_lower_hex(hash)));
}

bool ObjectStore::contains(const std::string& hash) const {
    return resolve_path(hash).ok();
}

// 校验哈希格式、推导路径并确认对象文件存在
Result<std::string> ObjectStore::resolve_path(const std::string& hash) const {
    return object_path(hash).and_then(
        [](const std::string& path) -> Result<std::string> {
            if (!is_regular_file(path)) {
                return errors::not_found(path);
            }
            return path;
        });
}

// 读取对象文件并解压，读取出错为 ReadFailure，解压出错为 DecompressionFailure
Result<std::string> ObjectStore::decompress_file(const std::string& path) const {
    std::string compressed;
    if (!read_whole_file(path, compressed)) {
        return errors::reading_file_error(path + ": " + std::strerror(errno));
    }

    try {
        return zlib_decompress(compressed);
    } catch (const std::runtime_error& e) {
        return errors::decompression_error(e.what());
    }
}

// 确保分片目录存在，返回对象文件的相对路径
Result<std::string> ObjectStore::prepare_shard(const std::string& hash) const {
    std::string dir = hash.substr(0, 2);
    if (!fs_.ensure_directory(dir)) {
        return errors::writing_file_error("cannot create shard directory " +
                                          fs_.make_path(dir));
    }
    return object_relative_path(hash);
}

Result<void> ObjectStore::write_compressed(const std::string& relative,
                                           const std::string& raw) const {
    std::string compressed;
    try {
        compressed = zlib_compress(raw, compression_level_);
    } catch (const std::runtime_error& e) {
        return errors::writing_file_error(e.what());
    }

    std::string path = fs_.make_path(relative);
    if (!fs_.write_file(relative, compressed)) {
        return errors::writing_file_error("failed to write " + path + ": " +
                                          std::strerror(errno));
    }

    spdlog::debug("object written to {}", path);
    return Result<void>();
}

}  // namespace miniodb
