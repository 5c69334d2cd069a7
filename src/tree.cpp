#include "tree.h"

#include <stdexcept>

#include "hash.h"
#include "object_header.h"

// 本文件实现 tree 对象的编码、解析以及条目类别推导
namespace {

// 编码前检查条目字段，避免生成无法解析回来的字节
void check_entry(const miniodb::TreeEntry& entry) {
    if (entry.mode.find(' ') != std::string::npos ||
        entry.mode.find('\0') != std::string::npos) {
        throw std::invalid_argument("invalid mode '" + entry.mode + "'");
    }
    if (entry.path.find('\0') != std::string::npos) {
        throw std::invalid_argument("invalid path for mode " + entry.mode);
    }
}

}  // namespace

namespace miniodb {

// 返回条目类别的文本名称
const char* entry_type_name(EntryType type) {
    switch (type) {
        case EntryType::Blob:
            return kBlobType;
        case EntryType::Tree:
            return kTreeType;
        case EntryType::Unknown:
            break;
    }
    return "unknown";
}

// 由 mode 推导条目类别："100" 前缀为 blob，"040000" 为 tree
EntryType classify_mode(const std::string& mode) {
    if (mode.compare(0, 3, kFileModePrefix) == 0) {
        return EntryType::Blob;
    }
    if (mode == kTreeMode) {
        return EntryType::Tree;
    }
    return EntryType::Unknown;
}

// 按给定顺序序列化所有条目并加上 tree 头部
std::string encode_tree(const std::vector<TreeEntry>& entries) {
    std::string body;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const TreeEntry& e = entries[i];
        check_entry(e);
        body.append(e.mode);
        body.push_back(' ');
        body.append(e.path);
        body.push_back('\0');
        body.append(hex_to_raw(e.sha));
    }

    std::string content = make_object_header(kTreeType, body.size());
    content.append(body);
    return content;
}

// 逐条解析 tree 字节，任一条目格式错误即整体失败
Result<Tree> decode_tree(const std::string& bytes) {
    ObjectHeader header;
    if (!split_object_header(bytes, header)) {
        return errors::tree_parse_error("missing header terminator");
    }

    Tree tree;
    std::size_t idx = header.terminator + 1;
    while (idx < bytes.size()) {
        std::size_t space_pos = bytes.find(' ', idx);
        if (space_pos == std::string::npos) {
            return errors::tree_parse_error("missing mode delimiter at offset " +
                                            std::to_string(idx));
        }

        std::size_t path_end = bytes.find('\0', space_pos + 1);
        if (path_end == std::string::npos) {
            return errors::tree_parse_error("missing path terminator at offset " +
                                            std::to_string(space_pos + 1));
        }

        std::size_t hash_start = path_end + 1;
        if (bytes.size() - hash_start < kRawHashSize) {
            return errors::tree_parse_error("truncated hash at offset " +
                                            std::to_string(hash_start));
        }

        TreeEntry entry;
        entry.mode = bytes.substr(idx, space_pos - idx);
        entry.path = bytes.substr(space_pos + 1, path_end - space_pos - 1);
        entry.sha = raw_to_hex(bytes.substr(hash_start, kRawHashSize));
        entry.type = classify_mode(entry.mode);
        tree.entries.push_back(entry);

        idx = hash_start + kRawHashSize;
    }

    tree.sha = sha1_hex(bytes);
    return tree;
}

}  // namespace miniodb
