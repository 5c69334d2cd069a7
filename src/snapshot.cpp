#include "snapshot.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <vector>

#include <spdlog/spdlog.h>

#include "filesystem.h"
#include "object_header.h"

// 本文件实现目录快照：递归写入 blob 与 tree 对象
namespace {

bool entry_name_less(const miniodb::TreeEntry& a, const miniodb::TreeEntry& b) {
    return a.path < b.path;
}

// 递归遍历目录并构建 tree，对每个目录返回对应的 tree 哈希
miniodb::Result<std::string> write_tree_recursive(const miniodb::ObjectStore& store,
                                                  const std::string& dir_path) {
    std::vector<std::string> names;
    if (!miniodb::list_directory(dir_path, names)) {
        return miniodb::errors::reading_file_error(
            "cannot list directory " + dir_path + ": " + std::strerror(errno));
    }

    std::vector<miniodb::TreeEntry> entries;
    for (std::size_t i = 0; i < names.size(); ++i) {
        const std::string& name = names[i];
        if (name == miniodb::kRepositoryDirName) {
            continue;
        }

        std::string full_path = miniodb::join_paths(dir_path, name);
        struct stat st;
        if (::lstat(full_path.c_str(), &st) != 0) {
            return miniodb::errors::reading_file_error(
                "cannot stat " + full_path + ": " + std::strerror(errno));
        }

        miniodb::TreeEntry entry;
        entry.path = name;
        if (S_ISDIR(st.st_mode)) {
            miniodb::Result<std::string> child = write_tree_recursive(store, full_path);
            if (!child) {
                return child;
            }
            entry.mode = miniodb::kTreeMode;
            entry.sha = child.value();
        } else if (S_ISREG(st.st_mode)) {
            miniodb::Result<std::string> blob = store.generate_blob(full_path).and_then(
                [&store](const miniodb::Blob& b) { return store.store_blob(b.content); });
            if (!blob) {
                return blob;
            }
            entry.mode = (st.st_mode & S_IXUSR) != 0 ? miniodb::kExecutableFileMode
                                                     : miniodb::kRegularFileMode;
            entry.sha = blob.value();
        } else {
            // 暂不处理符号链接等其他类型
            spdlog::debug("skipping {}", full_path);
            continue;
        }
        entry.type = miniodb::classify_mode(entry.mode);
        entries.push_back(entry);
    }

    std::sort(entries.begin(), entries.end(), entry_name_less);
    return store.store_tree(entries);
}

}  // namespace

namespace miniodb {

Result<std::string> write_tree(const ObjectStore& store, const std::string& root_dir) {
    return write_tree_recursive(store, root_dir).on_success(
        [&root_dir](const std::string& hash) {
            spdlog::info("wrote tree {} for {}", hash, root_dir);
        });
}

}  // namespace miniodb
