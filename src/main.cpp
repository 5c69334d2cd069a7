#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "config.h"
#include "object_header.h"
#include "object_store.h"
#include "snapshot.h"
#include "tree.h"

// 本文件实现 mini-odb 命令行入口及子命令分发
namespace {

const int kExitFailure = 1;
const int kExitUsage = 2;

int report(const miniodb::Error& error) {
    std::cerr << "mini-odb: " << miniodb::describe(error) << "\n";
    return kExitFailure;
}

void print_tree(const miniodb::Tree& tree, bool name_only) {
    for (std::size_t i = 0; i < tree.entries.size(); ++i) {
        const miniodb::TreeEntry& e = tree.entries[i];
        if (name_only) {
            std::cout << e.path << "\n";
        } else {
            std::cout << e.mode << " " << miniodb::entry_type_name(e.type) << " "
                      << e.sha << "\t" << e.path << "\n";
        }
    }
}

// 实现 hash-object 子命令，计算文件的 blob 哈希，-w 时同时写入存储
int command_hash_object(const miniodb::ObjectStore& store,
                        const std::vector<std::string>& args) {
    bool write = false;
    std::string path;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "-w") {
            write = true;
        } else if (path.empty()) {
            path = args[i];
        } else {
            path.clear();
            break;
        }
    }
    if (path.empty()) {
        std::cerr << "usage: mini-odb hash-object [-w] <file>\n";
        return kExitUsage;
    }

    miniodb::Result<miniodb::Blob> blob = store.generate_blob(path);
    if (!blob) {
        return report(blob.error());
    }

    if (write) {
        miniodb::Result<std::string> stored = store.store_blob(blob.value().content);
        if (!stored) {
            return report(stored.error());
        }
        spdlog::info("stored blob {}", stored.value());
    }

    std::cout << blob.value().sha << "\n";
    return 0;
}

// 实现 cat-file 子命令，按 -p/-t/-s 输出对象内容、类型或大小
int command_cat_file(const miniodb::ObjectStore& store,
                     const std::vector<std::string>& args) {
    if (args.size() != 2 || (args[0] != "-p" && args[0] != "-t" && args[0] != "-s")) {
        std::cerr << "usage: mini-odb cat-file (-p|-t|-s) <hash>\n";
        return kExitUsage;
    }
    const std::string& flag = args[0];
    const std::string& hash = args[1];

    miniodb::Result<std::string> raw = store.read_object(hash);
    if (!raw) {
        return report(raw.error());
    }

    miniodb::ObjectHeader header;
    if (!miniodb::split_object_header(raw.value(), header) || header.fields.size() != 2) {
        std::cerr << "mini-odb: malformed object header in " << hash << "\n";
        return kExitFailure;
    }

    if (flag == "-t") {
        std::cout << header.fields[0] << "\n";
        return 0;
    }
    if (flag == "-s") {
        std::cout << header.fields[1] << "\n";
        return 0;
    }

    if (header.fields[0] == miniodb::kBlobType) {
        miniodb::Result<miniodb::Blob> blob = miniodb::decode_blob(raw.value());
        if (!blob) {
            return report(blob.error());
        }
        std::cout << blob.value().content;
        return 0;
    }
    if (header.fields[0] == miniodb::kTreeType) {
        miniodb::Result<miniodb::Tree> tree = miniodb::decode_tree(raw.value());
        if (!tree) {
            return report(tree.error());
        }
        print_tree(tree.value(), false);
        return 0;
    }

    std::cerr << "mini-odb: unsupported object type '" << header.fields[0] << "'\n";
    return kExitFailure;
}

// 实现 ls-tree 子命令，列出 tree 对象的条目
int command_ls_tree(const miniodb::ObjectStore& store,
                    const std::vector<std::string>& args) {
    bool name_only = false;
    std::string hash;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--name-only") {
            name_only = true;
        } else {
            hash = args[i];
        }
    }
    if (hash.empty()) {
        std::cerr << "usage: mini-odb ls-tree [--name-only] <hash>\n";
        return kExitUsage;
    }

    miniodb::Result<miniodb::Tree> tree = store.get_tree(hash);
    if (!tree) {
        return report(tree.error());
    }
    print_tree(tree.value(), name_only);
    return 0;
}

// 实现 write-tree 子命令，从指定目录（默认当前目录）构建目录快照
int command_write_tree(const miniodb::ObjectStore& store,
                       const std::vector<std::string>& args) {
    if (args.size() > 1) {
        std::cerr << "usage: mini-odb write-tree [<dir>]\n";
        return kExitUsage;
    }

    std::string dir = args.empty() ? std::string(".") : args[0];
    miniodb::Result<std::string> hash = miniodb::write_tree(store, dir);
    if (!hash) {
        return report(hash.error());
    }
    std::cout << hash.value() << "\n";
    return 0;
}

void print_usage() {
    std::cerr << "usage: mini-odb <command> [args]\n";
    std::cerr << "commands:\n";
    std::cerr << "  hash-object [-w] <file>\n";
    std::cerr << "  cat-file (-p|-t|-s) <hash>\n";
    std::cerr << "  ls-tree [--name-only] <hash>\n";
    std::cerr << "  write-tree [<dir>]\n";
}

}  // namespace

// 程序入口，根据第一个参数选择执行的子命令
int main(int argc, char** argv) {
    miniodb::Config config = miniodb::load_config_from_env();
    miniodb::apply_log_level(config);

    if (argc < 2) {
        print_usage();
        return kExitUsage;
    }

    std::string cmd = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);
    miniodb::ObjectStore store(config.objects_dir, config.compression_level);

    if (cmd == "hash-object") {
        return command_hash_object(store, args);
    }
    if (cmd == "cat-file") {
        return command_cat_file(store, args);
    }
    if (cmd == "ls-tree") {
        return command_ls_tree(store, args);
    }
    if (cmd == "write-tree") {
        return command_write_tree(store, args);
    }

    std::cerr << "unknown command: " << cmd << "\n";
    print_usage();
    return kExitUsage;
}
