#pragma once

#include <string>

#include "object_store.h"
#include "result.h"

// 本文件声明目录快照写入接口
namespace miniodb {

/// 目录快照时跳过的仓库目录名。
const char kRepositoryDirName[] = ".mini-odb";

/**
 * @brief 将工作目录递归写入对象存储，返回顶层 tree 的哈希。
 *
 * 普通文件写入为 blob（可执行文件模式 "100755"，其余 "100644"），
 * 子目录写入为 tree（模式 "040000"），符号链接等其他类型被忽略；
 * 每个 tree 的条目按名称字节序排序，使结果与遍历顺序无关。
 *
 * @param store    对象存储实例，用于写入 blob/tree 对象。
 * @param root_dir 需要快照的工作目录路径。
 * @return 顶层 tree 哈希；目录或文件读取失败时返回 ReadFailure，
 *         写入失败时返回 WriteFailure。
 */
Result<std::string> write_tree(const ObjectStore& store, const std::string& root_dir);

}  // namespace miniodb
