#pragma once

#include <string>
#include <vector>

#include "blob.h"
#include "filesystem.h"
#include "result.h"
#include "tree.h"
#include "zlib_utils.h"

// 本文件声明对象存储类，负责对象的寻址、压缩落盘与读取校验
namespace miniodb {

/**
 * @brief 基于内容寻址的对象存储。
 *
 * 每个对象以其序列化字节的 SHA-1 哈希为键，压缩后保存在
 * "<root>/<哈希前 2 位>/<其余 38 位>"。存储只追加对象，从不删除或修改。
 * 实例除根目录与压缩级别外不保存任何状态，各次调用之间互不影响。
 */
class ObjectStore {
public:
    /**
     * @brief 使用给定对象根目录构造对象存储。
     *
     * 根目录应已存在且可写，构造时不做检查。
     *
     * @param root              对象根目录路径，例如 ".mini-odb/objects"。
     * @param compression_level 写入时使用的 zlib 压缩级别。
     */
    explicit ObjectStore(const std::string& root,
                         int compression_level = kDefaultCompressionLevel);

    const std::string& root() const;

    /**
     * @brief 按哈希读取并解码 blob 对象。
     *
     * 依次完成哈希格式校验、路径推导、存在性检查、解压和 blob 解码，
     * 任一环节失败即返回对应错误（InvalidHash、NotFound、
     * DecompressionFailure、BlobDecodeFailure）。
     */
    Result<Blob> get_blob(const std::string& hash) const;

    /**
     * @brief 按哈希读取并解码 tree 对象。
     *
     * 流程与 get_blob 相同，解码失败时返回 TreeDecodeFailure。
     */
    Result<Tree> get_tree(const std::string& hash) const;

    /**
     * @brief 将已序列化的对象字节压缩写入存储。
     *
     * 计算哈希、确保分片目录存在后整体覆盖写入目标文件，重复写入相同
     * 字节得到相同路径与相同文件。
     *
     * @param raw 含头部的完整序列化字节。
     */
    Result<void> store(const std::string& raw) const;

    /**
     * @brief 读取文件并生成 blob 对象，但不写入存储。
     *
     * 文件按二进制读取，头部长度为字节数；生成的字节经 decode_blob 校验。
     * 文件不存在时返回 NotFound。
     */
    Result<Blob> generate_blob(const std::string& file_path) const;

    /**
     * @brief 将原始内容编码为 blob 并写入存储。
     * @return 新对象的哈希。
     */
    Result<std::string> store_blob(const std::string& content) const;

    /**
     * @brief 将条目列表编码为 tree 并写入存储。
     * @return 新对象的哈希；条目非法时返回 InvalidEntry。
     */
    Result<std::string> store_tree(const std::vector<TreeEntry>& entries) const;

    /**
     * @brief 按哈希读取对象并解压，返回含头部的序列化字节，不做解码。
     */
    Result<std::string> read_object(const std::string& hash) const;

    /**
     * @brief 计算哈希对应的对象文件路径，不检查文件是否存在。
     *
     * 大写十六进制哈希会先转换为小写。
     */
    Result<std::string> object_path(const std::string& hash) const;

    /// 判断哈希合法且对应的对象文件存在。
    bool contains(const std::string& hash) const;

private:
    Result<std::string> resolve_path(const std::string& hash) const;
    Result<std::string> decompress_file(const std::string& path) const;
    Result<std::string> prepare_shard(const std::string& hash) const;
    Result<void> write_compressed(const std::string& relative,
                                  const std::string& raw) const;

    FileSystem fs_;
    int compression_level_;
};

}  // namespace miniodb
