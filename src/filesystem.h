#pragma once

#include <string>
#include <vector>

// 本文件声明对象库使用的文件系统辅助接口
namespace miniodb {

/**
 * @brief 判断路径是否为已存在的普通文件。
 *
 * 目录、符号链接目标以外的特殊文件以及不存在的路径均返回 false。
 */
bool is_regular_file(const std::string& path);

/// 判断路径是否为已存在的目录。
bool is_directory(const std::string& path);

/// 判断普通文件是否带有所有者可执行权限位。
bool is_executable_file(const std::string& path);

/**
 * @brief 以二进制方式读取整个文件。
 *
 * 若文件不存在或打开失败，返回 false 且不修改 out。
 *
 * @param path 文件路径。
 * @param out  输出参数，用于接收文件的全部字节。
 * @return 读取成功返回 true，否则返回 false。
 */
bool read_whole_file(const std::string& path, std::string& out);

/**
 * @brief 列出目录中除 "." 与 ".." 以外的条目名称。
 *
 * @param path  目录路径。
 * @param names 输出参数，用于接收条目名称，顺序未定义。
 * @return 打开或遍历目录失败时返回 false。
 */
bool list_directory(const std::string& path, std::vector<std::string>& names);

/// 拼接两个路径片段，避免产生重复分隔符。
std::string join_paths(const std::string& a, const std::string& b);

/**
 * @brief 以对象根目录为基准的文件系统辅助类。
 *
 * 封装路径拼接、分片目录创建以及二进制文件写入，
 * 统一通过给定的根目录进行访问，避免在调用方重复处理路径。
 */
class FileSystem {
public:
    /**
     * @brief 使用给定根目录构造文件系统对象。
     *
     * @param root 对象根目录路径，例如 ".mini-odb/objects"。
     */
    explicit FileSystem(std::string root);

    const std::string& root() const;

    /**
     * @brief 将相对路径转换为基于根目录的路径。
     *
     * 只进行字符串拼接，不检查路径是否存在。
     */
    std::string make_path(const std::string& relative) const;

    /**
     * @brief 确保相对路径对应的目录存在。
     *
     * 目录已存在时视为成功，可被多个写入方重复调用；必要时递归创建上级目录。
     *
     * @param relative 相对于根目录的目录路径。
     * @return 目录存在且为目录时返回 true，否则返回 false。
     */
    bool ensure_directory(const std::string& relative) const;

    /**
     * @brief 在给定相对路径整体写入二进制数据，已存在的文件会被覆盖。
     *
     * @param relative 相对于根目录的文件路径。
     * @param data     要写入的二进制数据。
     * @return 写入成功返回 true，否则返回 false。
     */
    bool write_file(const std::string& relative, const std::string& data) const;

private:
    std::string root_;
};

}  // namespace miniodb
