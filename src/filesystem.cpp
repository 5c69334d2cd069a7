#include "filesystem.h"

#include <cerrno>
#include <dirent.h>
#include <fstream>
#include <sys/stat.h>
#include <sys/types.h>
#include <utility>
#include <vector>

// 本文件实现基于 POSIX 接口的文件系统辅助函数
namespace {

const std::size_t kReadChunkSize = 65536;

bool is_separator(char c) {
    return c == '/' || c == '\\';
}

// 若目标目录不存在则递归创建，已存在的目录视为成功
bool mkdir_if_needed(const std::string& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) == 0) {
        return S_ISDIR(st.st_mode);
    }

    if (::mkdir(path.c_str(), 0777) == 0) {
        return true;
    }

    if (errno == ENOENT) {
        std::size_t pos = path.find_last_of("/\\");
        if (pos == std::string::npos || pos == 0) {
            return false;
        }
        if (!mkdir_if_needed(path.substr(0, pos))) {
            return false;
        }
        if (::mkdir(path.c_str(), 0777) == 0) {
            return true;
        }
    }

    // 并发写入方可能已抢先创建同一分片目录
    if (errno == EEXIST) {
        return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
    }
    return false;
}

// 目录句柄，离开作用域时自动关闭
class DirHandle {
public:
    explicit DirHandle(const std::string& path) : dir_(::opendir(path.c_str())) {}
    ~DirHandle() {
        if (dir_ != nullptr) {
            ::closedir(dir_);
        }
    }

    DirHandle(const DirHandle&) = delete;
    DirHandle& operator=(const DirHandle&) = delete;

    DIR* get() const { return dir_; }

private:
    DIR* dir_;
};

}  // namespace

namespace miniodb {

// 判断路径是否为普通文件（跟随符号链接）
bool is_regular_file(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

// 判断路径是否为目录
bool is_directory(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

// 判断路径是否为属主可执行的普通文件
bool is_executable_file(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
           (st.st_mode & S_IXUSR) != 0;
}

// 以二进制方式读取整个文件，读取出错时返回 false 且不修改 out
bool read_whole_file(const std::string& path, std::string& out) {
    std::ifstream ifs(path.c_str(), std::ios::binary);
    if (!ifs) {
        return false;
    }

    // istream::read 会把底层 filebuf 抛出的读错误转换为 badbit
    std::string buffer;
    std::vector<char> chunk(kReadChunkSize);
    errno = 0;
    while (ifs.read(chunk.data(), static_cast<std::streamsize>(chunk.size())) ||
           ifs.gcount() > 0) {
        buffer.append(chunk.data(), static_cast<std::size_t>(ifs.gcount()));
    }
    if (ifs.bad()) {
        if (errno == 0) {
            errno = EIO;
        }
        return false;
    }
    out.swap(buffer);
    return true;
}

// 列出目录下除 "." 与 ".." 之外的所有名称
bool list_directory(const std::string& path, std::vector<std::string>& names) {
    DirHandle dir(path);
    if (dir.get() == nullptr) {
        return false;
    }

    std::vector<std::string> result;
    while (true) {
        errno = 0;
        dirent* entry = ::readdir(dir.get());
        if (entry == nullptr) {
            if (errno != 0) {
                return false;
            }
            break;
        }
        std::string name(entry->d_name);
        if (name == "." || name == "..") {
            continue;
        }
        result.push_back(name);
    }

    names.swap(result);
    return true;
}

// 拼接两段路径，保证中间恰好一个分隔符
std::string join_paths(const std::string& a, const std::string& b) {
    if (a.empty()) {
        return b;
    }
    if (b.empty()) {
        return a;
    }
    if (is_separator(a.back())) {
        if (is_separator(b.front())) {
            return a + b.substr(1);
        }
        return a + b;
    }
    if (is_separator(b.front())) {
        return a + b;
    }
    return a + "/" + b;
}

FileSystem::FileSystem(std::string root) : root_(std::move(root)) {}

const std::string& FileSystem::root() const {
    return root_;
}

std::string FileSystem::make_path(const std::string& relative) const {
    return join_paths(root_, relative);
}

// 确保根目录下的相对目录存在
bool FileSystem::ensure_directory(const std::string& relative) const {
    return mkdir_if_needed(make_path(relative));
}

// 以截断方式写入文件，写入失败时返回 false
bool FileSystem::write_file(const std::string& relative,
                            const std::string& data) const {
    std::string full = make_path(relative);
    std::ofstream ofs(full.c_str(), std::ios::binary | std::ios::trunc);
    if (!ofs) {
        return false;
    }
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.close();
    return !ofs.fail();
}

}  // namespace miniodb
