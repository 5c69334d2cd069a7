#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

// 本文件声明对象库统一使用的错误分类以及 Result 成功/失败类型
namespace miniodb {

/**
 * @brief 对象库可能返回的失败类别（封闭集合）。
 */
enum class ErrorKind {
    InvalidHash,           ///< 哈希不是 40 位十六进制字符串
    NotFound,              ///< 派生路径上不存在对象文件
    DecompressionFailure,  ///< 压缩流被截断或已损坏
    BlobDecodeFailure,     ///< blob 头部格式错误或长度不符
    TreeDecodeFailure,     ///< tree 条目分隔符缺失或哈希被截断
    WriteFailure,          ///< 写入对象文件时发生 I/O 错误
    ReadFailure,           ///< 文件存在但读取失败
    InvalidEntry           ///< 待编码的 tree 条目字段非法
};

/**
 * @brief 一次失败的完整描述。
 *
 * kind 用于调用方分支判断，code 为稳定的符号名，message 为可读说明，
 * 其中包含被包装的底层原因。
 */
struct Error {
    ErrorKind kind;
    std::string code;
    std::string message;
};

/// 返回错误类别的可打印名称，例如 "InvalidHash"。
const char* error_kind_name(ErrorKind kind);

/// 以 "<code>: <message>" 形式描述错误，用于日志与命令行输出。
std::string describe(const Error& error);

// 各类错误的构造函数
namespace errors {

Error invalid_hash_format(const std::string& hash);
Error not_found(const std::string& path);
Error decompression_error(const std::string& cause);
Error parse_blob_header_error();
Error blob_parse_error(const std::string& cause);
Error tree_parse_error(const std::string& cause);
Error writing_file_error(const std::string& cause);
Error reading_file_error(const std::string& cause);
Error invalid_tree_entry(const std::string& cause);

}  // namespace errors

template <typename T>
class Result;

namespace detail {

template <typename R>
struct is_result : std::false_type {};

template <typename U>
struct is_result<Result<U> > : std::true_type {};

}  // namespace detail

/**
 * @brief 成功值或失败错误二选一的结果类型。
 *
 * 通过 map / and_then 组合处理流水线，任一环节失败后其余环节都会被跳过，
 * 失败原样传递到末尾；on_success / on_failure 只观察结果，不改变结果。
 *
 * @tparam T 成功值类型，要求可默认构造。
 */
template <typename T>
class Result {
public:
    Result(const T& value) : ok_(true), value_(value) {}
    Result(T&& value) : ok_(true), value_(std::move(value)) {}
    Result(const Error& error) : ok_(false), error_(error) {}
    Result(Error&& error) : ok_(false), error_(std::move(error)) {}

    bool ok() const { return ok_; }
    explicit operator bool() const { return ok_; }

    /**
     * @brief 获取成功值。
     * @throws std::logic_error 当结果为失败时抛出。
     */
    const T& value() const {
        if (!ok_) {
            throw std::logic_error("Result::value() called on failure: " +
                                   error_.code);
        }
        return value_;
    }

    T& value() {
        if (!ok_) {
            throw std::logic_error("Result::value() called on failure: " +
                                   error_.code);
        }
        return value_;
    }

    /**
     * @brief 获取失败错误。
     * @throws std::logic_error 当结果为成功时抛出。
     */
    const Error& error() const {
        if (ok_) {
            throw std::logic_error("Result::error() called on success");
        }
        return error_;
    }

    /**
     * @brief 对成功值做变换，失败则原样传递。
     *
     * @param f 形如 U f(const T&) 的可调用对象，U 不能为 void。
     */
    template <typename F>
    auto map(F f) const -> Result<decltype(f(std::declval<const T&>()))> {
        typedef decltype(f(std::declval<const T&>())) U;
        if (!ok_) {
            return Result<U>(error_);
        }
        return Result<U>(f(value_));
    }

    /**
     * @brief 串联下一个可能失败的步骤。
     *
     * @param f 形如 Result<U> f(const T&) 的可调用对象。
     */
    template <typename F>
    auto and_then(F f) const -> decltype(f(std::declval<const T&>())) {
        typedef decltype(f(std::declval<const T&>())) R;
        static_assert(detail::is_result<R>::value,
                      "and_then callback must return a Result");
        if (!ok_) {
            return R(error_);
        }
        return f(value_);
    }

    /// 成功时以成功值调用 f，返回结果本身。
    template <typename F>
    Result on_success(F f) const {
        if (ok_) {
            f(value_);
        }
        return *this;
    }

    /// 失败时以错误调用 f，返回结果本身。
    template <typename F>
    Result on_failure(F f) const {
        if (!ok_) {
            f(error_);
        }
        return *this;
    }

private:
    bool ok_;
    T value_{};
    Error error_{};
};

/**
 * @brief 无返回值操作的结果类型。
 */
template <>
class Result<void> {
public:
    Result() : ok_(true) {}
    Result(const Error& error) : ok_(false), error_(error) {}
    Result(Error&& error) : ok_(false), error_(std::move(error)) {}

    bool ok() const { return ok_; }
    explicit operator bool() const { return ok_; }

    const Error& error() const {
        if (ok_) {
            throw std::logic_error("Result::error() called on success");
        }
        return error_;
    }

    template <typename F>
    auto map(F f) const -> Result<decltype(f())> {
        typedef decltype(f()) U;
        if (!ok_) {
            return Result<U>(error_);
        }
        return Result<U>(f());
    }

    template <typename F>
    auto and_then(F f) const -> decltype(f()) {
        typedef decltype(f()) R;
        static_assert(detail::is_result<R>::value,
                      "and_then callback must return a Result");
        if (!ok_) {
            return R(error_);
        }
        return f();
    }

    template <typename F>
    Result on_success(F f) const {
        if (ok_) {
            f();
        }
        return *this;
    }

    template <typename F>
    Result on_failure(F f) const {
        if (!ok_) {
            f(error_);
        }
        return *this;
    }

private:
    bool ok_;
    Error error_{};
};

}  // namespace miniodb
