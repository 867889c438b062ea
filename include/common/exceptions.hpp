#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <boost/throw_exception.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace submitter {

struct submitter_exception : std::exception {
    submitter_exception();
    explicit submitter_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const submitter_exception &ex);

    template <typename T>
    submitter_exception operator<<(const T &t) const {
        return submitter_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示不可恢复的错误，比如配置错误、无法获取登录凭据
 * 批量提交遇到该错误时必须立即终止，不再处理剩余的题目
 */
struct fatal_error : public submitter_exception {
    fatal_error();
    explicit fatal_error(const std::string &message);
};

/**
 * @brief 表示批量提交被外部取消（比如收到 SIGINT）
 */
struct cancelled_error : public fatal_error {
    cancelled_error();
    explicit cancelled_error(const std::string &message);
};

/**
 * @brief 表示该提交无论重试多少次都不可能成功
 * 比如代码过长被评测服务拒绝，或者请求本身不合法。
 * message 将作为该提交的最终状态保存
 */
struct non_retriable_error : public submitter_exception {
    non_retriable_error();
    explicit non_retriable_error(const std::string &message);
};

/**
 * @brief 表示重试次数已经用尽，但仍然没有得到结果
 * 这种情况绝不能当作评测通过处理
 */
struct retry_exhausted_error : public submitter_exception {
    retry_exhausted_error();
    explicit retry_exhausted_error(const std::string &message);
};

/**
 * @brief 表示题目文件读写错误
 */
struct store_error : public submitter_exception {
    store_error();
    explicit store_error(const std::string &message);
};

}  // namespace submitter
