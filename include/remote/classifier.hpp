#pragma once

#include <optional>
#include <string>
#include <variant>
#include "remote/transport.hpp"

namespace submitter::remote {

enum class request_phase {
    SUBMIT,
    POLL
};

/**
 * @brief 不可恢复，终止整个批量提交
 */
struct fatal_failure {
    std::string reason;
};

/**
 * @brief 该提交不可能成功，跳过并把 message 记为最终状态
 */
struct non_retriable_failure {
    std::string message;
};

/**
 * @brief 暂时性错误，在重试次数内重试
 * overload 为真表示评测服务发出了限流或繁忙信号，需要放慢节流器
 */
struct retriable_failure {
    std::string reason;
    bool overload = false;
};

typedef std::variant<fatal_failure, non_retriable_failure, retriable_failure> classification;

/**
 * @brief 根据 HTTP 交换的结果分类错误
 * @param phase 当前是提交还是查询，403 在两个阶段的含义不同
 * @param response transport 返回的原始结果
 * @param decoded_body 解压后的响应体，用于识别代码被拒绝的信息
 * @return 状态码为 2xx 时返回空，响应内容交给调用方继续解析
 */
std::optional<classification> classify(request_phase phase, const http_response &response, const std::string &decoded_body);

/**
 * @brief 2xx 响应解压后仍无法解析，按暂时性错误处理
 */
classification classify_malformed(const std::string &reason);

/**
 * @brief 从响应体的 error 字段中识别代码被拒绝的信息，比如代码过长
 * @return 拒绝信息，响应体不是这种错误时返回空
 */
std::optional<std::string> code_rejection_message(const std::string &decoded_body);

std::string describe(const classification &c);

}  // namespace submitter::remote
