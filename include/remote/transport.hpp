#pragma once

#include <cstdint>
#include <string>
#include "remote/config.hpp"

namespace submitter::remote {

enum class transport_status {
    OK,  // 收到了 HTTP 响应，不论状态码
    NETWORK_ERROR,  // 连接失败、超时等暂时性错误
    CONFIGURATION_ERROR  // 地址不合法、协议不支持等重试也无法解决的错误
};

struct http_request {
    std::string method;
    std::string url;
    std::string body;
};

/**
 * @brief 一次 HTTP 交换的原始结果
 * body 是未经解压的原始字节，由调用方自行判断编码
 */
struct http_response {
    transport_status status = transport_status::OK;
    long status_code = 0;
    std::string body;

    /**
     * @brief status 不为 OK 时的错误描述
     */
    std::string error;
};

/**
 * @brief 与评测服务进行一次 HTTP 交换
 * 实现负责附加登录凭据和浏览器特征请求头，不解释响应内容。
 */
struct transport {
    virtual ~transport();

    /**
     * @brief 执行请求
     * @note 该函数将阻塞到请求完成
     * @note 该函数不抛出网络异常，所有失败都通过 http_response::status 返回
     */
    virtual http_response execute(const http_request &request) = 0;
};

/**
 * @brief 根据目标地址构造一个看起来合理的 Referer
 * 去掉路径的最后一段，比如 https://leetcode.com/problems/two-sum/submit/
 * 对应 https://leetcode.com/problems/two-sum
 */
std::string make_referer(const std::string &url);

/**
 * @brief 提交地址 <base>/problems/{slug}/submit/
 */
std::string submit_url(const judge_endpoint &endpoint, const std::string &title_slug);

/**
 * @brief 查询地址 <base>/submissions/detail/{id}/check/
 */
std::string check_url(const judge_endpoint &endpoint, std::uint64_t submission_id);

/**
 * @brief 提取地址中的主机名，比如 https://leetcode.com/ 对应 leetcode.com
 */
std::string host_of(const std::string &url);

}  // namespace submitter::remote
