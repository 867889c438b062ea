#pragma once

#include "remote/config.hpp"
#include "remote/credentials.hpp"
#include "remote/transport.hpp"

namespace submitter::remote {

/**
 * @brief 基于 libcurl 的 transport
 * 每次请求都附加会话 cookie、CSRF token、浏览器特征请求头和 Referer。
 * 请求头中声明接受 gzip、deflate、br，但不让 curl 自动解压：
 * 评测服务经常错标或漏标 Content-Encoding，解压交给 decode_payload 完成。
 */
struct curl_transport : public transport {
    curl_transport(const judge_endpoint &endpoint, const credentials &creds);

    http_response execute(const http_request &request) override;

private:
    judge_endpoint endpoint;
    credentials creds;
};

}  // namespace submitter::remote
