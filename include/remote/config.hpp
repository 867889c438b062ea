#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include "../config.hpp"

namespace submitter::remote {

/**
 * @brief 描述评测服务的连接信息
 */
struct judge_endpoint {
    /**
     * @brief 评测服务根地址，比如 https://leetcode.com
     */
    std::string base_url = JUDGE_BASE_URL;

    /**
     * @brief 伪装成浏览器时使用的 User-Agent
     */
    std::string user_agent = "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";

    /**
     * @brief 单次请求的超时时间（秒）
     */
    long timeout = 30;

    /**
     * @brief 建立连接的超时时间（秒）
     */
    long connect_timeout = 10;
};

void from_json(const nlohmann::json &j, judge_endpoint &endpoint);

/**
 * @brief 节流器参数
 * 约束 min_delay <= max_delay
 */
struct throttle_policy {
    std::chrono::milliseconds min_delay = MIN_REQUEST_DELAY;

    std::chrono::milliseconds max_delay = MAX_REQUEST_DELAY;

    /**
     * @brief 连续多少次没有放慢的请求之后，请求间隔回落一次
     * 为 0 时关闭回落，间隔只增不减
     */
    int recovery_touches = 10;

    /**
     * @brief 每次回落时间隔乘上的系数，取值 (0, 1]
     */
    double recovery_factor = 0.75;
};

void from_json(const nlohmann::json &j, throttle_policy &policy);

/**
 * @brief 提交和查询的重试策略
 */
struct retry_policy {
    int submit_retries = SUBMIT_RETRIES;

    int check_retries = CHECK_RETRIES;

    /**
     * @brief 每次提交前额外等待 [submit_delay, submit_delay + submit_jitter) 的随机时长
     * 让提交节奏看起来更像人工操作
     */
    std::chrono::milliseconds submit_delay{5000};

    std::chrono::milliseconds submit_jitter{5000};

    /**
     * @brief 第 i 次提交失败后额外等待 i * retry_backoff
     */
    std::chrono::milliseconds retry_backoff{10000};

    /**
     * @brief 查询之间的渐进间隔：第 2 次起等待 poll_delay，
     * 超过 poll_delay_threshold 次后等待 poll_delay_long
     */
    std::chrono::milliseconds poll_delay{3000};

    std::chrono::milliseconds poll_delay_long{5000};

    int poll_delay_threshold = 3;
};

void from_json(const nlohmann::json &j, retry_policy &policy);

}  // namespace submitter::remote
