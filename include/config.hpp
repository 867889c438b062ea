#pragma once

#include <chrono>
#include <string>

namespace submitter {

/**
 * @brief 评测服务的根地址，提交和查询地址都基于它拼接
 * @defaultValue https://leetcode.com
 */
extern std::string JUDGE_BASE_URL;

/**
 * @brief 提交代码时最多尝试的次数
 * 可以通过 --submit-retries 或环境变量 SUBMITRETRIES 修改
 */
extern int SUBMIT_RETRIES;

/**
 * @brief 查询评测结果时最多尝试的次数
 * 可以通过 --check-retries 或环境变量 CHECKRETRIES 修改
 */
extern int CHECK_RETRIES;

/**
 * @brief 两次请求之间的最小间隔
 * 评测服务在间隔低于 2 秒时很容易触发反爬虫机制
 */
extern std::chrono::milliseconds MIN_REQUEST_DELAY;

/**
 * @brief 节流器放慢后允许的最大请求间隔
 */
extern std::chrono::milliseconds MAX_REQUEST_DELAY;

}  // namespace submitter
