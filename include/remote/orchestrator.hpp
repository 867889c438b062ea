#pragma once

#include <random>
#include "common/cancellation.hpp"
#include "common/time_source.hpp"
#include "remote/classifier.hpp"
#include "remote/config.hpp"
#include "remote/messages.hpp"
#include "remote/throttler.hpp"
#include "remote/transport.hpp"

namespace submitter::remote {

/**
 * @brief 提交状态机
 * 
 * IDLE -> SUBMITTING -> SUBMITTED -> POLLING -> FINISHED
 *              |                        |
 *              +----------> FAILED <----+
 * 
 * 一次只处理一个提交：先提交代码拿到 submission_id，再轮询评测结果直到
 * finished 为真。每次请求前都要经过节流器，失败时按分类决定终止批量提交、
 * 跳过该提交还是重试。
 */
struct submission_orchestrator {
    enum class state {
        IDLE,
        SUBMITTING,
        SUBMITTED,
        POLLING,
        FINISHED,
        FAILED
    };

    /**
     * @param client 发送请求的 transport
     * @param throttle 批量提交共享的节流器
     * @param clock 重试间隔的休眠使用的时间源
     * @param token 取消信号，所有休眠都会被它打断
     */
    submission_orchestrator(transport &client, throttler &throttle, time_source &clock, const cancellation_token &token,
                            const judge_endpoint &endpoint, const retry_policy &policy);

    /**
     * @brief 提交代码
     * @return 评测服务分配的 submission_id
     * @throw fatal_error 不可恢复的错误，批量提交必须终止
     * @throw non_retriable_error 代码被拒绝或请求不合法
     * @throw retry_exhausted_error submit_retries 次尝试都失败
     */
    submission_handle submit(const submission_request &request);

    /**
     * @brief 轮询评测结果直到 finished 为真
     * @throw fatal_error 不可恢复的错误
     * @throw non_retriable_error 请求不合法或未授权
     * @throw retry_exhausted_error check_retries 次查询后仍未完成
     */
    check_result poll(const submission_handle &handle);

    /**
     * @brief 提交并轮询评测结果
     * 代码被拒绝时不会查询，直接返回 REJECTED，result 的 finished 为真、
     * status_msg 为拒绝原因；重试用尽时返回 EXHAUSTED。
     * @throw fatal_error 不可恢复的错误，批量提交必须终止
     */
    submission_outcome submit_and_check(const submission_request &request);

    state current_state() const;

private:
    void enter(state next);

    void sleep(std::chrono::milliseconds duration);

    std::chrono::milliseconds jitter(std::chrono::milliseconds upper);

    transport &client;
    throttler &throttle;
    time_source &clock;
    const cancellation_token &token;
    judge_endpoint endpoint;
    retry_policy policy;
    state current = state::IDLE;
    std::mt19937_64 rng;
};

const char *to_string(submission_orchestrator::state s);

}  // namespace submitter::remote
