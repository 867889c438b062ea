#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include "common/cancellation.hpp"
#include "common/time_source.hpp"
#include "remote/config.hpp"

namespace submitter::remote {

/**
 * @brief 请求节流器
 * 保证同一个节流器放行的两次请求之间至少间隔 current_delay，
 * 评测服务发出限流信号时通过 slowdown 加大间隔。
 * 
 * 一个批量提交中所有的提交共享同一个节流器。所有状态都由 mut 保护，
 * 因此多个 orchestrator 共享同一个节流器时仍然能保证请求间隔。
 * 
 * 间隔回落策略：连续 recovery_touches 次 touch 之间没有调用 slowdown，
 * 则 current_delay 乘上 recovery_factor，但不低于 min_delay。
 */
struct throttler {
    throttler(const throttle_policy &policy, time_source &clock, const cancellation_token &token);

    /**
     * @brief 为新一轮重试重新启用节流器，不重置 current_delay
     */
    void ready();

    /**
     * @brief 阻塞到距离上一次请求至少 current_delay 为止
     * @return 节流器被 stop 或批量提交被取消时返回 false
     */
    bool wait();

    /**
     * @brief 记录当前时间为最近一次请求的时间，不论请求是否成功
     */
    void touch();

    /**
     * @brief 加倍 current_delay，不超过 max_delay
     */
    void slowdown();

    /**
     * @brief 停止当前一轮，之后的 wait 返回 false，直到再次调用 ready
     */
    void stop();

    std::chrono::milliseconds current_delay() const;

    std::chrono::milliseconds min_delay() const;

    std::chrono::milliseconds max_delay() const;

private:
    throttle_policy policy;
    time_source &clock;
    const cancellation_token &token;

    mutable std::mutex mut;
    std::chrono::milliseconds delay;
    std::optional<time_source::time_point> last_request;
    int calm_touches = 0;
    bool armed = true;
};

}  // namespace submitter::remote
