#pragma once

#include <chrono>
#include "common/cancellation.hpp"

namespace submitter {

/**
 * @brief 时间源
 * 节流器和提交状态机通过它读取当前时间和休眠，
 * 单元测试中替换为手动推进的时钟，避免真实等待。
 */
struct time_source {
    typedef std::chrono::steady_clock::time_point time_point;

    virtual ~time_source();

    virtual time_point now() const = 0;

    /**
     * @brief 休眠 duration 长的时间
     * @param duration 休眠时长，非正数时立即返回
     * @param token 取消信号
     * @return 若休眠期间被取消则返回 false
     */
    virtual bool sleep_for(std::chrono::milliseconds duration, const cancellation_token &token) = 0;
};

struct real_time_source : public time_source {
    time_point now() const override;

    bool sleep_for(std::chrono::milliseconds duration, const cancellation_token &token) override;
};

}  // namespace submitter
