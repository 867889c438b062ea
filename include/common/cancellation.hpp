#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace submitter {

/**
 * @brief 取消信号
 * 由批量提交的所有阻塞点共享，调用 cancel 后所有正在等待的
 * sleep 会被立即唤醒，之后的等待也会立即返回。
 * @note cancel 可以在信号处理函数以外的任意线程调用
 */
struct cancellation_token {
    void cancel();

    bool cancelled() const;

    /**
     * @brief 阻塞等待 duration 长的时间
     * @return 若等待期间被取消则返回 false
     */
    bool wait_for(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> flag{false};
    mutable std::mutex mut;
    mutable std::condition_variable cond;
};

}  // namespace submitter
