#include "remote/throttler.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <stdexcept>

namespace submitter::remote {
using namespace std;

throttler::throttler(const throttle_policy &policy, time_source &clock, const cancellation_token &token)
    : policy(policy), clock(clock), token(token), delay(policy.min_delay) {
    if (policy.min_delay.count() < 0 || policy.min_delay > policy.max_delay)
        throw invalid_argument("throttler: min_delay must be within [0, max_delay]");
}

void throttler::ready() {
    lock_guard<mutex> lock(mut);
    armed = true;
}

bool throttler::wait() {
    // 持有锁直到放行，多个调用方共享节流器时按顺序通过
    unique_lock<mutex> lock(mut);
    if (!armed || token.cancelled()) return false;

    if (last_request) {
        auto target = *last_request + delay;
        auto now = clock.now();
        if (target > now) {
            auto remaining = chrono::ceil<chrono::milliseconds>(target - now);
            DLOG(INFO) << "Throttling for " << remaining.count() << "ms";
            if (!clock.sleep_for(remaining, token)) return false;
        }
    }
    if (!armed || token.cancelled()) return false;

    // 预占当前时刻，避免另一个调用方在本次请求 touch 之前被放行
    last_request = clock.now();
    return true;
}

void throttler::touch() {
    lock_guard<mutex> lock(mut);
    last_request = clock.now();

    if (policy.recovery_touches <= 0) return;
    if (++calm_touches < policy.recovery_touches) return;
    calm_touches = 0;

    auto decayed = chrono::milliseconds((long long)(delay.count() * policy.recovery_factor));
    decayed = max(decayed, policy.min_delay);
    if (decayed < delay) {
        DLOG(INFO) << "Throttle delay recovering: " << delay.count() << "ms -> " << decayed.count() << "ms";
        delay = decayed;
    }
}

void throttler::slowdown() {
    lock_guard<mutex> lock(mut);
    calm_touches = 0;
    auto widened = max(delay * 2, chrono::milliseconds(1));
    delay = min(widened, policy.max_delay);
    LOG(INFO) << "Slowing down, throttle delay is now " << delay.count() << "ms";
}

void throttler::stop() {
    lock_guard<mutex> lock(mut);
    armed = false;
}

chrono::milliseconds throttler::current_delay() const {
    lock_guard<mutex> lock(mut);
    return delay;
}

chrono::milliseconds throttler::min_delay() const {
    return policy.min_delay;
}

chrono::milliseconds throttler::max_delay() const {
    return policy.max_delay;
}

}  // namespace submitter::remote
