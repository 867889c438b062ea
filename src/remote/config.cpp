#include "remote/config.hpp"
#include <stdexcept>

namespace submitter::remote {
using namespace std;
using namespace nlohmann;

static chrono::milliseconds milliseconds_at(const json &j, const char *key) {
    return chrono::milliseconds(j.at(key).get<long long>());
}

void from_json(const json &j, judge_endpoint &endpoint) {
    if (j.count("baseUrl"))
        j.at("baseUrl").get_to(endpoint.base_url);
    if (j.count("userAgent"))
        j.at("userAgent").get_to(endpoint.user_agent);
    if (j.count("timeout"))
        j.at("timeout").get_to(endpoint.timeout);
    if (j.count("connectTimeout"))
        j.at("connectTimeout").get_to(endpoint.connect_timeout);
}

void from_json(const json &j, throttle_policy &policy) {
    if (j.count("minDelay"))
        policy.min_delay = milliseconds_at(j, "minDelay");
    if (j.count("maxDelay"))
        policy.max_delay = milliseconds_at(j, "maxDelay");
    if (j.count("recoveryTouches"))
        j.at("recoveryTouches").get_to(policy.recovery_touches);
    if (j.count("recoveryFactor"))
        j.at("recoveryFactor").get_to(policy.recovery_factor);

    if (policy.min_delay.count() < 0 || policy.min_delay > policy.max_delay)
        throw invalid_argument("throttle: minDelay must be within [0, maxDelay]");
    if (policy.recovery_factor <= 0 || policy.recovery_factor > 1)
        throw invalid_argument("throttle: recoveryFactor must be within (0, 1]");
}

void from_json(const json &j, retry_policy &policy) {
    if (j.count("submitRetries"))
        j.at("submitRetries").get_to(policy.submit_retries);
    if (j.count("checkRetries"))
        j.at("checkRetries").get_to(policy.check_retries);
    if (j.count("submitDelay"))
        policy.submit_delay = milliseconds_at(j, "submitDelay");
    if (j.count("submitJitter"))
        policy.submit_jitter = milliseconds_at(j, "submitJitter");
    if (j.count("retryBackoff"))
        policy.retry_backoff = milliseconds_at(j, "retryBackoff");
    if (j.count("pollDelay"))
        policy.poll_delay = milliseconds_at(j, "pollDelay");
    if (j.count("pollDelayLong"))
        policy.poll_delay_long = milliseconds_at(j, "pollDelayLong");
    if (j.count("pollDelayThreshold"))
        j.at("pollDelayThreshold").get_to(policy.poll_delay_threshold);

    if (policy.submit_retries <= 0 || policy.check_retries <= 0)
        throw invalid_argument("retry: submitRetries and checkRetries must be positive");
}

}  // namespace submitter::remote
