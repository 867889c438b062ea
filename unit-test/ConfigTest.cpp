#include <nlohmann/json.hpp>
#include <stdexcept>
#include "config.hpp"
#include "gtest/gtest.h"
#include "remote/config.hpp"

using namespace std;
using namespace std::chrono;
using namespace nlohmann;
using namespace submitter;
using namespace submitter::remote;

TEST(ConfigTest, DefaultsTest) {
    judge_endpoint endpoint = json::object().get<judge_endpoint>();
    EXPECT_EQ(endpoint.base_url, JUDGE_BASE_URL);
    EXPECT_EQ(endpoint.timeout, 30);

    throttle_policy throttle = json::object().get<throttle_policy>();
    EXPECT_EQ(throttle.min_delay, MIN_REQUEST_DELAY);
    EXPECT_EQ(throttle.max_delay, MAX_REQUEST_DELAY);
    EXPECT_EQ(throttle.recovery_touches, 10);

    retry_policy retry = json::object().get<retry_policy>();
    EXPECT_EQ(retry.submit_retries, SUBMIT_RETRIES);
    EXPECT_EQ(retry.check_retries, CHECK_RETRIES);
    EXPECT_EQ(retry.poll_delay, milliseconds(3000));
    EXPECT_EQ(retry.poll_delay_long, milliseconds(5000));
    EXPECT_EQ(retry.poll_delay_threshold, 3);
}

TEST(ConfigTest, OverrideTest) {
    json j = R"({
        "endpoint": { "baseUrl": "https://leetcode.cn", "connectTimeout": 3 },
        "throttle": { "minDelay": 500, "maxDelay": 4000, "recoveryTouches": 0 },
        "retry": { "submitRetries": 2, "checkRetries": 20, "pollDelayThreshold": 5, "submitJitter": 0 }
    })"_json;

    auto endpoint = j.at("endpoint").get<judge_endpoint>();
    EXPECT_EQ(endpoint.base_url, "https://leetcode.cn");
    EXPECT_EQ(endpoint.connect_timeout, 3);
    EXPECT_EQ(endpoint.timeout, 30);

    auto throttle = j.at("throttle").get<throttle_policy>();
    EXPECT_EQ(throttle.min_delay, milliseconds(500));
    EXPECT_EQ(throttle.max_delay, milliseconds(4000));
    EXPECT_EQ(throttle.recovery_touches, 0);
    EXPECT_DOUBLE_EQ(throttle.recovery_factor, 0.75);

    auto retry = j.at("retry").get<retry_policy>();
    EXPECT_EQ(retry.submit_retries, 2);
    EXPECT_EQ(retry.check_retries, 20);
    EXPECT_EQ(retry.poll_delay_threshold, 5);
    EXPECT_EQ(retry.submit_jitter, milliseconds(0));
    EXPECT_EQ(retry.retry_backoff, milliseconds(10000));
}

TEST(ConfigTest, ValidationTest) {
    EXPECT_THROW(R"({"minDelay": 5000, "maxDelay": 1000})"_json.get<throttle_policy>(), invalid_argument);
    EXPECT_THROW(R"({"minDelay": -1})"_json.get<throttle_policy>(), invalid_argument);
    EXPECT_THROW(R"({"recoveryFactor": 1.5})"_json.get<throttle_policy>(), invalid_argument);
    EXPECT_THROW(R"({"checkRetries": 0})"_json.get<retry_policy>(), invalid_argument);
    EXPECT_THROW(R"({"minDelay": "fast"})"_json.get<throttle_policy>(), json::type_error);
}
