#include "remote/orchestrator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <nlohmann/json.hpp>
#include <variant>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "remote/payload_decoder.hpp"

namespace submitter::remote {
using namespace std;
using namespace nlohmann;

submission_orchestrator::submission_orchestrator(transport &client, throttler &throttle, time_source &clock, const cancellation_token &token,
                                                 const judge_endpoint &endpoint, const retry_policy &policy)
    : client(client), throttle(throttle), clock(clock), token(token), endpoint(endpoint), policy(policy), rng(random_device{}()) {}

submission_orchestrator::state submission_orchestrator::current_state() const {
    return current;
}

void submission_orchestrator::sleep(chrono::milliseconds duration) {
    if (!clock.sleep_for(duration, token))
        BOOST_THROW_EXCEPTION(cancelled_error("submission cancelled"));
}

void submission_orchestrator::enter(state next) {
    DLOG(INFO) << "Submission state: " << to_string(current) << " -> " << to_string(next);
    current = next;
}

chrono::milliseconds submission_orchestrator::jitter(chrono::milliseconds upper) {
    if (upper.count() <= 0) return chrono::milliseconds(0);
    uniform_int_distribution<long long> dist(0, upper.count() - 1);
    return chrono::milliseconds(dist(rng));
}

/**
 * @brief 解析提交接口 2xx 的返回值
 * 返回 submission_id，或者无法得到 submission_id 时的分类
 */
static variant<uint64_t, classification> parse_submission_response(const string &body) {
    json response = json::parse(body, nullptr, /* allow_exceptions */ false);
    if (response.is_discarded())
        return classify_malformed("failed to unmarshal submission response: " + truncate_message(body, 80));

    if (auto message = code_rejection_message(body))
        return classification{non_retriable_failure{*message}};

    if (!response.is_object() || !response.count("submission_id"))
        return classify_malformed("submission response has no submission_id: " + truncate_message(body, 80));

    const json &id = response.at("submission_id");
    if (id.is_number_unsigned() && id.get<uint64_t>() > 0)
        return id.get<uint64_t>();
    if (id.is_number_integer() && id.get<int64_t>() > 0)
        return (uint64_t)id.get<int64_t>();
    return classify_malformed("invalid submission id: " + id.dump());
}

submission_handle submission_orchestrator::submit(const submission_request &request) {
    enter(state::SUBMITTING);

    // nlohmann::json 不会转义 <、> 和 &，源代码原样发送
    string body = json(request).dump(-1, ' ', false, json::error_handler_t::replace);
    string url = submit_url(endpoint, request.title_slug);
    VLOG(1) << "Submission request body:" << endl
            << body;

    string last_error = "no attempt was made";
    throttle.ready();
    for (int attempt = 1; attempt <= policy.submit_retries; ++attempt) {
        // 模拟人工操作的节奏
        sleep(policy.submit_delay + jitter(policy.submit_jitter));

        // 节流器放行后立即发出请求
        if (!throttle.wait())
            BOOST_THROW_EXCEPTION(cancelled_error("submission cancelled while throttling"));

        http_response response = client.execute({"POST", url, body});
        throttle.touch();
        string decoded = decode_payload(response.body);
        VLOG(1) << "Submission response body:" << endl
                << decoded;

        optional<classification> failure = classify(request_phase::SUBMIT, response, decoded);
        if (!failure) {
            auto parsed = parse_submission_response(decoded);
            if (auto *id = get_if<uint64_t>(&parsed)) {
                DLOG(INFO) << "Received submission_id: " << *id;
                enter(state::SUBMITTED);
                return {*id};
            }
            failure = get<classification>(parsed);
        }

        if (auto *fatal = get_if<fatal_failure>(&*failure)) {
            enter(state::FAILED);
            BOOST_THROW_EXCEPTION(fatal_error(fatal->reason));
        }
        if (auto *rejected = get_if<non_retriable_failure>(&*failure)) {
            enter(state::FAILED);
            BOOST_THROW_EXCEPTION(non_retriable_error(rejected->message));
        }

        last_error = get<retriable_failure>(*failure).reason;
        LOG(WARNING) << "Submission attempt failed: " << last_error << ", retrying (" << attempt << "/" << policy.submit_retries << ")...";
        throttle.slowdown();
        if (attempt < policy.submit_retries)
            sleep(policy.retry_backoff * attempt + jitter(policy.retry_backoff));
    }

    enter(state::FAILED);
    BOOST_THROW_EXCEPTION(retry_exhausted_error(fmt::format("failed to submit after {} retries: {}", policy.submit_retries, last_error)));
}

check_result submission_orchestrator::poll(const submission_handle &handle) {
    enter(state::POLLING);
    string url = check_url(endpoint, handle.submission_id);

    optional<check_result> last;
    throttle.ready();
    for (int attempt = 1; attempt <= policy.check_retries; ++attempt) {
        // 渐进的查询间隔：前几次较短，之后较长
        if (attempt > 1)
            sleep(attempt > policy.poll_delay_threshold ? policy.poll_delay_long : policy.poll_delay);

        if (!throttle.wait())
            BOOST_THROW_EXCEPTION(cancelled_error("polling cancelled while throttling"));
        DLOG(INFO) << "Checking submission status (" << attempt << "/" << policy.check_retries << ")...";

        http_response response = client.execute({"GET", url, ""});
        throttle.touch();
        decoded_payload payload = decode_payload_with_codec(response.body);
        VLOG(1) << "Check response body (" << payload.codec << "): " << payload.body;

        optional<classification> failure = classify(request_phase::POLL, response, payload.body);
        if (!failure) {
            json body = json::parse(payload.body, nullptr, /* allow_exceptions */ false);
            check_result result;
            bool parsed = !body.is_discarded() && body.is_object();
            if (parsed) {
                try {
                    body.get_to(result);
                } catch (json::exception &e) {
                    LOG(WARNING) << "Unexpected check response: " << e.what();
                    parsed = false;
                }
            }

            if (!parsed) {
                failure = classify_malformed("failed to unmarshal check response");
            } else if (result.status_msg.empty() && !result.finished) {
                // 评测还在排队时只返回 state
                last.reset();
                failure = retriable_failure{fmt::format("incomplete check response (state: {})", result.state), false};
            } else if (result.finished) {
                LOG(INFO) << "Submission " << handle.submission_id << " finished with status: " << result.status_msg;
                enter(state::FINISHED);
                return result;
            } else {
                last = result;
                failure = retriable_failure{fmt::format("submission is not finished yet (state: {})", result.state), false};
            }
        }

        if (auto *fatal = get_if<fatal_failure>(&*failure)) {
            enter(state::FAILED);
            BOOST_THROW_EXCEPTION(fatal_error(fatal->reason));
        }
        if (auto *rejected = get_if<non_retriable_failure>(&*failure)) {
            enter(state::FAILED);
            BOOST_THROW_EXCEPTION(non_retriable_error(rejected->message));
        }

        auto &retriable = get<retriable_failure>(*failure);
        if (retriable.overload) {
            LOG(WARNING) << "Check attempt failed: " << retriable.reason << ", slowing down...";
            throttle.slowdown();
        } else {
            DLOG(INFO) << retriable.reason << " (" << attempt << "/" << policy.check_retries << ")";
        }
    }

    enter(state::FAILED);
    if (!last)
        BOOST_THROW_EXCEPTION(retry_exhausted_error(fmt::format("failed to get check submission status after {} retries", policy.check_retries)));
    LOG(WARNING) << "Submission check timed out after " << policy.check_retries << " retries. Last status: " << last->status_msg;
    BOOST_THROW_EXCEPTION(retry_exhausted_error(fmt::format("submission is not finished after {} retries", policy.check_retries)));
}

submission_outcome submission_orchestrator::submit_and_check(const submission_request &request) {
    submission_outcome outcome;
    outcome.type = submission_outcome::kind::FINISHED;
    outcome.request = request;
    outcome.submitted_at = chrono::system_clock::now();

    try {
        submission_handle handle = submit(request);
        outcome.submission_id = handle.submission_id;
        outcome.result = poll(handle);
        outcome.message = outcome.result.status_msg;
    } catch (non_retriable_error &e) {
        outcome.type = submission_outcome::kind::REJECTED;
        outcome.message = e.what();
        outcome.result = check_result{};
        outcome.result.status_msg = e.what();
        outcome.result.finished = true;
    } catch (retry_exhausted_error &e) {
        outcome.type = submission_outcome::kind::EXHAUSTED;
        outcome.message = e.what();
        outcome.result = check_result{};
    }
    return outcome;
}

const char *to_string(submission_orchestrator::state s) {
    switch (s) {
        case submission_orchestrator::state::IDLE:
            return "idle";
        case submission_orchestrator::state::SUBMITTING:
            return "submitting";
        case submission_orchestrator::state::SUBMITTED:
            return "submitted";
        case submission_orchestrator::state::POLLING:
            return "polling";
        case submission_orchestrator::state::FINISHED:
            return "finished";
        case submission_orchestrator::state::FAILED:
            return "failed";
    }
    return "unknown";
}

}  // namespace submitter::remote
