#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace submitter::remote {

/**
 * @brief 一次代码提交的内容，构造后不再修改
 */
struct submission_request {
    /**
     * @brief 评测服务使用的语言标识，比如 cpp、python3
     */
    std::string language;

    /**
     * @brief 题目在评测服务中的编号
     */
    std::string question_id;

    /**
     * @brief 题目的 slug，用于拼接提交地址
     */
    std::string title_slug;

    std::string typed_code;
};

/**
 * @brief 序列化为提交接口的请求体
 * 只包含 lang、question_id、typed_code 三个字段
 */
void to_json(nlohmann::json &j, const submission_request &request);

void from_json(const nlohmann::json &j, submission_request &request);

/**
 * @brief 提交成功后评测服务返回的编号，查询结果时使用
 */
struct submission_handle {
    std::uint64_t submission_id;
};

/**
 * @brief 评测结果
 * finished 为真是唯一的终止条件，未完成的结果绝不能视为成功
 */
struct check_result {
    std::string status_msg;
    bool finished = false;
    std::string state;
    double runtime_percentile = 0;
    double memory_percentile = 0;

    std::optional<int> status_code;
    std::string lang;
    std::string status_runtime;
    std::string status_memory;
    std::optional<int> total_correct;
    std::optional<int> total_testcases;
    std::string compile_error;
    std::string runtime_error;
};

void to_json(nlohmann::json &j, const check_result &result);

/**
 * @brief 解析查询接口的返回值
 * 评测未完成时评测服务通常只返回 state 字段，其余字段均可缺省；
 * 百分位在部分结果中为 null。
 * @throw nlohmann::json::exception 字段类型不符合预期
 */
void from_json(const nlohmann::json &j, check_result &result);

/**
 * @brief 一次 submit_and_check 的最终结果，交给批量提交保存
 */
struct submission_outcome {
    enum class kind {
        FINISHED,  // 评测完成，result.status_msg 为评测结论
        REJECTED,  // 评测服务拒绝了该提交，result.status_msg 为拒绝原因
        EXHAUSTED  // 重试次数用尽，没有得到评测结论
    };

    kind type = kind::FINISHED;
    submission_request request;
    std::optional<std::uint64_t> submission_id;
    check_result result;
    std::string message;
    std::chrono::system_clock::time_point submitted_at;
};

const char *to_string(submission_outcome::kind kind);

}  // namespace submitter::remote
