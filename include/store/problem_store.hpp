#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "remote/messages.hpp"

namespace submitter::store {

/**
 * @brief 某个模型为题目生成的代码
 */
struct solution {
    std::string lang;
    std::string typed_code;
};

/**
 * @brief 从题目文件中读出的、提交所需的信息
 */
struct problem {
    /**
     * @brief 题目在 store 中的标识，对于 json_problem_store 是文件路径
     */
    std::string id;

    std::string question_id;

    std::string title_slug;

    std::map<std::string, solution> solutions;

    /**
     * @brief 各个模型最近一次提交的评测结果
     */
    std::map<std::string, remote::check_result> submissions;
};

/**
 * @brief 保存题目和评测结果的地方
 */
struct problem_store {
    virtual ~problem_store();

    /**
     * @brief 列出所有待处理的题目标识，顺序即处理顺序
     */
    virtual std::vector<std::string> list() = 0;

    /**
     * @throw store_error 题目无法读取或格式不正确
     */
    virtual problem load(const std::string &id) = 0;

    /**
     * @brief 保存某个模型的提交结果
     * @throw store_error 无法写入
     */
    virtual void save(const std::string &id, const std::string &model, const remote::submission_outcome &outcome) = 0;
};

/**
 * @brief 每道题一个 JSON 文件的 store
 * 
 * {
 *     "Question": { "data": { "question": { "questionId": "1", "titleSlug": "two-sum", ... } } },
 *     "Solutions": { "<model>": { "lang": "cpp", "typed_code": "...", ... } },
 *     "Submissions": {
 *         "<model>": {
 *             "SubmitRequest": { "lang": ..., "question_id": ..., "typed_code": ... },
 *             "SubmissionId": 123,
 *             "CheckResponse": { "status_msg": "Accepted", "finished": true, ... },
 *             "SubmittedAt": "2024-01-01T00:00:00Z"
 *         }
 *     }
 * }
 * 
 * 保存时只改写 Submissions.<model>，其余字段原样保留。
 */
struct json_problem_store : public problem_store {
    /**
     * @param paths 题目文件或文件夹，文件夹展开为其中的 .json 文件（按文件名排序）
     */
    explicit json_problem_store(const std::vector<std::filesystem::path> &paths);

    std::vector<std::string> list() override;

    problem load(const std::string &id) override;

    void save(const std::string &id, const std::string &model, const remote::submission_outcome &outcome) override;

private:
    std::vector<std::filesystem::path> files;

    nlohmann::json read_document(const std::string &id) const;
};

}  // namespace submitter::store
