#pragma once

#include <string>
#include "remote/orchestrator.hpp"
#include "store/problem_store.hpp"

/**
 * 批量提交
 * 依次读取题目，提交指定模型生成的代码并保存评测结果。
 * 评测服务有严格的限流，所以一次只处理一道题，前一道题评测完成才处理下一道。
 * 遇到 fatal_error 时立即停止，不再处理剩余的题目。
 */
namespace submitter {

struct batch_options {
    /**
     * @brief 要提交哪个模型的代码
     */
    std::string model;

    /**
     * @brief 为真时即使已有完成的评测结果也重新提交
     */
    bool force = false;

    /**
     * @brief 为真时照常提交，但不写回题目文件
     */
    bool dry_run = false;
};

struct batch_summary {
    std::size_t processed = 0;
    std::size_t skipped = 0;
    std::size_t submitted = 0;
    std::size_t errors = 0;

    /**
     * @brief 是否因为 fatal_error 提前终止
     */
    bool aborted = false;
};

batch_summary submit_batch(store::problem_store &problems, remote::submission_orchestrator &orchestrator, const batch_options &options);

}  // namespace submitter
