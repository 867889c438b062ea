#include "remote/messages.hpp"

namespace submitter::remote {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const submission_request &request) {
    j = {{"lang", request.language},
         {"question_id", request.question_id},
         {"typed_code", request.typed_code}};
}

void from_json(const json &j, submission_request &request) {
    j.at("lang").get_to(request.language);
    j.at("question_id").get_to(request.question_id);
    j.at("typed_code").get_to(request.typed_code);
}

template <typename T>
static void assign_if_present(const json &j, const char *key, T &value) {
    if (j.count(key) && !j.at(key).is_null())
        j.at(key).get_to(value);
}

template <typename T>
static void assign_if_present(const json &j, const char *key, optional<T> &value) {
    if (j.count(key) && !j.at(key).is_null())
        value = j.at(key).get<T>();
}

void to_json(json &j, const check_result &result) {
    j = {{"status_msg", result.status_msg},
         {"finished", result.finished},
         {"state", result.state},
         {"runtime_percentile", result.runtime_percentile},
         {"memory_percentile", result.memory_percentile}};
    if (result.status_code) j["status_code"] = *result.status_code;
    if (!result.lang.empty()) j["lang"] = result.lang;
    if (!result.status_runtime.empty()) j["status_runtime"] = result.status_runtime;
    if (!result.status_memory.empty()) j["status_memory"] = result.status_memory;
    if (result.total_correct) j["total_correct"] = *result.total_correct;
    if (result.total_testcases) j["total_testcases"] = *result.total_testcases;
    if (!result.compile_error.empty()) j["compile_error"] = result.compile_error;
    if (!result.runtime_error.empty()) j["runtime_error"] = result.runtime_error;
}

void from_json(const json &j, check_result &result) {
    assign_if_present(j, "status_msg", result.status_msg);
    assign_if_present(j, "state", result.state);
    assign_if_present(j, "runtime_percentile", result.runtime_percentile);
    assign_if_present(j, "memory_percentile", result.memory_percentile);
    assign_if_present(j, "status_code", result.status_code);
    assign_if_present(j, "lang", result.lang);
    assign_if_present(j, "status_runtime", result.status_runtime);
    assign_if_present(j, "status_memory", result.status_memory);
    assign_if_present(j, "total_correct", result.total_correct);
    assign_if_present(j, "total_testcases", result.total_testcases);
    assign_if_present(j, "compile_error", result.compile_error);
    assign_if_present(j, "runtime_error", result.runtime_error);

    // 旧版题目文件中写的是 Finished
    if (j.count("finished"))
        assign_if_present(j, "finished", result.finished);
    else
        assign_if_present(j, "Finished", result.finished);
}

const char *to_string(submission_outcome::kind kind) {
    switch (kind) {
        case submission_outcome::kind::FINISHED:
            return "finished";
        case submission_outcome::kind::REJECTED:
            return "rejected";
        case submission_outcome::kind::EXHAUSTED:
            return "exhausted";
    }
    return "unknown";
}

}  // namespace submitter::remote
