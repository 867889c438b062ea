#include "store/problem_store.hpp"
#include <fmt/chrono.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace submitter::store {
using namespace std;
using namespace nlohmann;

problem_store::~problem_store() {}

json_problem_store::json_problem_store(const vector<filesystem::path> &paths) {
    for (auto &path : paths) {
        if (filesystem::is_directory(path)) {
            vector<filesystem::path> found;
            for (auto &entry : filesystem::directory_iterator(path))
                if (entry.is_regular_file() && entry.path().extension() == ".json")
                    found.push_back(entry.path());
            sort(found.begin(), found.end());
            files.insert(files.end(), found.begin(), found.end());
        } else {
            files.push_back(path);
        }
    }
}

vector<string> json_problem_store::list() {
    vector<string> ids;
    for (auto &file : files) ids.push_back(file.string());
    return ids;
}

json json_problem_store::read_document(const string &id) const {
    if (!filesystem::is_regular_file(id))
        BOOST_THROW_EXCEPTION(store_error(fmt::format("problem file {} does not exist", id)));
    json document = json::parse(read_file_content(id), nullptr, /* allow_exceptions */ false);
    if (document.is_discarded() || !document.is_object())
        BOOST_THROW_EXCEPTION(store_error(fmt::format("problem file {} is not a JSON object", id)));
    return document;
}

static string string_field(const json &j, const char *lower, const char *upper) {
    for (const char *key : {lower, upper})
        if (j.count(key) && j.at(key).is_string())
            return j.at(key).get<string>();
    return "";
}

problem json_problem_store::load(const string &id) {
    json document = read_document(id);
    problem prob;
    prob.id = id;

    try {
        const json &question = document.at("Question").at("data").at("question");
        const json &question_id = question.at("questionId");
        prob.question_id = question_id.is_string() ? question_id.get<string>() : question_id.dump();
        question.at("titleSlug").get_to(prob.title_slug);

        if (document.count("Solutions") && document.at("Solutions").is_object())
            for (const auto &item : document.at("Solutions").items()) {
                const json &value = item.value();
                if (!value.is_object()) continue;
                prob.solutions[item.key()] = {string_field(value, "lang", "Lang"),
                                              string_field(value, "typed_code", "TypedCode")};
            }

        if (document.count("Submissions") && document.at("Submissions").is_object())
            for (const auto &item : document.at("Submissions").items()) {
                const json &value = item.value();
                if (!value.is_object() || !value.count("CheckResponse")) continue;
                prob.submissions[item.key()] = value.at("CheckResponse").get<remote::check_result>();
            }
    } catch (json::exception &e) {
        BOOST_THROW_EXCEPTION(store_error(fmt::format("malformed problem file {}: {}", id, e.what())));
    }
    return prob;
}

void json_problem_store::save(const string &id, const string &model, const remote::submission_outcome &outcome) {
    json document = read_document(id);

    json record = {
        {"SubmitRequest", outcome.request},
        {"SubmissionId", outcome.submission_id ? *outcome.submission_id : 0},
        {"CheckResponse", outcome.result},
        {"SubmittedAt", fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(chrono::system_clock::to_time_t(outcome.submitted_at)))},
    };
    document["Submissions"][model] = record;

    if (!write_file_content(id, document.dump(2, ' ', false, json::error_handler_t::replace) + "\n"))
        BOOST_THROW_EXCEPTION(store_error(fmt::format("unable to write problem file {}", id)));
    DLOG(INFO) << "Saved " << model << "'s submission into " << id;
}

}  // namespace submitter::store
