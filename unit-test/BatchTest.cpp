#include <map>
#include "batch.hpp"
#include "common/exceptions.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/manual_time_source.hpp"
#include "test/mock_transport.hpp"

using namespace std;
using namespace submitter;
using namespace submitter::remote;
using namespace submitter::store;
using submitter::remote::mock::mock_transport;
using submitter::remote::mock::reply;
using ::testing::_;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;

static const string ACCEPTED = R"({"finished": true, "status_msg": "Accepted", "state": "SUCCESS"})";
static const string TOO_LONG = R"({"error": "Your code is too long. Please reduce your code size and try again."})";

/**
 * 保存在内存中的题目，save 的结果记录在 saved 中
 */
struct memory_problem_store : public problem_store {
    map<string, problem> problems;
    vector<string> order;
    map<string, submission_outcome> saved;
    bool fail_on_save = false;

    void add(const string &id, const string &slug, const string &model, const string &code) {
        problem prob;
        prob.id = id;
        prob.question_id = id;
        prob.title_slug = slug;
        if (!model.empty())
            prob.solutions[model] = {"cpp", code};
        problems[id] = prob;
        order.push_back(id);
    }

    vector<string> list() override {
        return order;
    }

    problem load(const string &id) override {
        if (!problems.count(id))
            BOOST_THROW_EXCEPTION(store_error("no such problem: " + id));
        return problems.at(id);
    }

    void save(const string &id, const string &model, const submission_outcome &outcome) override {
        if (fail_on_save)
            BOOST_THROW_EXCEPTION(store_error("disk full"));
        saved[id + "/" + model] = outcome;
    }
};

class BatchTest : public ::testing::Test {
protected:
    submitter::mock::manual_time_source clock;
    cancellation_token token;
    NiceMock<mock_transport> transport;
    judge_endpoint endpoint;
    retry_policy policy;
    throttle_policy throttle_config;
    unique_ptr<throttler> throttle;
    unique_ptr<submission_orchestrator> orchestrator;
    memory_problem_store problems;
    batch_options options;

    void SetUp() override {
        policy.submit_retries = 2;
        policy.check_retries = 3;
        throttle = make_unique<throttler>(throttle_config, clock, token);
        orchestrator = make_unique<submission_orchestrator>(transport, *throttle, clock, token, endpoint, policy);
        options.model = "gpt-4o";
    }

    void judge_everything() {
        ON_CALL(transport, execute(Field(&http_request::method, "POST")))
            .WillByDefault(Return(reply(200, R"({"submission_id": 1})")));
        ON_CALL(transport, execute(Field(&http_request::method, "GET")))
            .WillByDefault(Return(reply(200, ACCEPTED)));
    }
};

TEST_F(BatchTest, SubmitAllTest) {
    problems.add("1", "two-sum", "gpt-4o", "class Solution {};");
    problems.add("2", "add-two-numbers", "gpt-4o", "class Solution {};");
    judge_everything();
    EXPECT_CALL(transport, execute(_)).Times(4);

    batch_summary summary = submit_batch(problems, *orchestrator, options);
    EXPECT_EQ(summary.processed, 2u);
    EXPECT_EQ(summary.submitted, 2u);
    EXPECT_EQ(summary.skipped, 0u);
    EXPECT_EQ(summary.errors, 0u);
    EXPECT_FALSE(summary.aborted);

    ASSERT_EQ(problems.saved.count("1/gpt-4o"), 1u);
    const submission_outcome &outcome = problems.saved.at("1/gpt-4o");
    EXPECT_EQ(outcome.result.status_msg, "Accepted");
    EXPECT_EQ(outcome.request.title_slug, "two-sum");
    EXPECT_EQ(outcome.request.language, "cpp");
}

TEST_F(BatchTest, SkipTest) {
    problems.add("no-solution", "a", "", "");
    problems.add("other-model", "b", "claude", "class Solution {};");
    problems.add("empty-code", "c", "gpt-4o", "");
    problems.add("finished", "d", "gpt-4o", "class Solution {};");
    problems.problems["finished"].submissions["gpt-4o"].finished = true;
    problems.add("unfinished", "e", "gpt-4o", "class Solution {};");
    problems.problems["unfinished"].submissions["gpt-4o"].status_msg = "Pending";
    judge_everything();
    EXPECT_CALL(transport, execute(Field(&http_request::url, HasSubstr("/problems/e/submit/")))).Times(1);
    EXPECT_CALL(transport, execute(Field(&http_request::method, "GET"))).Times(1);

    batch_summary summary = submit_batch(problems, *orchestrator, options);
    EXPECT_EQ(summary.processed, 5u);
    EXPECT_EQ(summary.skipped, 4u);
    EXPECT_EQ(summary.submitted, 1u);
    EXPECT_EQ(summary.errors, 0u);
}

TEST_F(BatchTest, ForceTest) {
    problems.add("finished", "two-sum", "gpt-4o", "class Solution {};");
    problems.problems["finished"].submissions["gpt-4o"].finished = true;
    options.force = true;
    judge_everything();
    EXPECT_CALL(transport, execute(_)).Times(2);

    batch_summary summary = submit_batch(problems, *orchestrator, options);
    EXPECT_EQ(summary.submitted, 1u);
    EXPECT_EQ(problems.saved.size(), 1u);
}

TEST_F(BatchTest, DryRunTest) {
    problems.add("1", "two-sum", "gpt-4o", "class Solution {};");
    options.dry_run = true;
    judge_everything();

    batch_summary summary = submit_batch(problems, *orchestrator, options);
    EXPECT_EQ(summary.submitted, 1u);
    EXPECT_TRUE(problems.saved.empty());
}

TEST_F(BatchTest, RejectedIsSavedTest) {
    problems.add("1", "two-sum", "gpt-4o", string(100000, 'x'));
    EXPECT_CALL(transport, execute(_)).WillOnce(Return(reply(400, TOO_LONG)));

    batch_summary summary = submit_batch(problems, *orchestrator, options);
    EXPECT_EQ(summary.submitted, 1u);
    EXPECT_EQ(summary.errors, 0u);
    ASSERT_EQ(problems.saved.count("1/gpt-4o"), 1u);
    EXPECT_EQ(problems.saved.at("1/gpt-4o").type, submission_outcome::kind::REJECTED);
    EXPECT_TRUE(problems.saved.at("1/gpt-4o").result.finished);
}

TEST_F(BatchTest, ExhaustedIsNotSavedTest) {
    problems.add("1", "two-sum", "gpt-4o", "class Solution {};");
    problems.add("2", "add-two-numbers", "gpt-4o", "class Solution {};");
    EXPECT_CALL(transport, execute(Field(&http_request::url, HasSubstr("two-sum"))))
        .Times(policy.submit_retries)
        .WillRepeatedly(Return(reply(502, "Bad Gateway")));
    EXPECT_CALL(transport, execute(Field(&http_request::url, HasSubstr("add-two-numbers"))))
        .WillOnce(Return(reply(200, R"({"submission_id": 2})")));
    EXPECT_CALL(transport, execute(Field(&http_request::method, "GET")))
        .WillOnce(Return(reply(200, ACCEPTED)));

    batch_summary summary = submit_batch(problems, *orchestrator, options);
    EXPECT_EQ(summary.errors, 1u);
    EXPECT_EQ(summary.submitted, 1u);
    EXPECT_EQ(problems.saved.count("1/gpt-4o"), 0u);
    EXPECT_EQ(problems.saved.count("2/gpt-4o"), 1u);
}

TEST_F(BatchTest, FatalAbortsTest) {
    problems.add("1", "two-sum", "gpt-4o", "class Solution {};");
    problems.add("2", "add-two-numbers", "gpt-4o", "class Solution {};");
    http_response misconfigured;
    misconfigured.status = transport_status::CONFIGURATION_ERROR;
    misconfigured.error = "unsupported protocol";
    EXPECT_CALL(transport, execute(_)).Times(1).WillOnce(Return(misconfigured));

    batch_summary summary = submit_batch(problems, *orchestrator, options);
    EXPECT_TRUE(summary.aborted);
    EXPECT_EQ(summary.processed, 1u);
    EXPECT_EQ(summary.errors, 1u);
    EXPECT_TRUE(problems.saved.empty());
}

TEST_F(BatchTest, StoreErrorsTest) {
    problems.add("1", "two-sum", "gpt-4o", "class Solution {};");
    problems.order.insert(problems.order.begin(), "missing");
    problems.fail_on_save = true;
    judge_everything();

    batch_summary summary = submit_batch(problems, *orchestrator, options);
    EXPECT_EQ(summary.processed, 2u);
    EXPECT_EQ(summary.errors, 2u);
    EXPECT_EQ(summary.submitted, 0u);
    EXPECT_FALSE(summary.aborted);
}
