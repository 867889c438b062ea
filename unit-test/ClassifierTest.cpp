#include "gtest/gtest.h"
#include "remote/classifier.hpp"
#include "test/mock_transport.hpp"

using namespace std;
using namespace submitter::remote;
using submitter::remote::mock::network_failure;
using submitter::remote::mock::reply;

static const string TOO_LONG = R"({"error": "Your code is too long. Please reduce your code size and try again."})";

static optional<classification> classify_reply(request_phase phase, long code, const string &body) {
    return classify(phase, reply(code, body), body);
}

TEST(ClassifierTest, SuccessIsNotClassified) {
    EXPECT_FALSE(classify_reply(request_phase::SUBMIT, 200, R"({"submission_id": 1})"));
    EXPECT_FALSE(classify_reply(request_phase::POLL, 200, R"({"state": "PENDING"})"));
    EXPECT_FALSE(classify_reply(request_phase::POLL, 204, ""));
}

TEST(ClassifierTest, CodeRejectionIsNonRetriable) {
    for (long code : {400L, 499L}) {
        auto c = classify_reply(request_phase::SUBMIT, code, TOO_LONG);
        ASSERT_TRUE(c);
        auto *failure = get_if<non_retriable_failure>(&*c);
        ASSERT_NE(failure, nullptr) << describe(*c);
        EXPECT_EQ(failure->message, "Your code is too long. Please reduce your code size and try again.");
    }
}

TEST(ClassifierTest, BadRequestIsNonRetriableWithTruncatedBody) {
    string body(200, 'x');
    auto c = classify_reply(request_phase::SUBMIT, 400, body);
    ASSERT_TRUE(c);
    auto *failure = get_if<non_retriable_failure>(&*c);
    ASSERT_NE(failure, nullptr);
    EXPECT_EQ(failure->message, "invalid or unauthorized request, see response: " + string(80, 'x') + "...");
}

TEST(ClassifierTest, ForbiddenDependsOnPhase) {
    auto submit = classify_reply(request_phase::SUBMIT, 403, "Forbidden");
    ASSERT_TRUE(submit);
    auto *retriable = get_if<retriable_failure>(&*submit);
    ASSERT_NE(retriable, nullptr);
    EXPECT_TRUE(retriable->overload);

    auto poll = classify_reply(request_phase::POLL, 403, "Forbidden");
    ASSERT_TRUE(poll);
    EXPECT_TRUE(holds_alternative<non_retriable_failure>(*poll));
}

TEST(ClassifierTest, TooManyRequestsTriggersSlowdown) {
    for (auto phase : {request_phase::SUBMIT, request_phase::POLL}) {
        auto c = classify_reply(phase, 429, "");
        ASSERT_TRUE(c);
        auto *retriable = get_if<retriable_failure>(&*c);
        ASSERT_NE(retriable, nullptr);
        EXPECT_TRUE(retriable->overload);
    }
}

TEST(ClassifierTest, OtherStatusIsRetriable) {
    for (long code : {301L, 404L, 500L, 502L, 503L}) {
        auto c = classify_reply(request_phase::POLL, code, "");
        ASSERT_TRUE(c);
        auto *retriable = get_if<retriable_failure>(&*c);
        ASSERT_NE(retriable, nullptr) << code;
        EXPECT_FALSE(retriable->overload);
    }
}

TEST(ClassifierTest, NetworkErrorIsRetriable) {
    auto c = classify(request_phase::SUBMIT, network_failure("timeout"), "");
    ASSERT_TRUE(c);
    auto *retriable = get_if<retriable_failure>(&*c);
    ASSERT_NE(retriable, nullptr);
    EXPECT_EQ(retriable->reason, "timeout");
}

TEST(ClassifierTest, ConfigurationErrorIsFatal) {
    http_response response;
    response.status = transport_status::CONFIGURATION_ERROR;
    response.error = "URL using bad/illegal format or missing URL";
    auto c = classify(request_phase::SUBMIT, response, "");
    ASSERT_TRUE(c);
    auto *fatal = get_if<fatal_failure>(&*c);
    ASSERT_NE(fatal, nullptr);
    EXPECT_EQ(fatal->reason, response.error);
}

TEST(ClassifierTest, MalformedPayloadIsRetriable) {
    auto c = classify_malformed("failed to unmarshal");
    auto *retriable = get_if<retriable_failure>(&c);
    ASSERT_NE(retriable, nullptr);
    EXPECT_FALSE(retriable->overload);
}

TEST(ClassifierTest, CodeRejectionMessage) {
    EXPECT_TRUE(code_rejection_message(TOO_LONG));
    EXPECT_FALSE(code_rejection_message(R"({"error": "Something else"})"));
    EXPECT_FALSE(code_rejection_message(R"({"submission_id": 1})"));
    EXPECT_FALSE(code_rejection_message("not json"));
}
