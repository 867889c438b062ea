#include "gtest/gtest.h"
#include "remote/transport.hpp"

using namespace std;
using namespace submitter::remote;

TEST(TransportTest, SubmitUrlTest) {
    judge_endpoint endpoint;
    endpoint.base_url = "https://leetcode.com";
    EXPECT_EQ(submit_url(endpoint, "two-sum"), "https://leetcode.com/problems/two-sum/submit/");

    endpoint.base_url = "http://127.0.0.1:8080//";
    EXPECT_EQ(submit_url(endpoint, "add-two-numbers"), "http://127.0.0.1:8080/problems/add-two-numbers/submit/");
}

TEST(TransportTest, CheckUrlTest) {
    judge_endpoint endpoint;
    endpoint.base_url = "https://leetcode.cn/";
    EXPECT_EQ(check_url(endpoint, 1234567890123ull), "https://leetcode.cn/submissions/detail/1234567890123/check/");
}

TEST(TransportTest, RefererTest) {
    EXPECT_EQ(make_referer("https://leetcode.com/problems/two-sum/submit/"), "https://leetcode.com/problems/two-sum");
    EXPECT_EQ(make_referer("https://leetcode.com/submissions/detail/1/check/?t=1"), "https://leetcode.com/submissions/detail/1");
    EXPECT_EQ(make_referer("https://leetcode.com/problems/"), "https://leetcode.com/");
    EXPECT_EQ(make_referer("https://leetcode.com/"), "https://leetcode.com/");
    EXPECT_EQ(make_referer("https://leetcode.com"), "https://leetcode.com");
}

TEST(TransportTest, HostTest) {
    EXPECT_EQ(host_of("https://leetcode.com/problems/two-sum/submit/"), "leetcode.com");
    EXPECT_EQ(host_of("http://127.0.0.1:8080/submissions/"), "127.0.0.1");
    EXPECT_EQ(host_of("leetcode.cn"), "leetcode.cn");
    EXPECT_EQ(host_of("https://leetcode.com?x=1"), "leetcode.com");
}
