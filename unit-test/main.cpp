#include <glog/logging.h>
#include "common/utils.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

/**
 * 测试不应读到开发者本机的登录凭据和配置
 */
class GlobalEnv : public ::testing::Environment {
 public:
  void SetUp() override {
    FLAGS_logtostderr = true;
    FLAGS_minloglevel = google::GLOG_WARNING;
    for (const char *key : {"LEETCODE_SESSION", "LEETCODE_CSRF_TOKEN", "LEETCODE_COOKIE_JAR",
                            "JUDGEBASEURL", "SUBMITRETRIES", "CHECKRETRIES"})
      unset_env(key);
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  ::testing::AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
