#include <filesystem>
#include <fstream>
#include <random>
#include "common/io_utils.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace submitter;

class IoUtilsTest : public ::testing::Test {
protected:
    filesystem::path dir;

    void SetUp() override {
        dir = filesystem::temp_directory_path() / ("submitter-io-" + to_string(random_device{}()));
        filesystem::create_directories(dir);
    }

    void TearDown() override {
        filesystem::remove_all(dir);
    }
};

TEST_F(IoUtilsTest, WriteTest) {
    auto path = dir / "1.json";
    ASSERT_TRUE(write_file_content(path, "{}\n"));
    EXPECT_EQ(read_file_content(path), "{}\n");
    ASSERT_TRUE(write_file_content(path, "[]"));
    EXPECT_EQ(read_file_content(path), "[]");
    EXPECT_FALSE(filesystem::exists(dir / "1.json.tmp"));
}

TEST_F(IoUtilsTest, WriteFailureRemovesTempTest) {
    if (!filesystem::exists("/dev/full"))
        GTEST_SKIP() << "/dev/full is not available";

    // 临时文件指向 /dev/full，打开成功但写入失败
    auto path = dir / "1.json";
    filesystem::create_symlink("/dev/full", dir / "1.json.tmp");
    EXPECT_FALSE(write_file_content(path, string(1 << 16, 'x')));
    EXPECT_FALSE(filesystem::exists(filesystem::symlink_status(dir / "1.json.tmp")));
    EXPECT_FALSE(filesystem::exists(path));
}

TEST_F(IoUtilsTest, RenameFailureRemovesTempTest) {
    // 目标是非空文件夹，无法被重命名覆盖
    auto path = dir / "target";
    filesystem::create_directories(path / "child");
    EXPECT_FALSE(write_file_content(path, "{}"));
    EXPECT_FALSE(filesystem::exists(dir / "target.tmp"));
    EXPECT_TRUE(filesystem::is_directory(path));
}

TEST_F(IoUtilsTest, ReadDefaultTest) {
    EXPECT_EQ(read_file_content(dir / "missing", "fallback"), "fallback");
}
