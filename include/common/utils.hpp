#pragma once

#include <chrono>
#include <filesystem>
#include <string>

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在或者为空，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 设置环境变量
 * @param key 环境变量的键
 * @param value 环境变量的值
 * @param replace 若为真，则覆盖已有的环境变量值
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

void unset_env(const std::string &key);

/**
 * @brief 截断过长的消息，用于日志和错误信息
 * @param message 原始消息
 * @param limit 最多保留的字符数，超出部分用 "..." 代替
 */
std::string truncate_message(const std::string &message, std::size_t limit);

/**
 * @brief 当前用户的主目录，优先使用 HOME 环境变量
 */
std::filesystem::path home_directory();

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};
