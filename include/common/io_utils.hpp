#pragma once

#include <filesystem>
#include <string>

namespace submitter {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 写入文本文件
 * 先写入同目录下的临时文件再重命名
 * @param path 目标文件路径
 * @param content 文件内容
 * @return 是否写入成功
 */
bool write_file_content(const std::filesystem::path &path, const std::string &content);

}  // namespace submitter
