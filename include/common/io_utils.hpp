#pragma once

#include <filesystem>
#include <string>

namespace kata {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw std::system_error 文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path, const std::string &def);

/**
 * @brief 将 content 写入文件，文件已经存在时覆盖
 * @throw std::system_error 文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 将非法的 UTF-8 字节替换为 U+FFFD
 * 选手程序的输出可能是任意字节，序列化为 JSON 之前必须保证是合法的 UTF-8
 */
std::string sanitize_utf8(const std::string &string);

/**
 * @brief 截取字符串末尾最多 limit 个字节，用于在诊断信息中展示 stderr
 */
std::string tail(const std::string &text, size_t limit);

}  // namespace kata
