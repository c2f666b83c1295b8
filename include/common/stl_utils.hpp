#pragma once

#include <string>
#include <vector>

namespace kata {

/**
 * @brief 去除字符串首尾的空白字符
 */
std::string trim_copy(const std::string &s);

/**
 * @brief 按分隔符切分字符串，保留空的片段
 */
std::vector<std::string> split_by(const std::string &text, const std::string &separator);

/**
 * @brief 配合 std::visit 使用，将多个 lambda 组合成一个访问者
 * @code{.cpp}
 *     std::visit(overloaded{
 *         [](const python_config &) { ... },
 *         [](const cpp_config &) { ... }}, config);
 * @endcode
 */
template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template <class... Ts>
overloaded(Ts...)->overloaded<Ts...>;

}  // namespace kata
