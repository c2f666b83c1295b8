#pragma once

#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <string>
#include <type_traits>
#include <vector>

namespace kata {

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::string> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::string &element) {
        cont.push_back(element);
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief 将参数 args 的内容转换为字符串并装入容器中
 * 用于拼接命令行参数，比如编译器路径、编译选项列表、源文件路径
 * @param cont 字符串容器
 * @param args 按顺序转换为字符串并装入容器（如果 arg 本身为 vector，则将各个元素依次加入）
 * @code{.cpp}
 *     std::vector<std::string> command;
 *     // 相当于 {"g++", "-std=c++17", "-O2", "-o", "solution", "entry.cpp"}
 *     to_string_list(command, "g++", flags, "-o", "solution", entry);
 * @endcode
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, const Head &head, const Args &... args) {
    using element_t = std::conditional_t<std::is_array_v<Head> || std::is_pointer_v<std::decay_t<Head>>, std::string, std::decay_t<Head>>;
    to_string_cont<element_t>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 记录从构造开始经过的时间，使用单调时钟避免系统时间被修改的影响
 */
struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace kata
