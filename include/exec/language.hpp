#pragma once

#include <array>
#include <string>

namespace kata {

/**
 * @brief 支持的选手语言
 * 新增语言时需要同时扩展 adapter_config，编译器会检查 dispatcher 中的 std::visit 是否完整
 */
enum class language {
    PYTHON,
    JAVASCRIPT,
    TYPESCRIPT,
    CPP
};

constexpr std::array<language, 4> all_languages = {language::PYTHON, language::JAVASCRIPT, language::TYPESCRIPT, language::CPP};

/**
 * @brief 解析语言的短名称 "py"、"js"、"ts"、"cpp"
 * @throw std::invalid_argument 不支持的语言
 */
language parse_language(const std::string &name);

/**
 * @return 语言的短名称，与 parse_language 互逆
 */
std::string to_string(language lang);

}  // namespace kata
