#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace kata {

/**
 * @brief 按键的路径查找 JSON 中的元素
 * @code{.cpp}
 *     find_path(j, "params", "rubric", "keys");
 * @endcode
 * @return 路径上任何一层不存在时返回空指针
 */
template <typename... Keys>
const nlohmann::json *find_path(const nlohmann::json &j, const Keys &... keys) {
    const nlohmann::json *ref = j.is_null() ? nullptr : &j;
    auto step = [&ref](const auto &key) {
        if (ref && ref->is_object() && ref->count(key))
            ref = &ref->at(key);
        else
            ref = nullptr;
    };
    (step(keys), ...);
    return ref;
}

template <typename... Keys>
bool exists(const nlohmann::json &j, const Keys &... keys) {
    const nlohmann::json *ref = find_path(j, keys...);
    return ref && !ref->is_null();
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const Keys &... keys) {
    std::string path;
    ((path += (path.empty() ? "" : ".") + std::string(keys)), ...);
    return std::invalid_argument("missing or invalid field: " + path);
}

/**
 * @throw std::invalid_argument 字段不存在或者类型错误
 */
template <typename T, typename... Keys>
T get_value(const nlohmann::json &j, const Keys &... keys) {
    const nlohmann::json *ref = find_path(j, keys...);
    if (!ref || ref->is_null())
        throw build_invalid_argument(keys...);
    try {
        return ref->get<T>();
    } catch (nlohmann::json::type_error &) {
        throw build_invalid_argument(keys...);
    }
}

/**
 * @return 字段不存在或为 null 时返回 def_value
 * @throw std::invalid_argument 字段类型错误
 */
template <typename T, typename... Keys>
T get_value_def(const nlohmann::json &j, const T &def_value, const Keys &... keys) {
    if (!exists(j, keys...)) return def_value;
    return get_value<T>(j, keys...);
}

/**
 * @brief 字段存在时赋值给 value，否则 value 不变
 * @throw std::invalid_argument 字段类型错误
 */
template <typename T, typename... Keys>
void assign_optional(const nlohmann::json &j, std::optional<T> &value, const Keys &... keys) {
    if (exists(j, keys...)) value = get_value<T>(j, keys...);
}

template <typename T>
nlohmann::json optional_json(const std::optional<T> &value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace kata
