#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace nlohmann {

namespace detail_judgecell {

template <typename... Keys>
const json *find_path(const json &j, Keys &&... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    auto step = [&ref](const auto &key) {
        if (ref && ref->is_object() && ref->count(key))
            ref = &ref->at(key);
        else
            ref = nullptr;
    };
    (step(keys), ...);
    return ref;
}

}  // namespace detail_judgecell

template <typename... Keys>
bool exists(const json &j, Keys &&... keys) {
    const json *ref = detail_judgecell::find_path(j, keys...);
    return ref && !ref->is_null();
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const json &j, Keys &&... keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg += " in " + j.dump(2, ' ', false, json::error_handler_t::replace);
    return std::invalid_argument(msg);
}

template <typename... Keys>
const json &access(const json &j, Keys &&... keys) {
    const json *ref = detail_judgecell::find_path(j, keys...);
    if (!ref)
        throw build_invalid_argument(j, keys...);
    else
        return *ref;
}

/**
 * @brief 读取必需字段，字段缺失或类型不符时抛出 std::invalid_argument
 */
template <typename T, typename... Keys>
T get_value(const json &j, Keys &&... keys) {
    const json &res = access(j, keys...);
    try {
        return res.get<T>();
    } catch (json::exception &) {
        throw build_invalid_argument(j, keys...);
    }
}

/**
 * @brief 读取可选字段，字段缺失或为 null 时返回 def_value，类型不符时抛出 std::invalid_argument
 */
template <typename T, typename... Keys>
T get_value_def(const json &j, const T &def_value, Keys &&... keys) {
    if (!exists(j, keys...)) return def_value;
    return get_value<T>(j, keys...);
}

/**
 * @brief 读取可为 null 的字段
 */
template <typename T, typename... Keys>
std::optional<T> get_optional(const json &j, Keys &&... keys) {
    if (!exists(j, keys...)) return std::nullopt;
    return get_value<T>(j, keys...);
}

template <typename T>
json from_optional(const std::optional<T> &value) {
    if (value) return json(*value);
    return json(nullptr);
}

}  // namespace nlohmann
