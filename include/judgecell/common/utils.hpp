#pragma once

#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <chrono>
#include <filesystem>
#include <map>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

namespace judgecell {

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
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
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器（如果 arg 本身为容器，则遍历这个容器将各个元素加入结果容器中）
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, Head &head, Args &... args) {
    to_string_cont<std::decay_t<Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 执行外部命令并等待其结束
 * @param argv 外部命令的路径 (argv[0]) 和 参数 (argv)
 * @return 外部命令的返回值，如果外部命令因为信号崩溃而没有返回码，则返回 -1
 * @throw std::system_error fork 失败
 */
int exec_program(const std::vector<std::string> &argv);

/**
 * @brief 调用外部程序
 * @note 与 system(cmd) 的区别是，这个函数避免了转义导致的安全问题
 * @param args 转送给应用程序的参数列表，比如可以传入 filesystem::path 给 args[0] 来表示应用程序路径
 * @code{.cpp}
 *     // 相当于 system("runc delete --force judgecell-xxx");
 *     int exitcode = call_process(RUNTIME_PATH, "delete", "--force", id);
 * @endcode
 */
template <typename... Args>
int call_process(Args &&... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);

#ifndef NDEBUG
    std::stringstream ss;
    for (auto &arg : list) ss << arg << ' ';
    DLOG(INFO) << ss.str();
#endif

    return exec_program(list);
}

/**
 * @brief 生成随机 uuid，可在多个线程中同时调用
 */
boost::uuids::uuid generate_uuid();

struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace judgecell
