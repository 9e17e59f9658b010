#include "judgecell/judge/classifier.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <regex>
#include <utility>
#include <vector>

namespace judgecell {
using namespace std;

// 按顺序匹配，先匹配到的优先
// clang-format off
static const vector<pair<const char *, runtime_error_kind>> error_signatures = {
    {"RecursionError", runtime_error_kind::STACK_OVERFLOW},
    {"StackOverflowError", runtime_error_kind::STACK_OVERFLOW},
    {"Maximum call stack size exceeded", runtime_error_kind::STACK_OVERFLOW},
    {"has overflowed its stack", runtime_error_kind::STACK_OVERFLOW},
    {"goroutine stack exceeds", runtime_error_kind::STACK_OVERFLOW},
    {"ZeroDivisionError", runtime_error_kind::DIVISION_BY_ZERO},
    {"ArithmeticException: / by zero", runtime_error_kind::DIVISION_BY_ZERO},
    {"attempt to divide by zero", runtime_error_kind::DIVISION_BY_ZERO},
    {"integer divide by zero", runtime_error_kind::DIVISION_BY_ZERO},
    {"NullPointerException", runtime_error_kind::NULL_POINTER_DEREFERENCE},
    {"nil pointer dereference", runtime_error_kind::NULL_POINTER_DEREFERENCE},
    {"Cannot read properties of null", runtime_error_kind::NULL_POINTER_DEREFERENCE},
    {"Cannot read properties of undefined", runtime_error_kind::NULL_POINTER_DEREFERENCE},
    {"AssertionError", runtime_error_kind::ASSERTION_FAILED},
    {"Assertion `", runtime_error_kind::ASSERTION_FAILED},
    {"assertion failed", runtime_error_kind::ASSERTION_FAILED},
    {"PermissionError", runtime_error_kind::PERMISSION_DENIED},
    {"AccessDeniedException", runtime_error_kind::PERMISSION_DENIED},
    {"Permission denied", runtime_error_kind::PERMISSION_DENIED},
    {"FileNotFoundError", runtime_error_kind::FILE_OPERATION_ERROR},
    {"FileNotFoundException", runtime_error_kind::FILE_OPERATION_ERROR},
    {"No such file or directory", runtime_error_kind::FILE_OPERATION_ERROR},
};
// clang-format on

runtime_error_kind classify_error_output(const string &error_output) {
    for (auto &[signature, kind] : error_signatures)
        if (boost::algorithm::contains(error_output, signature))
            return kind;
    return runtime_error_kind::OTHER;
}

static uint32_t to_position(const ssub_match &match) {
    return static_cast<uint32_t>(stoul(match.str()));
}

void locate_compile_error(const string &diagnostic, error_info &info) {
    static const regex gcc_style(R"(^[^\s:][^:]*:(\d{1,9}):(\d{1,9}):\s*(?:fatal )?error(?:\[([\w-]+)\])?:)");
    static const regex tsc_style(R"(^[^\s(][^(]*\((\d{1,9}),(\d{1,9})\): error (TS\d+):)");
    static const regex javac_style(R"(^[^\s:][^:]*\.java:(\d{1,9}): error:)");
    static const regex rustc_header(R"(^error(?:\[(E\d+)\])?:)");
    static const regex rustc_location(R"(^\s*--> [^:]+:(\d{1,9}):(\d{1,9}))");
    static const regex any_location(R"(^[^\s:][^:]*:(\d{1,9}):(\d{1,9}):)");

    vector<string> lines;
    boost::algorithm::split(lines, diagnostic, boost::algorithm::is_any_of("\n"));

    optional<pair<uint32_t, uint32_t>> fallback;
    bool in_rustc_error = false;
    optional<string> rustc_code;
    smatch m;
    for (auto &line : lines) {
        if (regex_search(line, m, gcc_style) || regex_search(line, m, tsc_style)) {
            info.line = to_position(m[1]);
            info.column = to_position(m[2]);
            if (m[3].matched) info.code = m[3].str();
            return;
        }
        if (regex_search(line, m, javac_style)) {
            info.line = to_position(m[1]);
            return;
        }
        if (in_rustc_error && regex_search(line, m, rustc_location)) {
            info.line = to_position(m[1]);
            info.column = to_position(m[2]);
            if (rustc_code) info.code = rustc_code;
            return;
        }
        if (regex_search(line, m, rustc_header)) {
            in_rustc_error = true;
            if (m[1].matched) rustc_code = m[1].str();
        } else if (!fallback && regex_search(line, m, any_location)) {
            // go 的报错没有 error 字样
            fallback = make_pair(to_position(m[1]), to_position(m[2]));
        }
    }

    if (fallback) {
        info.line = fallback->first;
        info.column = fallback->second;
    }
}

runtime_error_kind classify_signal(int signal, const string &error_output) {
    bool stack_overflow = classify_error_output(error_output) == runtime_error_kind::STACK_OVERFLOW;
    switch (signal) {
        case SIGSEGV:
        case SIGBUS:
            return stack_overflow ? runtime_error_kind::STACK_OVERFLOW : runtime_error_kind::SEGMENTATION_FAULT;
        case SIGFPE:
            return runtime_error_kind::FLOATING_POINT_EXCEPTION;
        case SIGABRT:
            return stack_overflow ? runtime_error_kind::STACK_OVERFLOW : runtime_error_kind::ASSERTION_FAILED;
        case SIGILL:
            return stack_overflow ? runtime_error_kind::STACK_OVERFLOW : runtime_error_kind::OTHER;
        case SIGXFSZ:
            return runtime_error_kind::FILE_OPERATION_ERROR;
        default:
            return runtime_error_kind::OTHER;
    }
}

static vector<string> significant_lines(const string &text) {
    vector<string> lines;
    boost::algorithm::split(lines, text, [](char c) { return c == '\n'; });
    for (auto &line : lines) boost::algorithm::trim_right(line);
    while (!lines.empty() && lines.back().empty()) lines.pop_back();
    return lines;
}

bool compare_output(const string &expected, const string &actual, compare_mode mode) {
    switch (mode) {
        case compare_mode::EXACT:
            return expected == actual;
        case compare_mode::IGNORE_TRAILING_SPACE:
            return significant_lines(expected) == significant_lines(actual);
    }
    return false;
}

static error_info attach_streams(error_info info, const execution_outcome &outcome, const classify_context &context) {
    if (!outcome.error_output.empty()) info.error_output = outcome.error_output;
    if (!outcome.output.empty()) info.standard_output = outcome.output;
    if (!outcome.signal) info.exit_code = outcome.exit_code;
    else info.signal = outcome.signal;
    info.cap_streams(context.stream_limit);
    return info;
}

/**
 * @brief 不考虑执行阶段的判定，返回的状态为 AC 时表示程序正常退出且输出正确
 */
static classification classify_outcome(const execution_outcome &outcome, const classify_context &context) {
    if (outcome.cancelled)
        return {status_code::CANCELLED, nullopt};

    if (outcome.timed_out || outcome.wall_time_ms > context.time_limit_ms) {
        auto message = fmt::format("Time limit exceeded: ran for {}ms, limit is {}ms", outcome.wall_time_ms, context.time_limit_ms);
        return {status_code::TIME_LIMIT_EXCEEDED, attach_streams(error_info::from_message(message), outcome, context)};
    }

    if (context.memory_limit_kb > 0 && outcome.memory_kb >= context.memory_limit_kb) {
        auto message = fmt::format("Memory limit exceeded: used {}KB, limit is {}KB", outcome.memory_kb, context.memory_limit_kb);
        return {status_code::MEMORY_LIMIT_EXCEEDED, attach_streams(error_info::from_message(message), outcome, context)};
    }

    if (outcome.output_limit_exceeded) {
        auto message = fmt::format("Output limit exceeded: more than {} bytes written", OUTPUT_LIMIT);
        return {status_code::OUTPUT_LIMIT_EXCEEDED, attach_streams(error_info::from_message(message), outcome, context)};
    }

    if (outcome.signal) {
        runtime_error_kind kind = classify_signal(outcome.signal, outcome.error_output);
        auto message = fmt::format("{}: terminated by signal {}", get_display_message(kind), outcome.signal);
        return {judge_status::runtime_error(kind),
                attach_streams(error_info::runtime_error(message, outcome.signal, nullopt), outcome, context)};
    }

    if (outcome.exit_code != 0) {
        runtime_error_kind kind = classify_error_output(outcome.error_output);
        auto message = fmt::format("{}: exited with code {}", get_display_message(kind), outcome.exit_code);
        return {judge_status::runtime_error(kind), attach_streams(error_info::from_message(message), outcome, context)};
    }

    if (context.expected_output && !compare_output(*context.expected_output, outcome.output, context.mode))
        return {status_code::WRONG_ANSWER, nullopt};

    return {status_code::ACCEPTED, nullopt};
}

classification classify(const execution_outcome &outcome, const classify_context &context) {
    classification result = classify_outcome(outcome, context);
    if (context.phase == execution_phase::COMPILE && !result.status.is_accepted() &&
        result.status.code() != status_code::CANCELLED) {
        string reason = result.error ? result.error->message : result.status.display_name();
        error_info info = error_info::compilation_error("Compilation failed: " + reason, outcome.error_output);
        if (!outcome.output.empty()) info.standard_output = outcome.output;
        if (outcome.signal) info.signal = outcome.signal;
        else info.exit_code = outcome.exit_code;
        locate_compile_error(outcome.error_output, info);
        // tsc 把错误写到 stdout
        if (!info.line) locate_compile_error(outcome.output, info);
        info.cap_streams(context.stream_limit);
        result = {status_code::COMPILATION_ERROR, info};
    }
    return result;
}

}  // namespace judgecell
