#include "judgecell/model/serialization.hpp"
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <stdexcept>
#include "judgecell/common/io_utils.hpp"
#include "judgecell/common/json_utils.hpp"

namespace judgecell {
using namespace std;
using namespace nlohmann;

string uuid_to_string(const boost::uuids::uuid &uuid) {
    return boost::uuids::to_string(uuid);
}

boost::uuids::uuid parse_uuid(const string &str) {
    try {
        return boost::uuids::string_generator()(str);
    } catch (std::runtime_error &) {
        throw invalid_argument("Malformed uuid " + str);
    }
}

typedef boost::archive::iterators::base64_from_binary<
    boost::archive::iterators::transform_width<string::const_iterator, 6, 8>>
    base64_encoder;
typedef boost::archive::iterators::transform_width<
    boost::archive::iterators::binary_from_base64<string::const_iterator>, 8, 6>
    base64_decoder;

static string encode_base64(const string &bytes) {
    string encoded(base64_encoder(bytes.begin()), base64_encoder(bytes.end()));
    encoded.append((3 - bytes.size() % 3) % 3, '=');
    return encoded;
}

static string decode_base64(string encoded) {
    if (encoded.size() % 4 != 0)
        throw invalid_argument("Length of base64 text should be a multiple of 4");
    size_t padding = 0;
    while (padding < 2 && padding < encoded.size() && encoded[encoded.size() - 1 - padding] == '=') ++padding;
    // 填充位置换成值为 0 的字符，解码后再截掉
    replace(encoded.end() - padding, encoded.end(), '=', 'A');
    try {
        string decoded(base64_decoder(encoded.cbegin()), base64_decoder(encoded.cend()));
        decoded.resize(encoded.size() / 4 * 3 - padding);
        return decoded;
    } catch (boost::archive::iterators::dataflow_exception &e) {
        throw invalid_argument(string("Malformed base64 text: ") + e.what());
    }
}

json encode_bytes(const string &bytes) {
    if (is_valid_utf8(bytes)) return bytes;
    return {{"base64", encode_base64(bytes)}};
}

string decode_bytes(const json &j) {
    if (j.is_string()) return j.get<string>();
    if (j.is_object() && j.size() == 1 && j.count("base64") && j["base64"].is_string())
        return decode_base64(j["base64"].get<string>());
    throw invalid_argument("Malformed byte string " + j.dump(-1, ' ', false, json::error_handler_t::replace));
}

static json encode_optional_bytes(const optional<string> &bytes) {
    if (bytes) return encode_bytes(*bytes);
    return nullptr;
}

static string get_bytes(const json &j, const char *key) {
    return decode_bytes(get_value<json>(j, key));
}

static optional<string> get_optional_bytes(const json &j, const char *key) {
    auto value = get_optional<json>(j, key);
    if (!value) return nullopt;
    return decode_bytes(*value);
}

static json optional_uuid(const optional<boost::uuids::uuid> &uuid) {
    if (uuid) return uuid_to_string(*uuid);
    return nullptr;
}

void to_json(json &j, language lang) {
    j = get_serial_name(lang);
}

void from_json(const json &j, language &lang) {
    if (!j.is_string()) throw invalid_argument("Language should be a string, got " + j.dump());
    lang = parse_language(j.get<string>());
}

void to_json(json &j, const judge_status &status) {
    if (auto kind = status.runtime_error_type())
        j = {{get_serial_name(status.code()), get_serial_name(*kind)}};
    else
        j = get_serial_name(status.code());
}

void from_json(const json &j, judge_status &status) {
    if (j.is_string()) {
        status_code code = parse_status_code(j.get<string>());
        if (code == status_code::RUNTIME_ERROR)
            throw invalid_argument("RuntimeError should carry its runtime error type");
        status = code;
    } else if (j.is_object() && j.size() == 1 && j.begin().key() == get_serial_name(status_code::RUNTIME_ERROR) && j.begin()->is_string()) {
        status = judge_status::runtime_error(parse_runtime_error_kind(j.begin()->get<string>()));
    } else {
        throw invalid_argument("Malformed judge status " + j.dump());
    }
}

void to_json(json &j, const error_info &info) {
    j = {{"message", encode_bytes(info.message)},
         {"code", from_optional(info.code)},
         {"line", from_optional(info.line)},
         {"column", from_optional(info.column)},
         {"stderr", encode_optional_bytes(info.error_output)},
         {"stdout", encode_optional_bytes(info.standard_output)},
         {"exit_code", from_optional(info.exit_code)},
         {"signal", from_optional(info.signal)}};
}

void from_json(const json &j, error_info &info) {
    info.message = get_bytes(j, "message");
    info.code = get_optional<string>(j, "code");
    info.line = get_optional<uint32_t>(j, "line");
    info.column = get_optional<uint32_t>(j, "column");
    info.error_output = get_optional_bytes(j, "stderr");
    info.standard_output = get_optional_bytes(j, "stdout");
    info.exit_code = get_optional<int>(j, "exit_code");
    info.signal = get_optional<int>(j, "signal");
}

void to_json(json &j, const submission &sub) {
    j = {{"id", uuid_to_string(sub.id)},
         {"problem_id", uuid_to_string(sub.problem_id)},
         {"user_id", uuid_to_string(sub.user_id)},
         {"language", sub.lang},
         {"source_code", encode_bytes(sub.source_code)},
         {"created_at", format_timestamp(sub.created_at)},
         {"time_limit", sub.time_limit},
         {"memory_limit", sub.memory_limit},
         {"priority", sub.priority},
         {"contest_id", optional_uuid(sub.contest_id)}};
}

void from_json(const json &j, submission &sub) {
    sub.id = parse_uuid(get_value<string>(j, "id"));
    sub.problem_id = parse_uuid(get_value<string>(j, "problem_id"));
    sub.user_id = parse_uuid(get_value<string>(j, "user_id"));
    sub.lang = get_value<language>(j, "language");
    sub.source_code = get_bytes(j, "source_code");
    sub.created_at = parse_timestamp(get_value<string>(j, "created_at"));
    sub.time_limit = get_value<uint64_t>(j, "time_limit");
    sub.memory_limit = get_value<uint64_t>(j, "memory_limit");
    sub.priority = get_value_def<int>(j, 0, "priority");
    auto contest_id = get_optional<string>(j, "contest_id");
    sub.contest_id = contest_id ? optional(parse_uuid(*contest_id)) : nullopt;
}

void to_json(json &j, const test_case &tc) {
    j = {{"id", tc.id},
         {"input", encode_bytes(tc.input)},
         {"expected_output", encode_bytes(tc.expected_output)},
         {"time_limit", from_optional(tc.time_limit)},
         {"memory_limit", from_optional(tc.memory_limit)},
         {"is_hidden", tc.is_hidden},
         {"weight", tc.weight}};
}

void from_json(const json &j, test_case &tc) {
    tc.id = get_value<string>(j, "id");
    tc.input = get_bytes(j, "input");
    tc.expected_output = get_bytes(j, "expected_output");
    tc.time_limit = get_optional<uint64_t>(j, "time_limit");
    tc.memory_limit = get_optional<uint64_t>(j, "memory_limit");
    tc.is_hidden = get_value_def<bool>(j, false, "is_hidden");
    tc.weight = get_value_def<double>(j, 1.0, "weight");
    if (!(tc.weight >= 0))
        throw invalid_argument("Weight of test case " + tc.id + " should be non-negative");
}

void to_json(json &j, const judge_task &task) {
    j = {{"submission", task.submission},
         {"test_cases", task.test_cases},
         {"needs_compilation", task.needs_compilation},
         {"use_sandbox", task.use_sandbox},
         {"compile_flags", from_optional(task.compile_flags)},
         {"runtime_args", from_optional(task.runtime_args)}};
}

void from_json(const json &j, judge_task &task) {
    task.submission = get_value<submission>(j, "submission");
    task.test_cases = get_value<vector<test_case>>(j, "test_cases");
    task.needs_compilation = get_value_def<bool>(j, task.submission.needs_compilation(), "needs_compilation");
    if (task.needs_compilation != task.submission.needs_compilation())
        throw invalid_argument(string("needs_compilation does not match language ") + display_name(task.submission.lang));
    task.use_sandbox = get_value_def<bool>(j, true, "use_sandbox");
    if (!task.use_sandbox)
        throw invalid_argument("Judge tasks can only be run inside a sandbox");
    task.compile_flags = get_optional<vector<string>>(j, "compile_flags");
    task.runtime_args = get_optional<vector<string>>(j, "runtime_args");
}

void to_json(json &j, const test_case_result &result) {
    j = {{"id", result.id},
         {"status", result.status},
         {"time_used", result.time_used},
         {"memory_used", result.memory_used},
         {"input", encode_optional_bytes(result.input)},
         {"expected_output", encode_optional_bytes(result.expected_output)},
         {"actual_output", encode_optional_bytes(result.actual_output)},
         {"error_info", from_optional(result.error)}};
}

void from_json(const json &j, test_case_result &result) {
    result.id = get_value<string>(j, "id");
    result.status = get_value<judge_status>(j, "status");
    result.time_used = get_value<uint64_t>(j, "time_used");
    result.memory_used = get_value<uint64_t>(j, "memory_used");
    result.input = get_optional_bytes(j, "input");
    result.expected_output = get_optional_bytes(j, "expected_output");
    result.actual_output = get_optional_bytes(j, "actual_output");
    result.error = get_optional<error_info>(j, "error_info");
}

void to_json(json &j, const judge_result &result) {
    j = {{"status", result.status},
         {"time_used", result.time_used},
         {"memory_used", result.memory_used},
         {"error_info", from_optional(result.error)},
         {"test_cases", result.test_cases},
         {"submission_id", uuid_to_string(result.submission_id)},
         {"problem_id", uuid_to_string(result.problem_id)},
         {"user_id", uuid_to_string(result.user_id)},
         {"judged_at", format_timestamp(result.judged_at)},
         {"score", result.score}};
}

void from_json(const json &j, judge_result &result) {
    result.status = get_value<judge_status>(j, "status");
    result.time_used = get_value<uint64_t>(j, "time_used");
    result.memory_used = get_value<uint64_t>(j, "memory_used");
    result.error = get_optional<error_info>(j, "error_info");
    result.test_cases = get_value<vector<test_case_result>>(j, "test_cases");
    result.submission_id = parse_uuid(get_value<string>(j, "submission_id"));
    result.problem_id = parse_uuid(get_value<string>(j, "problem_id"));
    result.user_id = parse_uuid(get_value<string>(j, "user_id"));
    result.judged_at = parse_timestamp(get_value<string>(j, "judged_at"));
    result.score = get_value<double>(j, "score");
    if (!(result.score >= 0 && result.score <= 100))
        throw invalid_argument("Score should be in range [0, 100]");
}

}  // namespace judgecell
