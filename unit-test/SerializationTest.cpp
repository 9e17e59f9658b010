#include <boost/uuid/uuid_io.hpp>
#include "gtest/gtest.h"
#include "judgecell/common/utils.hpp"
#include "judgecell/model/serialization.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace judgecell;
using nlohmann::json;

TEST(SerializationTest, StatusIsExternallyTagged) {
    EXPECT_JSON_EQ(json(judge_status(status_code::ACCEPTED)), json("Accepted"));
    EXPECT_JSON_EQ(json(judge_status::runtime_error(runtime_error_kind::SEGMENTATION_FAULT)),
                   json::parse(R"({"RuntimeError": "SegmentationFault"})"));

    EXPECT_EQ(json("TimeLimitExceeded").get<judge_status>(), judge_status(status_code::TIME_LIMIT_EXCEEDED));
    EXPECT_EQ(json::parse(R"({"RuntimeError": "DivisionByZero"})").get<judge_status>(),
              judge_status::runtime_error(runtime_error_kind::DIVISION_BY_ZERO));

    EXPECT_THROW(json("RuntimeError").get<judge_status>(), invalid_argument);
    EXPECT_THROW(json::parse(R"({"WrongAnswer": "Other"})").get<judge_status>(), invalid_argument);
    EXPECT_THROW(json(3).get<judge_status>(), invalid_argument);
}

TEST(SerializationTest, EveryStatusRoundTrips) {
    for (int code = static_cast<int>(status_code::ACCEPTED); code <= static_cast<int>(status_code::CANCELLED); ++code) {
        judge_status status(static_cast<status_code>(code));
        EXPECT_EQ(json(status).get<judge_status>(), status) << status;
    }
    for (int kind = static_cast<int>(runtime_error_kind::SEGMENTATION_FAULT); kind <= static_cast<int>(runtime_error_kind::OTHER); ++kind) {
        auto status = judge_status::runtime_error(static_cast<runtime_error_kind>(kind));
        json j = status;
        ASSERT_TRUE(j.is_object()) << status;
        EXPECT_EQ(j.get<judge_status>(), status) << status;
    }
}

TEST(SerializationTest, ErrorInfoWithEveryField) {
    error_info info;
    info.message = "Compilation failed";
    info.code = string("E0308");
    info.line = 12;
    info.column = 5;
    info.error_output = string("main.rs:12:5: error[E0308]: mismatched types");
    info.standard_output = string("warning: unused variable");
    info.exit_code = 1;
    info.signal = 9;

    json j = info;
    EXPECT_EQ(j["code"], "E0308");
    EXPECT_EQ(j["line"], 12);
    EXPECT_EQ(j["column"], 5);
    EXPECT_EQ(j["exit_code"], 1);
    EXPECT_EQ(json::parse(j.dump()).get<error_info>(), info);
}

TEST(SerializationTest, ErrorInfoFields) {
    auto info = error_info::runtime_error("Segmentation fault: terminated by signal 11", 11, string("core dumped"));
    json expected = {
        {"message", "Segmentation fault: terminated by signal 11"},
        {"code", nullptr},
        {"line", nullptr},
        {"column", nullptr},
        {"stderr", "core dumped"},
        {"stdout", nullptr},
        {"exit_code", nullptr},
        {"signal", 11}};
    EXPECT_JSON_EQ(json(info), expected);
    EXPECT_EQ(expected.get<error_info>(), info);
}

TEST(SerializationTest, JudgeTaskDecode) {
    auto sub = submission::create(generate_uuid(), generate_uuid(), language::CPP17, "int main() {}", 1000, 262144);
    auto tc = test_case::create("1", "1 2\n", "3\n");
    tc.weight = 2.5;
    auto task = judge_task::create(sub, {tc, test_case::hidden("2", "", "")});
    task.runtime_args = vector<string>{"--quiet"};

    json j = task;
    EXPECT_EQ(j["submission"]["language"], "Cpp17");
    EXPECT_EQ(j["submission"]["contest_id"], nullptr);
    EXPECT_EQ(j["test_cases"][0]["weight"], 2.5);
    EXPECT_EQ(j.get<judge_task>(), task);
}

TEST(SerializationTest, JudgeTaskValidation) {
    auto sub = submission::create(generate_uuid(), generate_uuid(), language::PYTHON3, "print(1)", 1000, 65536);
    json j = judge_task::create(sub, {test_case::create("1", "", "1\n")});

    json wrong_compilation = j;
    wrong_compilation["needs_compilation"] = true;
    EXPECT_THROW(wrong_compilation.get<judge_task>(), invalid_argument);

    json unsandboxed = j;
    unsandboxed["use_sandbox"] = false;
    EXPECT_THROW(unsandboxed.get<judge_task>(), invalid_argument);

    json negative_weight = j;
    negative_weight["test_cases"][0]["weight"] = -1;
    EXPECT_THROW(negative_weight.get<judge_task>(), invalid_argument);

    json bad_language = j;
    bad_language["submission"]["language"] = "Cobol";
    EXPECT_THROW(bad_language.get<judge_task>(), invalid_argument);

    json bad_uuid = j;
    bad_uuid["submission"]["id"] = "not-a-uuid";
    EXPECT_THROW(bad_uuid.get<judge_task>(), invalid_argument);

    json missing_source = j;
    missing_source["submission"].erase("source_code");
    EXPECT_THROW(missing_source.get<judge_task>(), invalid_argument);
}

TEST(SerializationTest, JudgeResultFields) {
    auto sub = submission::create(generate_uuid(), generate_uuid(), language::C, "", 1000, 65536);
    auto result = judge_result::pending(sub);

    test_case_result tc;
    tc.id = "1";
    tc.status = judge_status::runtime_error(runtime_error_kind::FLOATING_POINT_EXCEPTION);
    tc.time_used = 12;
    tc.memory_used = 3072;
    tc.actual_output = "";
    tc.error = error_info::runtime_error("Floating point exception: terminated by signal 8", 8, nullopt);
    result.add_test_case(tc);
    result.finalize(judge_task::create(sub, {test_case::create("1", "", "")}));

    json j = result;
    EXPECT_JSON_EQ(j["status"], json::parse(R"({"RuntimeError": "FloatingPointException"})"));
    EXPECT_EQ(j["submission_id"], boost::uuids::to_string(sub.id));
    EXPECT_EQ(j["score"], 0.0);
    EXPECT_EQ(j["test_cases"][0]["error_info"]["signal"], 8);
    EXPECT_EQ(j["error_info"], nullptr);
    EXPECT_EQ(j.get<judge_result>(), result);

    j["score"] = 120;
    EXPECT_THROW(j.get<judge_result>(), invalid_argument);
}

TEST(SerializationTest, ArbitraryBytesAreLossless) {
    auto sub = submission::create(generate_uuid(), generate_uuid(), language::C, "", 1000, 65536);
    auto result = judge_result::pending(sub);

    test_case_result tc;
    tc.id = "1";
    tc.status = status_code::WRONG_ANSWER;
    tc.input = string("1 2\n");
    tc.expected_output = string("3\n");
    tc.actual_output = string("\xff\xfe\n");
    tc.error = error_info::from_message("Wrong answer");
    tc.error->standard_output = string("\x80");
    tc.error->error_output = string("\xe4\xbd\xa0\xe5\xa5\xbd");
    result.add_test_case(tc);
    result.finalize(judge_task::create(sub, {test_case::create("1", "1 2\n", "3\n")}));

    json j = result;
    auto &encoded = j["test_cases"][0];
    EXPECT_EQ(encoded["input"], "1 2\n");
    EXPECT_JSON_EQ(encoded["actual_output"], json({{"base64", "//4K"}}));
    EXPECT_JSON_EQ(encoded["error_info"]["stdout"], json({{"base64", "gA=="}}));
    // 合法的 UTF-8 保持为字符串
    EXPECT_EQ(encoded["error_info"]["stderr"], "\xe4\xbd\xa0\xe5\xa5\xbd");

    string text;
    ASSERT_NO_THROW(text = j.dump());
    auto decoded = json::parse(text).get<judge_result>();
    EXPECT_EQ(decoded, result);
    EXPECT_EQ(*decoded.test_cases[0].actual_output, "\xff\xfe\n");
}

TEST(SerializationTest, DecodeBytes) {
    EXPECT_EQ(decode_bytes(json("plain")), "plain");
    EXPECT_EQ(decode_bytes(json({{"base64", "Zm9vYg=="}})), "foob");
    EXPECT_EQ(decode_bytes(json({{"base64", "Zm9vYmE="}})), "fooba");
    EXPECT_EQ(decode_bytes(json({{"base64", ""}})), "");
    EXPECT_EQ(decode_bytes(encode_bytes(string("\0\xc0\xaf", 3))), string("\0\xc0\xaf", 3));

    EXPECT_THROW(decode_bytes(json({{"base64", "Zm9"}})), invalid_argument);
    EXPECT_THROW(decode_bytes(json({{"base64", "Zm9@"}})), invalid_argument);
    EXPECT_THROW(decode_bytes(json({{"hex", "ff"}})), invalid_argument);
    EXPECT_THROW(decode_bytes(json(42)), invalid_argument);
}

TEST(SerializationTest, Timestamp) {
    auto time = parse_timestamp("2024-01-02T03:04:05.678Z");
    EXPECT_EQ(format_timestamp(time), "2024-01-02T03:04:05.678Z");
    EXPECT_EQ(time.time_since_epoch().count(), 1704164645678LL);
    EXPECT_THROW(parse_timestamp("yesterday"), invalid_argument);
}
