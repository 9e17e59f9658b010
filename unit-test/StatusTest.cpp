#include <sstream>
#include "gtest/gtest.h"
#include "judgecell/model/status.hpp"

using namespace std;
using namespace judgecell;

TEST(StatusTest, DefaultsToPending) {
    judge_status status;
    EXPECT_EQ(status.code(), status_code::PENDING);
    EXPECT_FALSE(status.is_final());
    EXPECT_FALSE(status.is_error());
    EXPECT_STREQ(status.short_code(), "PD");
}

TEST(StatusTest, Predicates) {
    EXPECT_TRUE(judge_status(status_code::ACCEPTED).is_accepted());
    EXPECT_TRUE(judge_status(status_code::ACCEPTED).is_final());
    EXPECT_FALSE(judge_status(status_code::ACCEPTED).is_error());

    EXPECT_FALSE(judge_status(status_code::WRONG_ANSWER).is_error());
    EXPECT_TRUE(judge_status(status_code::WRONG_ANSWER).is_final());
    EXPECT_TRUE(judge_status(status_code::SYSTEM_ERROR).is_error());
    EXPECT_TRUE(judge_status(status_code::COMPILATION_ERROR).is_error());
    EXPECT_TRUE(judge_status(status_code::CANCELLED).is_final());
    EXPECT_FALSE(judge_status(status_code::JUDGING).is_final());
}

TEST(StatusTest, RuntimeErrorCarriesKind) {
    auto status = judge_status::runtime_error(runtime_error_kind::DIVISION_BY_ZERO);
    EXPECT_TRUE(status.is_runtime_error());
    EXPECT_TRUE(status.is_error());
    ASSERT_TRUE(status.runtime_error_type());
    EXPECT_EQ(*status.runtime_error_type(), runtime_error_kind::DIVISION_BY_ZERO);
    EXPECT_FALSE(judge_status(status_code::WRONG_ANSWER).runtime_error_type());

    EXPECT_EQ(status, judge_status::runtime_error(runtime_error_kind::DIVISION_BY_ZERO));
    EXPECT_NE(status, judge_status::runtime_error(runtime_error_kind::SEGMENTATION_FAULT));
    EXPECT_NE(status, judge_status(status_code::RUNTIME_ERROR));
}

TEST(StatusTest, DisplayNames) {
    EXPECT_STREQ(judge_status(status_code::ACCEPTED).display_name(), "Accepted");
    EXPECT_STREQ(judge_status(status_code::WRONG_ANSWER).display_name(), "Wrong Answer");
    EXPECT_STREQ(judge_status(status_code::TIME_LIMIT_EXCEEDED).short_code(), "TLE");
    EXPECT_STREQ(judge_status(status_code::OUTPUT_LIMIT_EXCEEDED).short_code(), "OLE");
    EXPECT_STREQ(judge_status(status_code::CANCELLED).short_code(), "CN");

    stringstream ss;
    ss << judge_status::runtime_error(runtime_error_kind::SEGMENTATION_FAULT);
    EXPECT_EQ(ss.str(), "Runtime Error (Segmentation fault)");
}

TEST(StatusTest, ParseSerialNames) {
    EXPECT_EQ(parse_status_code("MemoryLimitExceeded"), status_code::MEMORY_LIMIT_EXCEEDED);
    EXPECT_EQ(parse_runtime_error_kind("StackOverflow"), runtime_error_kind::STACK_OVERFLOW);
    EXPECT_STREQ(get_serial_name(status_code::COMPILATION_ERROR), "CompileError");
    EXPECT_THROW(parse_status_code("Exploded"), invalid_argument);
    EXPECT_THROW(parse_runtime_error_kind("Exploded"), invalid_argument);
}
