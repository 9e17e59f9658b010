#include "judgecell/model/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace judgecell {
using namespace std;

struct status_names {
    const char *display;
    const char *code;
    const char *serial;
};

// clang-format off
static const unordered_map<status_code, status_names> status_string = boost::assign::map_list_of
    (status_code::ACCEPTED, status_names{"Accepted", "AC", "Accepted"})
    (status_code::WRONG_ANSWER, status_names{"Wrong Answer", "WA", "WrongAnswer"})
    (status_code::TIME_LIMIT_EXCEEDED, status_names{"Time Limit Exceeded", "TLE", "TimeLimitExceeded"})
    (status_code::MEMORY_LIMIT_EXCEEDED, status_names{"Memory Limit Exceeded", "MLE", "MemoryLimitExceeded"})
    (status_code::RUNTIME_ERROR, status_names{"Runtime Error", "RE", "RuntimeError"})
    (status_code::COMPILATION_ERROR, status_names{"Compile Error", "CE", "CompileError"})
    (status_code::RESTRICTED_OPERATION, status_names{"Restricted Operation", "RO", "RestrictedOperation"})
    (status_code::OUTPUT_LIMIT_EXCEEDED, status_names{"Output Limit Exceeded", "OLE", "OutputLimitExceeded"})
    (status_code::SYSTEM_ERROR, status_names{"System Error", "SE", "SystemError"})
    (status_code::PENDING, status_names{"Pending", "PD", "Pending"})
    (status_code::JUDGING, status_names{"Judging", "JG", "Judging"})
    (status_code::CANCELLED, status_names{"Cancelled", "CN", "Cancelled"});

static const unordered_map<runtime_error_kind, pair<const char *, const char *>> runtime_error_string = boost::assign::map_list_of
    (runtime_error_kind::SEGMENTATION_FAULT, make_pair("Segmentation fault", "SegmentationFault"))
    (runtime_error_kind::FLOATING_POINT_EXCEPTION, make_pair("Floating point exception", "FloatingPointException"))
    (runtime_error_kind::DIVISION_BY_ZERO, make_pair("Division by zero", "DivisionByZero"))
    (runtime_error_kind::ASSERTION_FAILED, make_pair("Assertion failed", "AssertionFailed"))
    (runtime_error_kind::STACK_OVERFLOW, make_pair("Stack overflow", "StackOverflow"))
    (runtime_error_kind::NULL_POINTER_DEREFERENCE, make_pair("Null pointer dereference", "NullPointerDereference"))
    (runtime_error_kind::FILE_OPERATION_ERROR, make_pair("File operation error", "FileOperationError"))
    (runtime_error_kind::PERMISSION_DENIED, make_pair("Permission denied", "PermissionDenied"))
    (runtime_error_kind::OTHER, make_pair("Unknown runtime error", "Other"));
// clang-format on

judge_status::judge_status(status_code code)
    : status(code), kind(runtime_error_kind::OTHER) {}

judge_status judge_status::runtime_error(runtime_error_kind kind) {
    judge_status result(status_code::RUNTIME_ERROR);
    result.kind = kind;
    return result;
}

status_code judge_status::code() const {
    return status;
}

optional<runtime_error_kind> judge_status::runtime_error_type() const {
    if (status == status_code::RUNTIME_ERROR) return kind;
    return nullopt;
}

bool judge_status::is_accepted() const {
    return status == status_code::ACCEPTED;
}

bool judge_status::is_final() const {
    return status != status_code::PENDING && status != status_code::JUDGING;
}

bool judge_status::is_error() const {
    switch (status) {
        case status_code::TIME_LIMIT_EXCEEDED:
        case status_code::MEMORY_LIMIT_EXCEEDED:
        case status_code::RUNTIME_ERROR:
        case status_code::COMPILATION_ERROR:
        case status_code::RESTRICTED_OPERATION:
        case status_code::OUTPUT_LIMIT_EXCEEDED:
        case status_code::SYSTEM_ERROR:
            return true;
        default:
            return false;
    }
}

bool judge_status::is_runtime_error() const {
    return status == status_code::RUNTIME_ERROR;
}

const char *judge_status::display_name() const {
    return status_string.at(status).display;
}

const char *judge_status::short_code() const {
    return status_string.at(status).code;
}

bool judge_status::operator==(const judge_status &other) const {
    return status == other.status && (status != status_code::RUNTIME_ERROR || kind == other.kind);
}

bool judge_status::operator!=(const judge_status &other) const {
    return !(*this == other);
}

ostream &operator<<(ostream &os, const judge_status &status) {
    os << status.display_name();
    if (auto kind = status.runtime_error_type())
        os << " (" << get_display_message(*kind) << ")";
    return os;
}

const char *get_display_message(runtime_error_kind kind) {
    return runtime_error_string.at(kind).first;
}

const char *get_serial_name(status_code code) {
    return status_string.at(code).serial;
}

const char *get_serial_name(runtime_error_kind kind) {
    return runtime_error_string.at(kind).second;
}

status_code parse_status_code(const string &name) {
    for (auto &[code, names] : status_string)
        if (name == names.serial) return code;
    throw invalid_argument("Unrecognized judge status " + name);
}

runtime_error_kind parse_runtime_error_kind(const string &name) {
    for (auto &[kind, names] : runtime_error_string)
        if (name == names.second) return kind;
    throw invalid_argument("Unrecognized runtime error type " + name);
}

}  // namespace judgecell
