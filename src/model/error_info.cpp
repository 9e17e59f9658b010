#include "judgecell/model/error_info.hpp"
#include <tuple>
#include "judgecell/common/io_utils.hpp"

namespace judgecell {
using namespace std;

error_info error_info::from_message(const string &message) {
    error_info info;
    info.message = message;
    return info;
}

error_info error_info::from_stderr(const string &error_output) {
    error_info info;
    info.message = error_output;
    info.error_output = error_output;
    return info;
}

error_info error_info::compilation_error(const string &message, const optional<string> &error_output) {
    error_info info;
    info.message = message;
    info.error_output = error_output;
    return info;
}

error_info error_info::runtime_error(const string &message, int signal, const optional<string> &error_output) {
    error_info info;
    info.message = message;
    info.signal = signal;
    info.error_output = error_output;
    return info;
}

error_info &error_info::cap_streams(size_t limit) {
    if (error_output) error_output = truncate_utf8(*error_output, limit);
    if (standard_output) standard_output = truncate_utf8(*standard_output, limit);
    return *this;
}

bool error_info::operator==(const error_info &other) const {
    return tie(message, code, line, column, error_output, standard_output, exit_code, signal) ==
           tie(other.message, other.code, other.line, other.column, other.error_output, other.standard_output, other.exit_code, other.signal);
}

bool error_info::operator!=(const error_info &other) const {
    return !(*this == other);
}

}  // namespace judgecell
