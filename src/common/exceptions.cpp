#include "judgecell/common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace judgecell {
using namespace std;

judge_exception::judge_exception()
    : judge_exception("") {}

judge_exception::judge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *judge_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const judge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

environment_error::environment_error()
    : judge_exception() {}

environment_error::environment_error(const string &message)
    : judge_exception(message) {}

provision_error::provision_error(const string &message)
    : environment_error(message) {}

spec_error::spec_error(const string &message)
    : environment_error(message) {}

backend_error::backend_error(const string &message)
    : environment_error(message) {}

}  // namespace judgecell
