#include "common/exceptions.hpp"
#include <fmt/core.h>
#include <boost/exception/diagnostic_information.hpp>

namespace labjudge {
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

internal_error::internal_error()
    : judge_exception() {}

internal_error::internal_error(const string &message)
    : judge_exception(message) {}

unsupported_language::unsupported_language(const string &language)
    : judge_exception("Unsupported language: " + language), language(language) {}

infrastructure_error::infrastructure_error()
    : judge_exception() {}

infrastructure_error::infrastructure_error(const string &message)
    : judge_exception(message) {}

invalid_submission::invalid_submission(const string &message)
    : judge_exception(message) {}

illegal_transition::illegal_transition(status from, status to)
    : judge_exception(fmt::format("Illegal status transition from {} to {}", get_status_name(from), get_status_name(to))), from(from), to(to) {}

}  // namespace labjudge
