#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace labjudge {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::PENDING, "Pending")
    (status::RUNNING, "Running")
    (status::ACCEPTED, "Accepted")
    (status::WRONG_ANSWER, "Wrong Answer")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::COMPILATION_ERROR, "Compilation Error")
    (status::INTERNAL_ERROR, "Internal Error");

static const unordered_map<status, const char *> status_name = boost::assign::map_list_of
    (status::PENDING, "pending")
    (status::RUNNING, "running")
    (status::ACCEPTED, "accepted")
    (status::WRONG_ANSWER, "wrong_answer")
    (status::TIME_LIMIT_EXCEEDED, "time_limit_exceeded")
    (status::MEMORY_LIMIT_EXCEEDED, "memory_limit_exceeded")
    (status::RUNTIME_ERROR, "runtime_error")
    (status::COMPILATION_ERROR, "compilation_error")
    (status::INTERNAL_ERROR, "internal_error");

static const unordered_map<status, int> status_priority = boost::assign::map_list_of
    (status::PENDING, -1)
    (status::RUNNING, -1)
    (status::ACCEPTED, 0)
    (status::WRONG_ANSWER, 1)
    (status::RUNTIME_ERROR, 2)
    (status::MEMORY_LIMIT_EXCEEDED, 3)
    (status::TIME_LIMIT_EXCEEDED, 4)
    (status::COMPILATION_ERROR, 5)
    (status::INTERNAL_ERROR, 6);
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

const char *get_status_name(status stat) {
    return status_name.at(stat);
}

status parse_status(const string &name) {
    for (auto &[stat, text] : status_name)
        if (name == text) return stat;
    throw invalid_argument("Unrecognized status " + name);
}

bool is_terminal(status stat) {
    return stat != status::PENDING && stat != status::RUNNING;
}

bool can_transition(status from, status to) {
    switch (from) {
        case status::PENDING:
            return to != status::PENDING;
        case status::RUNNING:
            return is_terminal(to);
        default:
            return false;
    }
}

int get_status_priority(status stat) {
    return status_priority.at(stat);
}

}  // namespace labjudge
