#include "gtest/gtest.h"
#include "common/status.hpp"

using namespace std;
using namespace labjudge;

static const status all_status[] = {
    status::PENDING, status::RUNNING, status::ACCEPTED, status::WRONG_ANSWER,
    status::TIME_LIMIT_EXCEEDED, status::MEMORY_LIMIT_EXCEEDED, status::RUNTIME_ERROR,
    status::COMPILATION_ERROR, status::INTERNAL_ERROR};

TEST(StatusTest, NameRoundTripTest) {
    for (status stat : all_status)
        EXPECT_EQ(parse_status(get_status_name(stat)), stat);
    EXPECT_STREQ(get_status_name(status::TIME_LIMIT_EXCEEDED), "time_limit_exceeded");
    EXPECT_STREQ(get_display_message(status::WRONG_ANSWER), "Wrong Answer");
    EXPECT_THROW(parse_status("presentation_error"), invalid_argument);
}

TEST(StatusTest, TerminalTest) {
    EXPECT_FALSE(is_terminal(status::PENDING));
    EXPECT_FALSE(is_terminal(status::RUNNING));
    for (status stat : all_status)
        if (stat != status::PENDING && stat != status::RUNNING)
            EXPECT_TRUE(is_terminal(stat)) << get_status_name(stat);
}

TEST(StatusTest, TransitionTest) {
    EXPECT_TRUE(can_transition(status::PENDING, status::RUNNING));
    EXPECT_TRUE(can_transition(status::PENDING, status::INTERNAL_ERROR));
    EXPECT_TRUE(can_transition(status::RUNNING, status::ACCEPTED));
    EXPECT_TRUE(can_transition(status::RUNNING, status::COMPILATION_ERROR));

    EXPECT_FALSE(can_transition(status::RUNNING, status::PENDING));
    EXPECT_FALSE(can_transition(status::RUNNING, status::RUNNING));
    EXPECT_FALSE(can_transition(status::ACCEPTED, status::WRONG_ANSWER));
    EXPECT_FALSE(can_transition(status::INTERNAL_ERROR, status::RUNNING));
    EXPECT_FALSE(can_transition(status::WRONG_ANSWER, status::PENDING));
}

TEST(StatusTest, PriorityTest) {
    EXPECT_GT(get_status_priority(status::INTERNAL_ERROR), get_status_priority(status::COMPILATION_ERROR));
    EXPECT_GT(get_status_priority(status::COMPILATION_ERROR), get_status_priority(status::TIME_LIMIT_EXCEEDED));
    EXPECT_GT(get_status_priority(status::TIME_LIMIT_EXCEEDED), get_status_priority(status::MEMORY_LIMIT_EXCEEDED));
    EXPECT_GT(get_status_priority(status::MEMORY_LIMIT_EXCEEDED), get_status_priority(status::RUNTIME_ERROR));
    EXPECT_GT(get_status_priority(status::RUNTIME_ERROR), get_status_priority(status::WRONG_ANSWER));
    EXPECT_GT(get_status_priority(status::WRONG_ANSWER), get_status_priority(status::ACCEPTED));
}
