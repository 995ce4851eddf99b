#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "judge/submission.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace labjudge;

class SubmissionTest : public ::testing::Test {
protected:
    static submission make_submission() {
        submission submit;
        submit.id = "sub-1";
        submit.problem_id = "prob-1";
        submit.user_id = "user-1";
        submit.code = "print(1)";
        submit.language = "python";
        return submit;
    }
};

TEST_F(SubmissionTest, LifecycleTest) {
    submission submit = make_submission();
    EXPECT_EQ(submit.stat, status::PENDING);
    submit.begin();
    EXPECT_EQ(submit.stat, status::RUNNING);
    EXPECT_FALSE(submit.is_terminal());

    submission graded = submit.snapshot();
    graded.stat = status::ACCEPTED;
    graded.score = 10;
    EXPECT_TRUE(submit.complete(graded));
    EXPECT_EQ(submit.stat, status::ACCEPTED);
    EXPECT_EQ(submit.score, 10);
    EXPECT_TRUE(submit.evaluated_at.has_value());
    EXPECT_TRUE(submit.is_terminal());
}

TEST_F(SubmissionTest, IllegalTransitionTest) {
    submission submit = make_submission();
    submit.begin();
    EXPECT_THROW(submit.begin(), illegal_transition);
    EXPECT_THROW(submit.transition(status::PENDING), illegal_transition);

    submit.transition(status::WRONG_ANSWER);
    EXPECT_THROW(submit.transition(status::ACCEPTED), illegal_transition);
    EXPECT_THROW(submit.transition(status::RUNNING), illegal_transition);
    EXPECT_EQ(submit.stat, status::WRONG_ANSWER);
}

TEST_F(SubmissionTest, TerminalIsFinalTest) {
    submission submit = make_submission();
    submit.begin();
    EXPECT_TRUE(submit.abort_with(status::INTERNAL_ERROR, "Grading did not finish"));
    auto evaluated_at = submit.evaluated_at;

    submission graded = submit.snapshot();
    graded.stat = status::ACCEPTED;
    graded.score = 100;
    EXPECT_FALSE(submit.complete(graded));
    EXPECT_FALSE(submit.abort_with(status::INTERNAL_ERROR, "again"));

    EXPECT_EQ(submit.stat, status::INTERNAL_ERROR);
    EXPECT_EQ(submit.score, 0);
    EXPECT_EQ(submit.error_message, "Grading did not finish");
    EXPECT_EQ(submit.evaluated_at, evaluated_at);
}

TEST_F(SubmissionTest, CompleteRequiresTerminalTest) {
    submission submit = make_submission();
    submit.begin();
    submission graded = submit.snapshot();
    EXPECT_THROW(submit.complete(graded), internal_error);
    EXPECT_EQ(submit.stat, status::RUNNING);
}

TEST_F(SubmissionTest, ProblemOrderingTest) {
    problem prob;
    for (int i = 0; i < 4; ++i) {
        test_case tc;
        tc.id = to_string(i);
        tc.points = i * 10;
        tc.order_index = i == 0 ? 5 : 1;
        prob.test_cases.push_back(tc);
    }
    EXPECT_EQ(prob.max_score(), 60);

    vector<string> order;
    for (auto *tc : prob.ordered_test_cases()) order.push_back(tc->id);
    EXPECT_EQ(order, (vector<string>{"1", "2", "3", "0"}));
}

TEST_F(SubmissionTest, ParseRequestTest) {
    auto j = R"JSON({
        "problem_id": "p",
        "code": "print(1)",
        "language": "python",
        "is_final": true
    })JSON"_json;
    submission submit = j.get<submission>();
    EXPECT_FALSE(submit.id.empty());
    EXPECT_EQ(submit.stat, status::PENDING);
    EXPECT_TRUE(submit.is_final_submission);
    EXPECT_EQ(submit.attempt_number, 1);
    EXPECT_TRUE(submit.submitted_at.has_value());

    EXPECT_THROW(R"({"problem_id": "p", "language": "python"})"_json.get<submission>(), std::exception);
}

TEST_F(SubmissionTest, ParseProblemTest) {
    auto j = R"({
        "id": "p",
        "time_limit_seconds": 2,
        "memory_limit_mb": 128,
        "test_cases": [
            {"id": "t1", "input_data": "1", "expected_output": "1", "visibility": "public", "is_sample": true},
            {"id": "t2", "points": 30, "time_limit_seconds": 1.5, "memory_limit_mb": 64}
        ]
    })"_json;
    problem prob = j.get<problem>();
    EXPECT_DOUBLE_EQ(prob.time_limit, 2);
    EXPECT_EQ(prob.memory_limit, 128);
    ASSERT_EQ(prob.test_cases.size(), 2);
    EXPECT_EQ(prob.test_cases[0].visibility, visibility::PUBLIC);
    EXPECT_TRUE(prob.test_cases[0].is_sample);
    EXPECT_EQ(prob.test_cases[0].points, 10);
    EXPECT_EQ(prob.test_cases[1].visibility, visibility::HIDDEN);
    EXPECT_EQ(prob.test_cases[1].time_limit, 1.5);
    EXPECT_EQ(prob.test_cases[1].memory_limit, 64);
    EXPECT_EQ(prob.max_score(), 40);
}

TEST_F(SubmissionTest, RejectInvalidProblemTest) {
    EXPECT_THROW(R"({"id": "p", "test_cases": [{"id": "t", "points": -1}]})"_json.get<problem>(), invalid_argument);
    EXPECT_THROW(R"({"id": "p", "test_cases": [{"id": "t", "visibility": "secret"}]})"_json.get<problem>(), invalid_argument);
    EXPECT_THROW(R"({"id": "p", "time_limit_seconds": 0})"_json.get<problem>(), invalid_argument);
    EXPECT_THROW(R"({"id": "p", "test_cases": [{"id": "t", "memory_limit_mb": 0}]})"_json.get<problem>(), invalid_argument);
}

TEST_F(SubmissionTest, CheckRequestTest) {
    problem prob;
    prob.id = "prob-1";

    submission submit = make_submission();
    EXPECT_NO_THROW(check_request(submit, prob));

    submission other = make_submission();
    other.problem_id = "prob-2";
    EXPECT_THROW(check_request(other, prob), invalid_submission);

    // 已经开始评测的提交不能再次评测，否则结果会停留在 running
    submission running = make_submission();
    running.begin();
    EXPECT_THROW(check_request(running, prob), invalid_submission);

    for (const char *id : {"lab3/alice", "..", ""}) {
        submission unsafe = make_submission();
        unsafe.id = id;
        EXPECT_THROW(check_request(unsafe, prob), invalid_submission) << id;
    }
}

TEST_F(SubmissionTest, SerializeTest) {
    submission submit = make_submission();
    submit.begin();
    submission graded = submit.snapshot();
    graded.stat = status::WRONG_ANSWER;
    graded.score = 80;
    graded.max_score = 100;
    execution_result result;
    result.test_case_id = "t2";
    result.stat = status::WRONG_ANSWER;
    result.actual_output = "3";
    result.expected_output = "4";
    graded.results.push_back(result);
    submit.complete(graded);

    nlohmann::json j = submit;
    EXPECT_JSON_EQ(j.at("status"), nlohmann::json("wrong_answer"));
    EXPECT_JSON_EQ(j.at("score"), nlohmann::json(80));
    EXPECT_JSON_EQ(j.at("results").at(0).at("status"), nlohmann::json("wrong_answer"));
    ASSERT_TRUE(j.at("evaluated_at").is_string());

    submission parsed = j.get<submission>();
    EXPECT_EQ(parsed.id, "sub-1");
    EXPECT_EQ(parsed.stat, status::WRONG_ANSWER);
    ASSERT_EQ(parsed.results.size(), 1);
    EXPECT_EQ(parsed.results[0].actual_output, "3");
    EXPECT_TRUE(parsed.evaluated_at.has_value());
}
