#include <fstream>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "judge/grading_orchestrator.hpp"
#include "test/mock_sandbox.hpp"

using namespace std;
using namespace labjudge;
using namespace labjudge::test;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        run_dir = make_temp_dir("orchestrator");
        config.run_dir = run_dir;
        config.retries = 0;
        config.retry_backoff_ms = 0;
        ON_CALL(backend, name()).WillByDefault(Return("mock"));
    }

    void TearDown() override {
        filesystem::remove_all(run_dir);
    }

    static submission make_submission(const string &language, const string &code = "") {
        submission submit;
        submit.id = "sub-" + language;
        submit.problem_id = "sum";
        submit.user_id = "student";
        submit.language = language;
        submit.code = code;
        return submit;
    }

    static test_case make_case(const string &id, const string &input, const string &output, int points = 10) {
        test_case tc;
        tc.id = id;
        tc.name = "case " + id;
        tc.input_data = input;
        tc.expected_output = output;
        tc.points = points;
        return tc;
    }

    /**
     * @brief 模拟 echo 程序：输出标准输入
     */
    static sandbox_result echo(const sandbox_request &request) {
        if (request.writable_box) {
            ofstream(request.box_dir / "main") << "binary";
            return exited(0);
        }
        return exited(0, request.stdin_data + "\n");
    }

    filesystem::path run_dir;
    sandbox_manager_config config;
    toolchain_registry registry = toolchain_registry::builtin();
    NiceMock<mock_sandbox> backend;
    memory_repository repository;
};

TEST_F(OrchestratorTest, AcceptedTest) {
    sandbox_manager manager(backend, registry, config);
    grading_orchestrator orchestrator(manager, repository);
    EXPECT_CALL(backend, run(_)).Times(2).WillRepeatedly(Invoke(echo));

    problem prob;
    prob.id = "sum";
    prob.test_cases = {make_case("1", "Hello World", "Hello World"), make_case("2", "42", "42\n")};
    submission submit = make_submission("python");
    orchestrator.grade(submit, prob);

    EXPECT_EQ(submit.stat, status::ACCEPTED);
    EXPECT_EQ(submit.score, 20);
    EXPECT_EQ(submit.max_score, 20);
    EXPECT_EQ(submit.test_cases_passed, 2);
    EXPECT_EQ(submit.test_cases_total, 2);
    EXPECT_EQ(submit.error_message, "");
    EXPECT_TRUE(submit.evaluated_at.has_value());
    ASSERT_EQ(submit.results.size(), 2);
    EXPECT_EQ(submit.results[0].actual_output, "Hello World\n");
    EXPECT_EQ(submit.results[0].points_earned, 10);

    EXPECT_EQ(repository.history(submit.id), (vector<status>{status::RUNNING, status::ACCEPTED}));
    auto saved = repository.load(submit.id);
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->score, 20);
}

TEST_F(OrchestratorTest, CompilationErrorTest) {
    sandbox_manager manager(backend, registry, config);
    grading_orchestrator orchestrator(manager, repository);
    EXPECT_CALL(backend, run(_)).Times(1).WillOnce(Return(exited(1, "", "main.cpp:1:12: error: expected '}' at end of input")));

    problem prob;
    prob.id = "sum";
    prob.test_cases = {make_case("1", "1", "1"), make_case("2", "2", "2")};
    submission submit = make_submission("cpp", "int main() {");
    orchestrator.grade(submit, prob);

    EXPECT_EQ(submit.stat, status::COMPILATION_ERROR);
    EXPECT_EQ(submit.score, 0);
    EXPECT_EQ(submit.test_cases_total, 0);
    EXPECT_TRUE(submit.results.empty());
    EXPECT_EQ(submit.error_message, "Compilation error");
    EXPECT_THAT(submit.compile_output, HasSubstr("expected '}'"));
    EXPECT_EQ(repository.history(submit.id), (vector<status>{status::RUNNING, status::COMPILATION_ERROR}));
}

TEST_F(OrchestratorTest, PartialScoreTest) {
    sandbox_manager manager(backend, registry, config);
    grading_orchestrator orchestrator(manager, repository);
    EXPECT_CALL(backend, run(_))
        .WillOnce(Invoke(echo))
        .WillOnce(Return(exited(0, "3\n")))
        .WillOnce(Invoke(echo));

    problem prob;
    prob.id = "sum";
    prob.test_cases = {make_case("1", "1", "1", 10), make_case("2", "2", "4", 20), make_case("3", "3", "3", 70)};
    submission submit = make_submission("python");
    orchestrator.grade(submit, prob);

    EXPECT_EQ(submit.stat, status::WRONG_ANSWER);
    EXPECT_EQ(submit.score, 80);
    EXPECT_EQ(submit.max_score, 100);
    EXPECT_EQ(submit.test_cases_passed, 2);
    EXPECT_EQ(submit.test_cases_total, 3);
    EXPECT_EQ(submit.error_message, "Wrong answer on test case 2");
    ASSERT_EQ(submit.results.size(), 3);
    EXPECT_FALSE(submit.results[1].passed);
    EXPECT_EQ(submit.results[1].stat, status::WRONG_ANSWER);
    EXPECT_EQ(submit.results[1].actual_output, "3\n");
    EXPECT_EQ(submit.results[1].expected_output, "4");
    EXPECT_EQ(submit.results[1].points_earned, 0);
}

TEST_F(OrchestratorTest, RuntimeErrorOutputTest) {
    sandbox_manager manager(backend, registry, config);
    grading_orchestrator orchestrator(manager, repository);
    EXPECT_CALL(backend, run(_))
        .WillOnce(Return(exited(1, "", "Traceback: ZeroDivisionError")))
        .WillOnce(Return(exited(1, "", "Traceback: IndexError")));

    problem prob;
    prob.id = "sum";
    prob.test_cases = {make_case("1", "0", "0"), make_case("2", "1", "1")};
    submission submit = make_submission("python", "print(1/0)");
    orchestrator.grade(submit, prob);

    EXPECT_EQ(submit.stat, status::RUNTIME_ERROR);
    EXPECT_EQ(submit.runtime_output, "Traceback: ZeroDivisionError");
    EXPECT_EQ(submit.error_message, "Runtime error on test case 1");
}

TEST_F(OrchestratorTest, NoTestCasesTest) {
    sandbox_manager manager(backend, registry, config);
    grading_orchestrator orchestrator(manager, repository);
    EXPECT_CALL(backend, run(_)).Times(0);

    problem prob;
    prob.id = "empty";
    submission submit = make_submission("python");
    orchestrator.grade(submit, prob);

    EXPECT_EQ(submit.stat, status::INTERNAL_ERROR);
    EXPECT_EQ(submit.error_message, "Problem empty has no test cases");
    EXPECT_TRUE(submit.evaluated_at.has_value());
}

TEST_F(OrchestratorTest, UnsupportedLanguageTest) {
    sandbox_manager manager(backend, registry, config);
    grading_orchestrator orchestrator(manager, repository);
    EXPECT_CALL(backend, run(_)).Times(0);

    problem prob;
    prob.id = "sum";
    prob.test_cases = {make_case("1", "1", "1")};
    submission submit = make_submission("cobol");
    orchestrator.grade(submit, prob);

    EXPECT_EQ(submit.stat, status::INTERNAL_ERROR);
    EXPECT_EQ(submit.error_message, "Unsupported language: cobol");
    EXPECT_EQ(repository.history(submit.id), (vector<status>{status::RUNNING, status::INTERNAL_ERROR}));
}

TEST_F(OrchestratorTest, InfrastructureFailureTest) {
    sandbox_manager manager(backend, registry, config);
    grading_orchestrator orchestrator(manager, repository);
    EXPECT_CALL(backend, run(_))
        .WillOnce(Invoke(echo))
        .WillOnce(Throw(infrastructure_error("runguard crashed")));

    problem prob;
    prob.id = "sum";
    prob.test_cases = {make_case("1", "1", "1"), make_case("2", "2", "2"), make_case("3", "3", "3")};
    submission submit = make_submission("python");
    orchestrator.grade(submit, prob);

    EXPECT_EQ(submit.stat, status::INTERNAL_ERROR);
    EXPECT_THAT(submit.error_message, HasSubstr("Internal error"));
    EXPECT_THAT(submit.error_message, HasSubstr("runguard crashed"));
    EXPECT_EQ(submit.score, 10);
    EXPECT_EQ(submit.results.size(), 1);
    EXPECT_EQ(submit.test_cases_total, 1);
}

TEST_F(OrchestratorTest, ExecutionOrderTest) {
    sandbox_manager manager(backend, registry, config);
    grading_orchestrator orchestrator(manager, repository);
    vector<string> order;
    EXPECT_CALL(backend, run(_)).Times(3).WillRepeatedly(Invoke([&](const sandbox_request &request) {
        order.push_back(request.stdin_data);
        return echo(request);
    }));

    problem prob;
    prob.id = "sum";
    prob.test_cases = {make_case("a", "a", "a"), make_case("b", "b", "b"), make_case("c", "c", "c")};
    prob.test_cases[0].order_index = 2;
    prob.test_cases[1].order_index = 1;
    prob.test_cases[2].order_index = 1;
    submission submit = make_submission("python");
    orchestrator.grade(submit, prob);

    EXPECT_EQ(order, (vector<string>{"b", "c", "a"}));
    ASSERT_EQ(submit.results.size(), 3);
    EXPECT_EQ(submit.results[0].test_case_id, "b");
    EXPECT_EQ(submit.results[2].test_case_id, "a");
}

TEST_F(OrchestratorTest, TestCaseLimitsTest) {
    sandbox_manager manager(backend, registry, config);
    grading_orchestrator orchestrator(manager, repository);
    vector<pair<double, int>> limits;
    EXPECT_CALL(backend, run(_)).Times(3).WillRepeatedly(Invoke([&](const sandbox_request &request) {
        limits.emplace_back(request.limits.time_limit, request.limits.memory_limit);
        return echo(request);
    }));

    problem prob;
    prob.id = "sum";
    prob.time_limit = 2;
    prob.memory_limit = 128;
    prob.test_cases = {make_case("1", "1", "1"), make_case("2", "2", "2"), make_case("3", "3", "3")};
    prob.test_cases[1].time_limit = 0.5;
    prob.test_cases[1].memory_limit = 64;
    prob.test_cases[2].time_limit = 10;
    prob.test_cases[2].memory_limit = 1024;
    submission submit = make_submission("python");
    orchestrator.grade(submit, prob);

    EXPECT_EQ(limits, (vector<pair<double, int>>{{2, 128}, {0.5, 64}, {2, 128}}));
}

TEST_F(OrchestratorTest, DeadlineReachedTest) {
    sandbox_manager manager(backend, registry, config);
    grading_orchestrator orchestrator(manager, repository);
    auto cancelled = timed_out(3);
    cancelled.cancelled = true;
    EXPECT_CALL(backend, run(_))
        .WillOnce(Invoke(echo))
        .WillOnce(Return(cancelled));

    problem prob;
    prob.id = "sum";
    prob.test_cases = {make_case("1", "1", "1"), make_case("2", "2", "2"), make_case("3", "3", "3")};
    submission submit = make_submission("python");
    orchestrator.grade(submit, prob);

    EXPECT_EQ(submit.stat, status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(submit.results.size(), 2);
    EXPECT_EQ(submit.results[1].error_message, "Grading deadline reached");
    EXPECT_EQ(submit.score, 10);
}

TEST_F(OrchestratorTest, AlreadyFinishedTest) {
    sandbox_manager manager(backend, registry, config);
    grading_orchestrator orchestrator(manager, repository);
    EXPECT_CALL(backend, run(_)).Times(0);

    problem prob;
    prob.id = "sum";
    prob.test_cases = {make_case("1", "1", "1")};
    submission submit = make_submission("python");
    submit.transition(status::ACCEPTED);
    orchestrator.grade(submit, prob);

    EXPECT_EQ(submit.stat, status::ACCEPTED);
    EXPECT_FALSE(repository.load(submit.id).has_value());
}

TEST_F(OrchestratorTest, CeilingTest) {
    config.grace = 1;
    config.compile_time_limit = 10;
    sandbox_manager manager(backend, registry, config);
    grading_orchestrator orchestrator(manager, repository, {3, 6});

    problem prob;
    prob.id = "sum";
    prob.time_limit = 2;
    prob.test_cases = {make_case("1", "1", "1"), make_case("2", "2", "2")};

    // 3 × ((2 + 1) + (2 + 1)) + 10 + 10
    EXPECT_DOUBLE_EQ(orchestrator.grading_ceiling(prob, "python").count(), 38);
    // 6 × ((2 + 1) + (2 + 1)) + 10 + 30
    EXPECT_DOUBLE_EQ(orchestrator.watchdog_ceiling(prob, "python").count(), 76);
    // Java 的时间限制为 1.5 倍
    EXPECT_DOUBLE_EQ(orchestrator.grading_ceiling(prob, "java").count(), 3 * 8 + 20);
    EXPECT_GT(orchestrator.watchdog_ceiling(prob, "cobol").count(), orchestrator.grading_ceiling(prob, "cobol").count());
}

TEST_F(OrchestratorTest, RunSamplesTest) {
    sandbox_manager manager(backend, registry, config);
    grading_orchestrator orchestrator(manager, repository);
    EXPECT_CALL(backend, run(_))
        .WillOnce(Invoke(echo))
        .WillOnce(Return(exited(0, "wrong")));

    problem prob;
    prob.id = "sum";
    prob.test_cases = {make_case("1", "1", "1"), make_case("2", "2", "2"), make_case("3", "3", "3")};
    prob.test_cases[0].is_sample = true;
    prob.test_cases[2].visibility = visibility::PUBLIC;

    auto results = orchestrator.run_samples("print(input())", "python", prob);
    ASSERT_EQ(results.size(), 2);
    EXPECT_EQ(results[0].test_case_id, "1");
    EXPECT_TRUE(results[0].passed);
    EXPECT_EQ(results[1].test_case_id, "3");
    EXPECT_EQ(results[1].stat, status::WRONG_ANSWER);
    EXPECT_EQ(results[1].output, "wrong");
    EXPECT_FALSE(repository.load("sub-python").has_value());
}

TEST_F(OrchestratorTest, RunSamplesWithoutSamplesTest) {
    sandbox_manager manager(backend, registry, config);
    grading_orchestrator orchestrator(manager, repository);
    EXPECT_CALL(backend, run(_)).Times(0);

    problem prob;
    prob.id = "sum";
    prob.test_cases = {make_case("1", "1", "1")};
    EXPECT_THROW(orchestrator.run_samples("", "python", prob), internal_error);
}

TEST_F(OrchestratorTest, RunSamplesCompilationErrorTest) {
    sandbox_manager manager(backend, registry, config);
    grading_orchestrator orchestrator(manager, repository);
    EXPECT_CALL(backend, run(_)).Times(1).WillOnce(Return(exited(1, "", "error: 'x' was not declared")));

    problem prob;
    prob.id = "sum";
    prob.test_cases = {make_case("1", "1", "1")};
    prob.test_cases[0].is_sample = true;
    auto results = orchestrator.run_samples("int main() { x; }", "cpp", prob);
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].stat, status::COMPILATION_ERROR);
    EXPECT_THAT(results[0].error, HasSubstr("was not declared"));
}

TEST_F(OrchestratorTest, ExecuteTest) {
    sandbox_manager manager(backend, registry, config);
    grading_orchestrator orchestrator(manager, repository);
    EXPECT_CALL(backend, run(_)).WillOnce(Invoke([](const sandbox_request &request) {
        EXPECT_DOUBLE_EQ(request.limits.time_limit, 3);
        EXPECT_EQ(request.limits.memory_limit, 32);
        EXPECT_TRUE(request.deadline.has_value());
        return exited(0, "Hello " + request.stdin_data + "\n");
    }));

    auto outcome = orchestrator.execute("print('Hello ' + input())", "python", "World", 3, 32);
    EXPECT_EQ(outcome.stat, status::ACCEPTED);
    EXPECT_EQ(outcome.stdout_data, "Hello World\n");

    EXPECT_THROW(orchestrator.execute("", "python", "", 0, 32), invalid_argument);
    EXPECT_THROW(orchestrator.execute("", "python", "", 1, 0), invalid_argument);
    EXPECT_THROW(orchestrator.execute("", "cobol", "", 1, 32), unsupported_language);
}
