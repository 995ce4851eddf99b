#include <fstream>
#include <thread>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "test/mock_sandbox.hpp"
#include "worker.hpp"

using namespace std;
using namespace labjudge;
using namespace labjudge::test;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

class WorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        run_dir = make_temp_dir("worker");
        config.run_dir = run_dir;
        config.retries = 0;
        config.retry_backoff_ms = 0;
        config.max_sandboxes = 3;
        ON_CALL(backend, name()).WillByDefault(Return("mock"));
    }

    void TearDown() override {
        filesystem::remove_all(run_dir);
    }

    /**
     * @brief 模拟 print 程序：输出源代码的内容
     */
    static sandbox_result print_source(const sandbox_request &request) {
        ifstream fin(request.box_dir / "main.py");
        string code((istreambuf_iterator<char>(fin)), istreambuf_iterator<char>());
        this_thread::sleep_for(chrono::milliseconds(20));
        return exited(0, code + "\n");
    }

    static shared_ptr<submission> make_submission(const string &id, const string &code) {
        auto submit = make_shared<submission>();
        submit->id = id;
        submit->problem_id = "echo";
        submit->language = "python";
        submit->code = code;
        return submit;
    }

    filesystem::path run_dir;
    sandbox_manager_config config;
    toolchain_registry registry = toolchain_registry::builtin();
    NiceMock<mock_sandbox> backend;
    memory_repository repository;
};

TEST_F(WorkerTest, ConcurrentSubmissionsTest) {
    sandbox_manager manager(backend, registry, config);
    grading_orchestrator orchestrator(manager, repository);
    EXPECT_CALL(backend, run(_)).WillRepeatedly(Invoke(print_source));

    vector<shared_ptr<submission>> submissions;
    vector<shared_ptr<const problem>> problems;
    vector<future<void>> futures;
    {
        grading_service service(orchestrator, repository, 4);
        for (int i = 0; i < 10; ++i) {
            string output = "submission " + to_string(i);
            auto prob = make_shared<problem>();
            prob->id = "echo";
            for (int j = 0; j < 3; ++j) {
                test_case tc;
                tc.id = to_string(j);
                tc.expected_output = output;
                prob->test_cases.push_back(tc);
            }
            auto submit = make_submission("sub-" + to_string(i), output);
            submissions.push_back(submit);
            problems.push_back(prob);
            futures.push_back(service.enqueue(submit, prob));
        }
        for (auto &f : futures)
            ASSERT_EQ(f.wait_for(chrono::seconds(30)), future_status::ready);
        service.stop();
    }

    for (int i = 0; i < 10; ++i) {
        auto &submit = *submissions[i];
        EXPECT_EQ(submit.stat, status::ACCEPTED) << submit.id << ": " << submit.error_message;
        EXPECT_EQ(submit.score, 30);
        ASSERT_EQ(submit.results.size(), 3);
        for (auto &result : submit.results)
            EXPECT_EQ(result.actual_output, "submission " + to_string(i) + "\n");
        EXPECT_EQ(repository.history(submit.id), (vector<status>{status::RUNNING, status::ACCEPTED}));
    }
    EXPECT_TRUE(filesystem::is_empty(run_dir));
}

TEST_F(WorkerTest, WatchdogTest) {
    config.grace = 0;
    config.compile_time_limit = 0.05;
    sandbox_manager manager(backend, registry, config);
    grading_config grading;
    grading.deadline_factor = 1;
    grading.watchdog_factor = 1;
    grading.deadline_slack = 0;
    grading.watchdog_slack = 0.05;
    grading_orchestrator orchestrator(manager, repository, grading);

    // 沙箱卡住，没有遵守截止时间
    EXPECT_CALL(backend, run(_)).WillOnce(Invoke([](const sandbox_request &) {
        this_thread::sleep_for(chrono::milliseconds(800));
        return exited(0, "1\n");
    }));

    auto prob = make_shared<problem>();
    prob->id = "echo";
    prob->time_limit = 0.05;
    test_case tc;
    tc.id = "1";
    tc.expected_output = "1";
    prob->test_cases.push_back(tc);
    auto submit = make_submission("stuck", "print(1)");

    grading_service service(orchestrator, repository, 1, chrono::milliseconds(10));
    auto done = service.enqueue(submit, prob);
    ASSERT_EQ(done.wait_for(chrono::milliseconds(600)), future_status::ready);
    EXPECT_EQ(submit->snapshot().stat, status::INTERNAL_ERROR);
    EXPECT_THAT(submit->snapshot().error_message, HasSubstr("did not finish"));

    service.stop();

    // worker 之后的评测结果被丢弃
    EXPECT_EQ(submit->stat, status::INTERNAL_ERROR);
    EXPECT_EQ(submit->score, 0);
    EXPECT_EQ(repository.history("stuck"), (vector<status>{status::RUNNING, status::INTERNAL_ERROR}));
}

TEST_F(WorkerTest, StopDrainsQueueTest) {
    sandbox_manager manager(backend, registry, config);
    grading_orchestrator orchestrator(manager, repository);
    EXPECT_CALL(backend, run(_)).WillRepeatedly(Invoke(print_source));

    auto prob = make_shared<problem>();
    prob->id = "echo";
    test_case tc;
    tc.id = "1";
    tc.expected_output = "x";
    prob->test_cases.push_back(tc);

    grading_service service(orchestrator, repository, 2);
    vector<shared_ptr<submission>> submissions;
    for (int i = 0; i < 5; ++i) {
        submissions.push_back(make_submission("drain-" + to_string(i), "x"));
        service.enqueue(submissions.back(), prob);
    }
    service.stop();

    EXPECT_EQ(service.queued(), 0);
    for (auto &submit : submissions)
        EXPECT_EQ(submit->stat, status::ACCEPTED);
    EXPECT_THROW(service.enqueue(make_submission("late", "x"), prob), internal_error);
}
