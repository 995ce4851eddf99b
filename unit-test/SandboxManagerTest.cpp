#include <atomic>
#include <fstream>
#include <thread>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "sandbox/sandbox_manager.hpp"
#include "test/mock_sandbox.hpp"

using namespace std;
using namespace labjudge;
using namespace labjudge::test;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;
using ::testing::Truly;

class SandboxManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        run_dir = make_temp_dir("sandbox-manager");
        config.run_dir = run_dir;
        config.retry_backoff_ms = 0;
        ON_CALL(backend, name()).WillByDefault(Return("mock"));
    }

    void TearDown() override {
        filesystem::remove_all(run_dir);
    }

    /**
     * @brief 模拟编译器：在 box 目录中生成编译产物
     */
    static sandbox_result fake_compile(const sandbox_request &request) {
        ofstream(request.box_dir / "main") << "binary";
        return exited(0);
    }

    static size_t count_boxes(const filesystem::path &dir) {
        size_t count = 0;
        for (auto &entry : filesystem::directory_iterator(dir))
            if (entry.is_directory()) ++count;
        return count;
    }

    filesystem::path run_dir;
    sandbox_manager_config config;
    toolchain_registry registry = toolchain_registry::builtin();
    NiceMock<mock_sandbox> backend;
};

TEST_F(SandboxManagerTest, ClassifyTest) {
    sandbox_limits limits;
    limits.time_limit = 1;
    limits.memory_limit = 64;

    EXPECT_EQ(classify(exited(0), limits), status::ACCEPTED);
    EXPECT_EQ(classify(exited(3), limits), status::RUNTIME_ERROR);
    EXPECT_EQ(classify(timed_out(2.1), limits), status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(classify(oom_killed(), limits), status::MEMORY_LIMIT_EXCEEDED);

    auto slow = exited(0);
    slow.cpu_time = 1.5;
    EXPECT_EQ(classify(slow, limits), status::TIME_LIMIT_EXCEEDED);

    auto greedy = exited(0);
    greedy.memory_bytes = 65 * 1024 * 1024;
    EXPECT_EQ(classify(greedy, limits), status::MEMORY_LIMIT_EXCEEDED);

    auto segfault = exited(139);
    segfault.signal = 11;
    EXPECT_EQ(classify(segfault, limits), status::RUNTIME_ERROR);

    // 时间超限优先于内存超限
    auto both = oom_killed();
    both.time_limit_hit = true;
    EXPECT_EQ(classify(both, limits), status::TIME_LIMIT_EXCEEDED);

    auto cancelled = exited(0);
    cancelled.cancelled = true;
    EXPECT_EQ(classify(cancelled, limits), status::TIME_LIMIT_EXCEEDED);
}

TEST_F(SandboxManagerTest, EffectiveLimitsTest) {
    sandbox_limits requested;
    requested.time_limit = 2;
    requested.memory_limit = 100;

    auto java = effective_limits(registry.lookup("java"), requested);
    EXPECT_DOUBLE_EQ(java.time_limit, 3);
    EXPECT_EQ(java.memory_limit, 150);

    auto cpp = effective_limits(registry.lookup("cpp"), requested);
    EXPECT_DOUBLE_EQ(cpp.time_limit, 2.4);
    EXPECT_EQ(cpp.memory_limit, 100);

    requested.memory_limit = 3;
    EXPECT_EQ(effective_limits(registry.lookup("java"), requested).memory_limit, 5);
}

TEST_F(SandboxManagerTest, InterpretedProgramTest) {
    sandbox_manager manager(backend, registry, config);
    EXPECT_CALL(backend, run(_)).WillOnce(Invoke([](const sandbox_request &request) {
        EXPECT_FALSE(request.writable_box);
        EXPECT_EQ(request.command, (vector<string>{"python3", "main.py"}));
        EXPECT_EQ(request.image, "python:3.11-slim");
        EXPECT_EQ(request.stdin_data, "World");
        ifstream fin(request.box_dir / "main.py");
        string code((istreambuf_iterator<char>(fin)), istreambuf_iterator<char>());
        EXPECT_EQ(code, "print('Hello ' + input())");
        return exited(0, "Hello World\n");
    }));

    auto outcome = manager.run("print('Hello ' + input())", "python", "World", manager.make_limits(1, 64));
    EXPECT_EQ(outcome.stat, status::ACCEPTED);
    EXPECT_EQ(outcome.stdout_data, "Hello World\n");
    EXPECT_NEAR(outcome.execution_time_ms, 50, 1e-6);
    EXPECT_NEAR(outcome.memory_used_mb, 4, 1e-6);

    // box 目录在运行结束后删除
    EXPECT_EQ(count_boxes(run_dir), 0);
}

TEST_F(SandboxManagerTest, CompileOnceTest) {
    sandbox_manager manager(backend, registry, config);
    EXPECT_CALL(backend, run(Truly(is_compile))).Times(1).WillOnce(Invoke(fake_compile));
    EXPECT_CALL(backend, run(Truly([](const sandbox_request &r) { return !r.writable_box; })))
        .Times(3)
        .WillRepeatedly(Invoke([](const sandbox_request &request) {
            EXPECT_EQ(request.command, vector<string>{"./main"});
            EXPECT_DOUBLE_EQ(request.limits.time_limit, 1.2);
            return exited(0, request.stdin_data);
        }));

    auto program = manager.prepare("int main() {}", "cpp");
    ASSERT_TRUE(program->compiled());
    for (string input : {"1", "2", "3"}) {
        auto outcome = manager.execute(*program, input, manager.make_limits(1, 64));
        EXPECT_EQ(outcome.stat, status::ACCEPTED);
        EXPECT_EQ(outcome.stdout_data, input);
    }
}

TEST_F(SandboxManagerTest, CompileLimitsTest) {
    config.compile_time_limit = 7;
    config.compile_memory_limit = 300;
    sandbox_manager manager(backend, registry, config);
    EXPECT_CALL(backend, run(_)).WillOnce(Invoke([](const sandbox_request &request) {
        EXPECT_TRUE(request.writable_box);
        EXPECT_DOUBLE_EQ(request.limits.time_limit, 7);
        EXPECT_EQ(request.limits.memory_limit, 300);
        return fake_compile(request);
    }));
    manager.prepare("int main() {}", "c");
}

TEST_F(SandboxManagerTest, CompilationErrorTest) {
    sandbox_manager manager(backend, registry, config);
    EXPECT_CALL(backend, run(_)).WillOnce(Return(exited(1, "", "main.cpp:1:1: error: expected ';'")));

    auto program = manager.prepare("int main() {", "cpp");
    EXPECT_FALSE(program->compiled());
    EXPECT_EQ(program->compile_status, status::COMPILATION_ERROR);
    EXPECT_THAT(program->compile_output, ::testing::HasSubstr("expected ';'"));

    auto outcome = manager.execute(*program, "", manager.make_limits(1, 64));
    EXPECT_EQ(outcome.stat, status::COMPILATION_ERROR);
    EXPECT_THAT(outcome.compile_output, ::testing::HasSubstr("expected ';'"));
}

TEST_F(SandboxManagerTest, CompilationTimeoutTest) {
    sandbox_manager manager(backend, registry, config);
    EXPECT_CALL(backend, run(_)).WillOnce(Return(timed_out(11)));

    auto program = manager.prepare("#include </dev/random>", "cpp");
    EXPECT_EQ(program->compile_status, status::COMPILATION_ERROR);
    EXPECT_THAT(program->compile_output, ::testing::HasSubstr("Compilation time limit exceeded"));
}

TEST_F(SandboxManagerTest, MissingCompilerOutputTest) {
    sandbox_manager manager(backend, registry, config);
    EXPECT_CALL(backend, run(_)).WillOnce(Return(exited(0)));

    auto program = manager.prepare("int main() {}", "cpp");
    EXPECT_EQ(program->compile_status, status::COMPILATION_ERROR);
}

TEST_F(SandboxManagerTest, UnsupportedLanguageTest) {
    sandbox_manager manager(backend, registry, config);
    EXPECT_CALL(backend, run(_)).Times(0);

    EXPECT_THROW(manager.prepare("IDENTIFICATION DIVISION.", "cobol"), unsupported_language);
    EXPECT_EQ(count_boxes(run_dir), 0);
}

TEST_F(SandboxManagerTest, RuntimeErrorTest) {
    sandbox_manager manager(backend, registry, config);
    auto segfault = exited(139, "", "Segmentation fault");
    segfault.signal = 11;
    EXPECT_CALL(backend, run(_))
        .WillOnce(Return(segfault))
        .WillOnce(Return(exited(3)))
        .WillOnce(Return(oom_killed()))
        .WillOnce(Return(timed_out(2.5)));

    auto limits = manager.make_limits(1, 64);
    auto signaled = manager.run("", "python", "", limits);
    EXPECT_EQ(signaled.stat, status::RUNTIME_ERROR);
    EXPECT_THAT(signaled.error_message, ::testing::HasSubstr("signal 11"));
    EXPECT_EQ(signaled.stderr_data, "Segmentation fault");

    auto nonzero = manager.run("", "python", "", limits);
    EXPECT_EQ(nonzero.stat, status::RUNTIME_ERROR);
    EXPECT_EQ(nonzero.error_message, "Program exited with code 3");

    auto memory = manager.run("", "python", "", limits);
    EXPECT_EQ(memory.stat, status::MEMORY_LIMIT_EXCEEDED);
    EXPECT_EQ(memory.error_message, "Memory limit exceeded (64 MB)");

    auto time = manager.run("", "python", "", limits);
    EXPECT_EQ(time.stat, status::TIME_LIMIT_EXCEEDED);
    EXPECT_FALSE(time.cancelled);
}

TEST_F(SandboxManagerTest, CancelledDiscardsOutputTest) {
    sandbox_manager manager(backend, registry, config);
    auto cancelled = timed_out(0.5);
    cancelled.cancelled = true;
    cancelled.stdout_data = "partial";
    EXPECT_CALL(backend, run(_)).WillOnce(Return(cancelled));

    auto outcome = manager.run("", "python", "", manager.make_limits(1, 64), chrono::steady_clock::now());
    EXPECT_EQ(outcome.stat, status::TIME_LIMIT_EXCEEDED);
    EXPECT_TRUE(outcome.cancelled);
    EXPECT_EQ(outcome.stdout_data, "");
    EXPECT_EQ(outcome.error_message, "Grading deadline reached");
}

TEST_F(SandboxManagerTest, DeadlineIsForwardedTest) {
    sandbox_manager manager(backend, registry, config);
    auto deadline = chrono::steady_clock::now() + chrono::seconds(30);
    EXPECT_CALL(backend, run(_)).WillOnce(Invoke([deadline](const sandbox_request &request) {
        EXPECT_TRUE(request.deadline == deadline);
        return exited(0);
    }));
    manager.run("", "python", "", manager.make_limits(1, 64), deadline);
}

TEST_F(SandboxManagerTest, RetryInfrastructureErrorTest) {
    config.retries = 2;
    sandbox_manager manager(backend, registry, config);
    EXPECT_CALL(backend, run(_))
        .WillOnce(Throw(infrastructure_error("cgroup busy")))
        .WillOnce(Throw(infrastructure_error("cgroup busy")))
        .WillOnce(Return(exited(0, "ok")));

    auto outcome = manager.run("", "python", "", manager.make_limits(1, 64));
    EXPECT_EQ(outcome.stat, status::ACCEPTED);
    EXPECT_EQ(outcome.stdout_data, "ok");
}

TEST_F(SandboxManagerTest, RetryExhaustedTest) {
    config.retries = 1;
    sandbox_manager manager(backend, registry, config);
    EXPECT_CALL(backend, run(_)).Times(2).WillRepeatedly(Throw(infrastructure_error("runtime unreachable")));

    EXPECT_THROW(manager.run("", "python", "", manager.make_limits(1, 64)), infrastructure_error);
    EXPECT_EQ(count_boxes(run_dir), 0);
}

TEST_F(SandboxManagerTest, ConcurrencyLimitTest) {
    config.max_sandboxes = 2;
    sandbox_manager manager(backend, registry, config);

    atomic<int> running{0}, peak{0};
    EXPECT_CALL(backend, run(_)).Times(8).WillRepeatedly(Invoke([&](const sandbox_request &) {
        int now = ++running;
        int expected = peak.load();
        while (now > expected && !peak.compare_exchange_weak(expected, now)) {}
        this_thread::sleep_for(chrono::milliseconds(50));
        --running;
        return exited(0);
    }));

    vector<thread> threads;
    for (int i = 0; i < 8; ++i)
        threads.emplace_back([&] {
            EXPECT_EQ(manager.run("", "python", "", manager.make_limits(1, 64)).stat, status::ACCEPTED);
        });
    for (auto &th : threads) th.join();

    EXPECT_LE(peak.load(), 2);
    EXPECT_GE(peak.load(), 1);
}
