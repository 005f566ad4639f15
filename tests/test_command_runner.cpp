#include "repoprobe/utils/command_runner.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace repoprobe::utils;

namespace {

TEST(ProcessRunnerTest, CapturesStdout) {
    ProcessRunner runner;
    auto result = runner.Run({"echo", "hello"}, CommandOptions{});

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output, "hello\n");
    EXPECT_FALSE(result.timed_out);
}

TEST(ProcessRunnerTest, ArgumentsAreNotShellInterpreted) {
    ProcessRunner runner;
    auto result = runner.Run({"echo", "$(id); rm -rf /"}, CommandOptions{});

    EXPECT_EQ(result.stdout_output, "$(id); rm -rf /\n");
}

TEST(ProcessRunnerTest, SeparatesOrMergesStderr) {
    ProcessRunner runner;
    const std::vector<std::string> argv = {"sh", "-c", "echo out; echo err 1>&2"};

    auto split = runner.Run(argv, CommandOptions{});
    EXPECT_EQ(split.stdout_output, "out\n");
    EXPECT_EQ(split.stderr_output, "err\n");

    CommandOptions merged;
    merged.merge_output = true;
    auto joined = runner.Run(argv, merged);
    EXPECT_NE(joined.stdout_output.find("out"), std::string::npos);
    EXPECT_NE(joined.stdout_output.find("err"), std::string::npos);
    EXPECT_TRUE(joined.stderr_output.empty());
}

TEST(ProcessRunnerTest, DeadlineKillsChild) {
    ProcessRunner runner;
    CommandOptions options;
    options.timeout = std::chrono::milliseconds(200);

    auto result = runner.Run({"sleep", "5"}, options);

    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, -1);
    EXPECT_LT(result.duration, std::chrono::milliseconds(4000));
}

TEST(ProcessRunnerTest, MissingBinaryIsReported) {
    ProcessRunner runner;
    auto result = runner.Run({"repoprobe-no-such-binary"}, CommandOptions{});

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 127);
    EXPECT_NE(result.stderr_output.find("failed to execute"), std::string::npos);
}

TEST(ProcessRunnerTest, EmptyCommandIsRejected) {
    ProcessRunner runner;
    auto result = runner.Run({}, CommandOptions{});

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.stderr_output, "empty command");
}

// Forking while other threads allocate must not hang the child
TEST(ProcessRunnerTest, ConcurrentRunsFromManyThreads) {
    auto runner = std::make_shared<ProcessRunner>();
    std::atomic<bool> stop{false};
    std::atomic<int> failures{0};

    std::thread churn([&] {
        while (!stop.load()) {
            std::vector<std::string> garbage(64, std::string(512, 'g'));
            (void)garbage;
        }
    });

    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&, t] {
            CommandOptions options;
            options.timeout = std::chrono::milliseconds(10000);
            for (int i = 0; i < 10; ++i) {
                const auto token = "run-" + std::to_string(t) + "-" + std::to_string(i);
                auto result = runner->Run({"echo", token}, options);
                if (!result.success || result.stdout_output != token + "\n") {
                    ++failures;
                }
            }
        });
    }

    for (auto& worker : workers) {
        worker.join();
    }
    stop = true;
    churn.join();

    EXPECT_EQ(failures.load(), 0);
}

} // namespace
