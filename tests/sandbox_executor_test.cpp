#include <gtest/gtest.h>

#include <future>

#include "sandbox/errors.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "test_support.hpp"

namespace runbox::sandbox {
namespace {

class SandboxExecutorTest : public testing::ScratchDirTest {
protected:
    void RequireCommand(const std::string& name) {
        if (!testing::HasCommand(name)) {
            GTEST_SKIP() << name << " not available";
        }
    }
};

TEST_F(SandboxExecutorTest, RunsPythonSnippet) {
    if (!testing::HasCommand("python3")) {
        GTEST_SKIP() << "python3 not available";
    }
    const SandboxExecutor executor(RelaxedConfig());
    const auto outcome = executor.Execute({"Python", "print('Hello, World!')", 5});

    EXPECT_EQ(outcome.language, "python");
    EXPECT_EQ(outcome.timeout_seconds, 5);
    EXPECT_EQ(outcome.result.exit_code, 0);
    EXPECT_FALSE(outcome.result.timed_out);
    EXPECT_EQ(outcome.result.combined_output, "Hello, World!\n");
    EXPECT_EQ(testing::CountEntries(root_), 0U);
}

TEST_F(SandboxExecutorTest, CombinesStdoutAndStderr) {
    if (!testing::HasCommand("python3")) {
        GTEST_SKIP() << "python3 not available";
    }
    const SandboxExecutor executor(RelaxedConfig());
    const auto outcome = executor.Execute(
        {"python", "import sys\nprint('out')\nsys.stdout.flush()\nsys.stderr.write('err\\n')\nsys.exit(2)", 5});

    EXPECT_EQ(outcome.result.exit_code, 2);
    EXPECT_EQ(outcome.result.combined_output, "out\n\n\nerr\n");
}

TEST_F(SandboxExecutorTest, TimeoutIsReportedAndCleanedUp) {
    if (!testing::HasCommand("python3")) {
        GTEST_SKIP() << "python3 not available";
    }
    const SandboxExecutor executor(RelaxedConfig());
    const auto outcome = executor.Execute(
        {"python", "import time\nprint('tick', flush=True)\nwhile True:\n    time.sleep(0.1)\n", 2});

    EXPECT_TRUE(outcome.result.timed_out);
    EXPECT_EQ(outcome.result.exit_code, -1);
    EXPECT_NE(outcome.result.combined_output.find("tick"), std::string::npos);
    EXPECT_NE(outcome.result.combined_output.find("Execution timed out after 2 seconds."), std::string::npos);
    EXPECT_LT(outcome.elapsed, std::chrono::seconds(6));
    EXPECT_EQ(testing::CountEntries(root_), 0U);
}

TEST_F(SandboxExecutorTest, LaunchFailureThrowsAndCleansUp) {
    const SandboxExecutor executor(RelaxedConfig());
    testing::ScopedPath path("/nonexistent");
    EXPECT_THROW(executor.Execute({"python", "print(1)", 5}), ExecutionError);
    EXPECT_EQ(testing::CountEntries(root_), 0U);
}

TEST_F(SandboxExecutorTest, ValidationFailsBeforeTouchingDisk) {
    const SandboxExecutor executor(RelaxedConfig());
    EXPECT_THROW(executor.Execute({"cobol", "DISPLAY 'HI'.", std::nullopt}), ValidationError);
    EXPECT_THROW(executor.Execute({"python", "", std::nullopt}), ValidationError);
    EXPECT_FALSE(std::filesystem::exists(root_));
}

TEST_F(SandboxExecutorTest, ConcurrentRequestsDoNotInterfere) {
    if (!testing::HasCommand("python3")) {
        GTEST_SKIP() << "python3 not available";
    }
    const SandboxExecutor executor(RelaxedConfig());
    const ExecutionRequest request{"python", "import os\nprint(sorted(os.listdir('.')))", 10};

    auto first = std::async(std::launch::async, [&] { return executor.Execute(request); });
    auto second = std::async(std::launch::async, [&] { return executor.Execute(request); });
    const auto a = first.get();
    const auto b = second.get();

    EXPECT_NE(a.execution_id, b.execution_id);
    EXPECT_EQ(a.result.exit_code, 0);
    EXPECT_EQ(b.result.exit_code, 0);
    EXPECT_EQ(a.result.output, "['snippet.py']\n");
    EXPECT_EQ(a.result.output, b.result.output);
    EXPECT_EQ(testing::CountEntries(root_), 0U);
}

TEST_F(SandboxExecutorTest, RunsJavaScript) {
    RequireCommand("node");
    if (IsSkipped()) {
        return;
    }
    const SandboxExecutor executor(RelaxedConfig());
    const auto outcome = executor.Execute({"js", "console.log(6 * 7);", 10});
    EXPECT_EQ(outcome.result.exit_code, 0);
    EXPECT_EQ(outcome.result.combined_output, "42\n");
}

TEST_F(SandboxExecutorTest, CompilesAndRunsJava) {
    RequireCommand("javac");
    if (IsSkipped()) {
        return;
    }
    const SandboxExecutor executor(RelaxedConfig());
    const auto outcome = executor.Execute(
        {"java", "public class Solution { public static void main(String[] a) { System.out.println(\"hi\"); } }", 60});
    EXPECT_EQ(outcome.result.exit_code, 0);
    EXPECT_EQ(outcome.result.combined_output, "hi\n");
    EXPECT_EQ(testing::CountEntries(root_), 0U);
}

TEST_F(SandboxExecutorTest, RunsGo) {
    RequireCommand("go");
    if (IsSkipped()) {
        return;
    }
    const SandboxExecutor executor(RelaxedConfig());
    const auto outcome = executor.Execute(
        {"go", "package main\nimport \"fmt\"\nfunc main() { fmt.Println(\"go\") }\n", 120});
    EXPECT_EQ(outcome.result.exit_code, 0);
    EXPECT_EQ(outcome.result.combined_output, "go\n");
}

TEST_F(SandboxExecutorTest, TranspilesAndRunsTypeScript) {
    RequireCommand("tsc");
    if (IsSkipped()) {
        return;
    }
    const SandboxExecutor executor(RelaxedConfig());
    const auto outcome = executor.Execute({"ts", "const n: number = 5;\nconsole.log(n);\n", 60});
    EXPECT_EQ(outcome.result.exit_code, 0);
    EXPECT_EQ(outcome.result.combined_output, "5\n");
}

}  // namespace
}  // namespace runbox::sandbox
