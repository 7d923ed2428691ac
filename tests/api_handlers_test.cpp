#include <gtest/gtest.h>

#include <memory>

#include "server/api_handlers.hpp"
#include "test_support.hpp"

namespace runbox::server {
namespace {

class ApiHandlersTest : public testing::ScratchDirTest {
protected:
    void SetUp() override {
        ScratchDirTest::SetUp();
        config_ = RelaxedConfig();
        executor_ = std::make_unique<sandbox::SandboxExecutor>(config_);
    }

    config::Config config_;
    std::unique_ptr<sandbox::SandboxExecutor> executor_;
};

TEST_F(ApiHandlersTest, RejectsInvalidJson) {
    const auto reply = HandleRun("{not json", *executor_);
    EXPECT_EQ(reply.status, 400);
    EXPECT_EQ(reply.body["error"], "Request body must be valid JSON");

    EXPECT_EQ(HandleRun("[1, 2]", *executor_).status, 400);
}

TEST_F(ApiHandlersTest, ReportsMissingFields) {
    const auto reply = HandleRun("{}", *executor_);
    EXPECT_EQ(reply.status, 400);
    const auto error = reply.body["error"].get<std::string>();
    EXPECT_NE(error.find("Missing 'language' parameter"), std::string::npos);
    EXPECT_NE(error.find("Missing 'code' parameter"), std::string::npos);
}

TEST_F(ApiHandlersTest, RejectsUnsupportedLanguage) {
    const auto reply = HandleRun(R"({"language": "cobol", "code": "x"})", *executor_);
    EXPECT_EQ(reply.status, 400);
    EXPECT_NE(reply.body["error"].get<std::string>().find("Unsupported language: cobol"), std::string::npos);
}

TEST_F(ApiHandlersTest, RejectsWrongFieldTypes) {
    const auto reply = HandleRun(R"({"language": "python", "code": "x", "timeout": "soon"})", *executor_);
    EXPECT_EQ(reply.status, 400);
    EXPECT_EQ(reply.body["error"], "'timeout' must be an integer");

    EXPECT_EQ(HandleRun(R"({"language": 3, "code": "x"})", *executor_).status, 400);
}

TEST_F(ApiHandlersTest, RunsPythonAndReportsResult) {
    if (!testing::HasCommand("python3")) {
        GTEST_SKIP() << "python3 not available";
    }
    const auto reply = HandleRun(R"j({"language": "python", "code": "print(2 + 2)", "timeout": 5})j", *executor_);
    ASSERT_EQ(reply.status, 200);
    EXPECT_EQ(reply.body["output"], "4\n");
    EXPECT_EQ(reply.body["language"], "python");
    EXPECT_EQ(reply.body["output_length"], 2);
    EXPECT_EQ(reply.body["exit_code"], 0);
    EXPECT_EQ(reply.body["timed_out"], false);
    EXPECT_GE(reply.body["execution_time"].get<double>(), 0.0);
}

TEST_F(ApiHandlersTest, OversizedTimeoutSaturatesToMaximum) {
    if (!testing::HasCommand("python3")) {
        GTEST_SKIP() << "python3 not available";
    }
    const std::string code = R"(import time\ntime.sleep(1.5)\nprint('done'))";
    for (const char* timeout : {"2147483648", "4294967297", "18446744073709551615"}) {
        const auto reply = HandleRun(
            std::string(R"({"language": "python", "code": ")") + code + R"(", "timeout": )" + timeout + "}",
            *executor_);
        ASSERT_EQ(reply.status, 200) << timeout;
        EXPECT_EQ(reply.body["timed_out"], false) << timeout;
        EXPECT_EQ(reply.body["output"], "done\n") << timeout;
    }
}

TEST_F(ApiHandlersTest, LaunchFailureIsExecutionPhaseError) {
    testing::ScopedPath path("/nonexistent");
    const auto reply = HandleRun(R"j({"language": "python", "code": "print(1)"})j", *executor_);
    EXPECT_EQ(reply.status, 500);
    EXPECT_EQ(reply.body["phase"], "execution");
    EXPECT_NE(reply.body["error"].get<std::string>().find("Execution error"), std::string::npos);
}

TEST_F(ApiHandlersTest, ServiceInfoListsLanguages) {
    const auto reply = HandleServiceInfo(config_);
    EXPECT_EQ(reply.status, 200);
    EXPECT_EQ(reply.body["version"], "2.0.0");
    EXPECT_EQ(reply.body["supported_languages"].size(), 7U);
    EXPECT_TRUE(reply.body["endpoints"].contains("/run"));
}

TEST_F(ApiHandlersTest, HealthReportsOk) {
    const auto reply = HandleHealth(config_, std::chrono::steady_clock::now());
    EXPECT_EQ(reply.status, 200);
    EXPECT_EQ(reply.body["status"], "ok");
    EXPECT_GE(reply.body["system"]["cpu_count"].get<long>(), 1);
    EXPECT_GT(reply.body["process"]["threads"].get<long>(), 0);
}

}  // namespace
}  // namespace runbox::server
