#include <gtest/gtest.h>

#include "sandbox/errors.hpp"
#include "sandbox/execution_request.hpp"

namespace runbox::sandbox {
namespace {

config::LimitsConfig Limits() {
    config::LimitsConfig limits;
    limits.default_timeout_s = 30;
    limits.max_timeout_s = 120;
    return limits;
}

TEST(ExecutionRequestTest, NormalizesLanguageAndKeepsCodeVerbatim) {
    const ExecutionRequest request{"PYTHON", "print('x')\r\n", 5};
    const auto normalized = NormalizeRequest(request, Limits());
    EXPECT_EQ(normalized.language, "python");
    EXPECT_EQ(normalized.code, "print('x')\r\n");
    EXPECT_EQ(normalized.timeout_seconds, 5);
    ASSERT_NE(normalized.profile, nullptr);
    EXPECT_STREQ(normalized.profile->name, "python");
    EXPECT_EQ(request.language, "PYTHON");
}

TEST(ExecutionRequestTest, MissingTimeoutUsesDefault) {
    const auto normalized = NormalizeRequest({"go", "package main", std::nullopt}, Limits());
    EXPECT_EQ(normalized.timeout_seconds, 30);
}

TEST(ExecutionRequestTest, TimeoutIsClamped) {
    EXPECT_EQ(NormalizeRequest({"js", "1", 0}, Limits()).timeout_seconds, 1);
    EXPECT_EQ(NormalizeRequest({"js", "1", -7}, Limits()).timeout_seconds, 1);
    EXPECT_EQ(NormalizeRequest({"js", "1", 500}, Limits()).timeout_seconds, 120);
    EXPECT_EQ(NormalizeRequest({"js", "1", 120}, Limits()).timeout_seconds, 120);
}

TEST(ExecutionRequestTest, ReportsEveryViolation) {
    try {
        NormalizeRequest({"", "", std::nullopt}, Limits());
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& ex) {
        ASSERT_EQ(ex.Violations().size(), 2U);
        EXPECT_EQ(ex.Violations()[0], "Missing 'language' parameter");
        EXPECT_EQ(ex.Violations()[1], "Missing 'code' parameter");
        EXPECT_STREQ(ex.what(), "Missing 'language' parameter; Missing 'code' parameter");
    }
}

TEST(ExecutionRequestTest, UnsupportedLanguageListsSupportedSet) {
    try {
        NormalizeRequest({"COBOL", "DISPLAY 'HI'.", std::nullopt}, Limits());
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& ex) {
        const std::string message = ex.what();
        EXPECT_NE(message.find("Unsupported language: cobol"), std::string::npos);
        EXPECT_NE(message.find("python, javascript, js, java, go, typescript, ts"), std::string::npos);
    }
}

}  // namespace
}  // namespace runbox::sandbox
