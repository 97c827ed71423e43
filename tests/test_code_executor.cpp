#include <gtest/gtest.h>
#include <managers/code_executor.hpp>
#include "fake_provider.hpp"

using namespace std::chrono;

// ── Output normalization ────────────────────────────────────

TEST(MergeOutput, StdoutLinesJoined) {
    EXPECT_EQ(merge_output({"a", "b"}, {}), "a\nb");
}

TEST(MergeOutput, StderrFollowsStdoutOnItsOwnLine) {
    EXPECT_EQ(merge_output({"result"}, {"warning: slow"}), "result\nwarning: slow");
}

TEST(MergeOutput, StderrOnly) {
    EXPECT_EQ(merge_output({}, {"oops"}), "oops");
}

TEST(MergeOutput, Trimmed) {
    EXPECT_EQ(merge_output({"", "  hi  ", ""}, {}), "hi");
    EXPECT_EQ(merge_output({}, {}), "");
}

TEST(ExtractImages, PngPreferredJpegFallbackEmptySkipped) {
    std::vector<SandboxArtifact> artifacts = {
        {"P1", "J1"},
        {"", "J2"},
        {"", ""},
        {"P3", ""},
    };
    auto images = extract_images(artifacts);
    ASSERT_EQ(images.size(), 3u);
    EXPECT_EQ(images[0].format, ImageFormat::PNG);
    EXPECT_EQ(images[0].base64, "P1");
    EXPECT_EQ(images[1].format, ImageFormat::JPEG);
    EXPECT_EQ(images[1].base64, "J2");
    EXPECT_EQ(images[2].format, ImageFormat::PNG);
    EXPECT_EQ(images[2].base64, "P3");
}

TEST(FormatInterpreterError, AllParts) {
    InterpreterError err{"ValueError", "bad input", "Traceback (most recent call last):\n  line 1"};
    EXPECT_EQ(format_interpreter_error(err),
              "ValueError\nbad input\nTraceback (most recent call last):\n  line 1");
}

TEST(FormatInterpreterError, EmptyPartsOmitted) {
    EXPECT_EQ(format_interpreter_error({"KeyboardInterrupt", "", ""}), "KeyboardInterrupt");
    EXPECT_EQ(format_interpreter_error({"NameError", "", "tb"}), "NameError\ntb");
}

// ── execute() ───────────────────────────────────────────────

class CodeExecutorTest : public ::testing::Test {
protected:
    FakeProvider provider;
    ManualClock clock;
    SessionStore store{provider, ExpiryPolicy(minutes(30), minutes(60)), 1000, clock.fn()};
    CodeExecutor executor{store, provider, 2500};
};

TEST_F(CodeExecutorTest, ReturnsNormalizedOutput) {
    RunOutput out;
    out.stdout_lines = {"1", "2"};
    out.artifacts = {{"iVBORw0KGgo=", ""}};
    provider.set_output(out);

    auto result = executor.execute("s1", "print(1); print(2)");
    EXPECT_FALSE(result.failed());
    EXPECT_EQ(result.stdout_text, "1\n2");
    ASSERT_EQ(result.images.size(), 1u);
    EXPECT_EQ(result.images[0].format, ImageFormat::PNG);
    EXPECT_EQ(result.sandbox_id, "sbx-1");
    EXPECT_GE(result.execution_time_ms, 0);
    EXPECT_EQ(provider.last_code(), "print(1); print(2)");
    EXPECT_EQ(provider.last_run_timeout_ms.load(), 2500);
}

TEST_F(CodeExecutorTest, CreationFailureIsReported) {
    provider.fail_create = true;
    auto result = executor.execute("s1", "1 + 1");

    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(*result.error, "Failed to create sandbox: quota exceeded");
    EXPECT_TRUE(result.stdout_text.empty());
    EXPECT_TRUE(result.images.empty());
    EXPECT_TRUE(result.sandbox_id.empty());
    EXPECT_GE(result.execution_time_ms, 0);
    EXPECT_EQ(provider.run_calls.load(), 0);
}

TEST_F(CodeExecutorTest, InterpreterErrorKeepsOutput) {
    RunOutput out;
    out.stdout_lines = {"before"};
    out.error = InterpreterError{"ZeroDivisionError", "division by zero", ""};
    provider.set_output(out);

    auto result = executor.execute("s1", "print('before'); 1/0");
    ASSERT_TRUE(result.failed());
    EXPECT_EQ(*result.error, "ZeroDivisionError\ndivision by zero");
    EXPECT_EQ(result.stdout_text, "before");

    // An interpreter error does not poison the sandbox
    auto again = executor.execute("s1", "x = 1");
    EXPECT_EQ(again.sandbox_id, "sbx-1");
}

TEST_F(CodeExecutorTest, TransportFailureMarksSandboxBroken) {
    provider.fail_run = true;
    auto result = executor.execute("s1", "x = 1");
    ASSERT_TRUE(result.failed());
    EXPECT_EQ(*result.error, "connection reset");
    EXPECT_EQ(result.sandbox_id, "sbx-1");

    auto sessions = store.sessions();
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_TRUE(sessions[0].broken);

    provider.fail_run = false;
    auto next = executor.execute("s1", "x = 1");
    EXPECT_FALSE(next.failed());
    EXPECT_EQ(next.sandbox_id, "sbx-2");
    EXPECT_TRUE(provider.handle(0)->released());
}

TEST_F(CodeExecutorTest, NeverThrows) {
    provider.throw_run = true;
    ExecutionResult result;
    EXPECT_NO_THROW(result = executor.execute("s1", "x"));
    ASSERT_TRUE(result.failed());
    EXPECT_EQ(*result.error, "boom");
    EXPECT_TRUE(result.stdout_text.empty());
}

TEST_F(CodeExecutorTest, EveryCallCountsAsExecution) {
    RunOutput out;
    out.error = InterpreterError{"NameError", "name 'y' is not defined", ""};
    provider.set_output(out);

    executor.execute("s1", "y");
    executor.execute("s1", "y");
    executor.execute("s2", "y");

    auto st = store.stats();
    EXPECT_EQ(st.total_sessions, 2u);
    EXPECT_EQ(st.total_executions, 3u);
}

TEST_F(CodeExecutorTest, StateIsPerSession) {
    executor.execute("a", "x = 1");
    executor.execute("b", "x = 2");
    auto again = executor.execute("a", "print(x)");

    EXPECT_EQ(again.sandbox_id, "sbx-1");
    EXPECT_EQ(provider.create_calls.load(), 2);
}
