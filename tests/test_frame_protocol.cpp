#include <gtest/gtest.h>
#include <ssh/frame_protocol.hpp>
#include <core/constants.hpp>
#include <core/utils.hpp>

static std::string frame(const char* marker, const std::string& rest = "") {
    return rest.empty() ? std::string(marker) : std::string(marker) + " " + rest;
}

TEST(FrameProtocol, RunFrame) {
    std::string f = build_run_frame("print('hi')\n");
    EXPECT_EQ(f, std::string(FRAME_RUN) + " " + base64_encode("print('hi')\n") + "\n");
    // Multi-line code still travels as one line
    EXPECT_EQ(f.find('\n'), f.size() - 1);
}

TEST(FrameProtocol, Ready) {
    auto f = parse_frame_line(frame(FRAME_READY, "sbx-0123456789ab"));
    EXPECT_EQ(f.type, FrameType::READY);
    ASSERT_EQ(f.fields.size(), 1u);
    EXPECT_EQ(f.fields[0], "sbx-0123456789ab");
}

TEST(FrameProtocol, OutAndErrDecoded) {
    auto out = parse_frame_line(frame(FRAME_OUT, base64_encode("hello  world")));
    EXPECT_EQ(out.type, FrameType::OUT);
    EXPECT_EQ(out.fields[0], "hello  world");

    auto err = parse_frame_line(frame(FRAME_ERR, base64_encode("warn")));
    EXPECT_EQ(err.type, FrameType::ERR);
    EXPECT_EQ(err.fields[0], "warn");
}

TEST(FrameProtocol, EmptyOutputLine) {
    auto f = parse_frame_line(frame(FRAME_OUT));
    EXPECT_EQ(f.type, FrameType::OUT);
    ASSERT_EQ(f.fields.size(), 1u);
    EXPECT_EQ(f.fields[0], "");
}

TEST(FrameProtocol, ArtifactKeepsBase64) {
    auto both = parse_frame_line(frame(FRAME_ART, "png=iVBORw0KGgo= jpeg=/9j/4AAQ"));
    EXPECT_EQ(both.type, FrameType::ART);
    ASSERT_EQ(both.fields.size(), 2u);
    EXPECT_EQ(both.fields[0], "iVBORw0KGgo=");
    EXPECT_EQ(both.fields[1], "/9j/4AAQ");

    auto png_only = parse_frame_line(frame(FRAME_ART, "png=AAAA"));
    EXPECT_EQ(png_only.fields[0], "AAAA");
    EXPECT_EQ(png_only.fields[1], "");
}

TEST(FrameProtocol, ExceptionWithEmptyFields) {
    auto f = parse_frame_line(frame(FRAME_EXC, base64_encode("KeyError") + " - -"));
    EXPECT_EQ(f.type, FrameType::EXC);
    ASSERT_EQ(f.fields.size(), 3u);
    EXPECT_EQ(f.fields[0], "KeyError");
    EXPECT_EQ(f.fields[1], "");
    EXPECT_EQ(f.fields[2], "");
}

TEST(FrameProtocol, DoneWithTrailingCarriageReturn) {
    EXPECT_EQ(parse_frame_line(std::string(FRAME_DONE) + "\r").type, FrameType::DONE);
}

TEST(FrameProtocol, PlainLinesIgnored) {
    EXPECT_EQ(parse_frame_line("").type, FrameType::NONE);
    EXPECT_EQ(parse_frame_line("Welcome to the login node").type, FrameType::NONE);
    EXPECT_EQ(parse_frame_line(std::string("echo ") + FRAME_DONE).type, FrameType::NONE);
}

TEST(FrameCollector, CollectsOneRun) {
    std::vector<std::string> streamed;
    FrameCollector collector([&](OutputStream stream, const std::string& line) {
        streamed.push_back((stream == OutputStream::STDOUT ? "out:" : "err:") + line);
    });

    EXPECT_FALSE(collector.feed(frame(FRAME_OUT, base64_encode("1"))));
    EXPECT_FALSE(collector.feed("stray banner text"));
    EXPECT_FALSE(collector.feed(frame(FRAME_ERR, base64_encode("careful"))));
    EXPECT_FALSE(collector.feed(frame(FRAME_ART, "png=AAAA")));
    EXPECT_FALSE(collector.feed(frame(FRAME_EXC,
        base64_encode("ValueError") + " " + base64_encode("bad") + " -")));
    EXPECT_TRUE(collector.feed(frame(FRAME_DONE)));
    EXPECT_TRUE(collector.done());

    // Lines after DONE belong to no run
    EXPECT_TRUE(collector.feed(frame(FRAME_OUT, base64_encode("late"))));

    RunOutput out = collector.take();
    ASSERT_EQ(out.stdout_lines.size(), 1u);
    EXPECT_EQ(out.stdout_lines[0], "1");
    ASSERT_EQ(out.stderr_lines.size(), 1u);
    EXPECT_EQ(out.stderr_lines[0], "careful");
    ASSERT_EQ(out.artifacts.size(), 1u);
    EXPECT_EQ(out.artifacts[0].png, "AAAA");
    ASSERT_TRUE(out.error.has_value());
    EXPECT_EQ(out.error->name, "ValueError");
    EXPECT_EQ(out.error->value, "bad");

    ASSERT_EQ(streamed.size(), 2u);
    EXPECT_EQ(streamed[0], "out:1");
    EXPECT_EQ(streamed[1], "err:careful");
}
