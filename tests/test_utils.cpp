#include <gtest/gtest.h>
#include <core/utils.hpp>

TEST(Base64, KnownVectors) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_encode("foobar"), "Zm9vYmFy");
    EXPECT_EQ(base64_decode("Zm9vYmE="), "fooba");
}

TEST(Base64, AllByteValues) {
    std::string bytes;
    for (int i = 0; i < 256; i++) bytes += static_cast<char>(i);
    EXPECT_EQ(base64_decode(base64_encode(bytes)), bytes);
}

TEST(Base64, PngSignature) {
    std::string sig("\x89PNG\r\n\x1a\n", 8);
    EXPECT_EQ(base64_encode(sig), "iVBORw0KGgo=");
    EXPECT_EQ(base64_decode("iVBORw0KGgo="), sig);
}

TEST(Base64, DecodeSkipsLineBreaks) {
    EXPECT_EQ(base64_decode("Zm9v\nYmFy\r\n"), "foobar");
}

TEST(Utils, Join) {
    EXPECT_EQ(join({}, "\n"), "");
    EXPECT_EQ(join({"a"}, "\n"), "a");
    EXPECT_EQ(join({"a", "", "c"}, ","), "a,,c");
}

TEST(Utils, SplitWhitespace) {
    auto parts = split_ws("  run   s1\tfile.py \n");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "run");
    EXPECT_EQ(parts[1], "s1");
    EXPECT_EQ(parts[2], "file.py");
    EXPECT_TRUE(split_ws("   ").empty());
}

TEST(Utils, Trim) {
    std::string s = "\n  hello world \t\r\n";
    trim(s);
    EXPECT_EQ(s, "hello world");

    std::string blank = " \n\t";
    trim(blank);
    EXPECT_EQ(blank, "");
}

TEST(Utils, SafeStoi) {
    EXPECT_EQ(safe_stoi("42"), 42);
    EXPECT_EQ(safe_stoi("abc", -1), -1);
    EXPECT_EQ(safe_stoi("", 7), 7);
}
