#include "encoding.hpp"
#include <gtest/gtest.h>

using namespace comment_remover;

namespace {

std::string repeat(const std::string& text, int times) {
    std::string result;
    for (int i = 0; i < times; ++i) result += text;
    return result;
}

} // namespace

// Detection
TEST(EncodingDetectionTest, EmptyInputDetectsNothing) {
    EXPECT_EQ(detect_encoding(""), "");
}

TEST(EncodingDetectionTest, DetectsUtf8) {
    std::string utf8_text = repeat("Gr\xC3\xBC\xC3\x9F" "e aus K\xC3\xB6ln, \xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E, caf\xC3\xA9 cr\xC3\xA8me. ", 20);
    EXPECT_EQ(detect_encoding(utf8_text), "UTF-8");
}

TEST(EncodingDetectionTest, DetectsUtf16LittleEndianBom) {
    std::string utf16_text("\xFF\xFE", 2);
    for (char c : std::string("Hello world, this is UTF-16 text.")) {
        utf16_text += c;
        utf16_text += '\0';
    }
    EXPECT_EQ(detect_encoding(utf16_text), "UTF-16LE");
}

TEST(EncodingDetectionTest, AsciiGetsSomeCharset) {
    EXPECT_FALSE(detect_encoding(repeat("<p>The quick brown fox jumps over the lazy dog.</p>\n", 10)).empty());
}

// Decoding
TEST(EncodingDecodeTest, Latin1ToUtf8) {
    std::string text;
    std::string error;
    ASSERT_TRUE(decode_to_utf8("caf\xE9", "ISO-8859-1", text, error)) << error;
    EXPECT_EQ(text, "caf\xC3\xA9");
}

TEST(EncodingDecodeTest, AcceptsCommonAliases) {
    std::string text;
    std::string error;
    EXPECT_TRUE(decode_to_utf8("abc", "utf-8", text, error)) << error;
    EXPECT_TRUE(decode_to_utf8("abc", "latin1", text, error)) << error;
    EXPECT_EQ(text, "abc");
}

TEST(EncodingDecodeTest, Utf16LittleEndian) {
    std::string text;
    std::string error;
    ASSERT_TRUE(decode_to_utf8(std::string("h\0i\0", 4), "UTF-16LE", text, error)) << error;
    EXPECT_EQ(text, "hi");
}

TEST(EncodingDecodeTest, EmptyInput) {
    std::string text = "stale";
    std::string error;
    ASSERT_TRUE(decode_to_utf8("", "UTF-8", text, error)) << error;
    EXPECT_EQ(text, "");
}

TEST(EncodingDecodeTest, InvalidUtf8Fails) {
    std::string text = "untouched";
    std::string error;
    EXPECT_FALSE(decode_to_utf8("ok \xFF\xFE bad", "UTF-8", text, error));
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(text, "untouched");
}

TEST(EncodingDecodeTest, TruncatedSequenceFails) {
    std::string text;
    std::string error;
    EXPECT_FALSE(decode_to_utf8("caf\xC3", "UTF-8", text, error));
}

TEST(EncodingDecodeTest, UnknownEncodingFails) {
    std::string text;
    std::string error;
    EXPECT_FALSE(decode_to_utf8("abc", "no-such-charset-xyz", text, error));
    EXPECT_NE(error.find("no-such-charset-xyz"), std::string::npos);
    EXPECT_FALSE(decode_to_utf8("abc", "", text, error));
}

// Encoding
TEST(EncodingEncodeTest, Utf8ToLatin1) {
    std::string bytes;
    std::string error;
    ASSERT_TRUE(encode_from_utf8("caf\xC3\xA9", "ISO-8859-1", bytes, error)) << error;
    EXPECT_EQ(bytes, "caf\xE9");
}

TEST(EncodingEncodeTest, EuroInWindows1252) {
    std::string bytes;
    std::string error;
    ASSERT_TRUE(encode_from_utf8("\xE2\x82\xAC" "5", "windows-1252", bytes, error)) << error;
    EXPECT_EQ(bytes, "\x80" "5");
}

TEST(EncodingEncodeTest, UnmappableCharacterFails) {
    std::string bytes = "untouched";
    std::string error;
    EXPECT_FALSE(encode_from_utf8("price \xE2\x82\xAC", "ISO-8859-1", bytes, error));
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(bytes, "untouched");
}

TEST(EncodingEncodeTest, EmptyText) {
    std::string bytes = "stale";
    std::string error;
    ASSERT_TRUE(encode_from_utf8("", "UTF-16LE", bytes, error)) << error;
    EXPECT_EQ(bytes, "");
}

TEST(EncodingEncodeTest, Utf16LittleEndian) {
    std::string bytes;
    std::string error;
    ASSERT_TRUE(encode_from_utf8("hi", "UTF-16LE", bytes, error)) << error;
    EXPECT_EQ(bytes, std::string("h\0i\0", 4));
}

TEST(EncodingEncodeTest, Latin1RoundTripKeepsBytes) {
    std::string original("\xA9 2024 \xC4\xD6\xDC <!-- x -->");
    std::string text;
    std::string bytes;
    std::string error;
    ASSERT_TRUE(decode_to_utf8(original, "ISO-8859-1", text, error)) << error;
    ASSERT_TRUE(encode_from_utf8(text, "ISO-8859-1", bytes, error)) << error;
    EXPECT_EQ(bytes, original);
}
