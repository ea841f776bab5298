// ==============================================================================
// test_encoder_gtest.cpp - Тесты кодирования Result (GoogleTest)
// ==============================================================================
//
// MOD-0005: encoder
// RapidJSON для проверки JSON вывода
//
// ==============================================================================

#include "crawlsink/console.hpp"
#include "crawlsink/encoder.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <string>

namespace crawlsink::encoder::test {

namespace {

Result sample_result() {
    Result r;
    r.method = "GET";
    r.url = "http://x/a";
    r.source = "body";
    r.tag = "a";
    r.attribute = "href";
    return r;
}

bool has_ansi(const std::string& s) {
    return s.find('\x1b') != std::string::npos;
}

}  // namespace

// ==============================================================================
// Json
// ==============================================================================

TEST(EncoderTest, Json_EmptyResultSuppressed) {
    Encoder enc(OutputMode::Json, false, false);
    auto out = enc.encode(Result{});
    ASSERT_TRUE(out.ok);
    EXPECT_TRUE(out.data.empty());
}

TEST(EncoderTest, Json_OmitsDefaults) {
    Encoder enc(OutputMode::Json, false, false);
    auto out = enc.encode(sample_result());
    ASSERT_TRUE(out.ok);

    rapidjson::Document doc;
    doc.Parse(out.data.c_str());
    ASSERT_FALSE(doc.HasParseError());
    ASSERT_TRUE(doc.IsObject());

    EXPECT_EQ(doc.MemberCount(), 5u);
    EXPECT_STREQ(doc["method"].GetString(), "GET");
    EXPECT_STREQ(doc["endpoint"].GetString(), "http://x/a");
    EXPECT_STREQ(doc["source"].GetString(), "body");
    EXPECT_STREQ(doc["tag"].GetString(), "a");
    EXPECT_STREQ(doc["attribute"].GetString(), "href");
    EXPECT_FALSE(doc.HasMember("body"));
    EXPECT_FALSE(doc.HasMember("timestamp"));
}

TEST(EncoderTest, Json_SingleLine) {
    Result r = sample_result();
    r.body = "a=1\nb=2";
    Encoder enc(OutputMode::Json, true, true);
    auto out = enc.encode(r);
    ASSERT_TRUE(out.ok);
    EXPECT_EQ(out.data.find('\n'), std::string::npos);
    EXPECT_FALSE(has_ansi(out.data));
}

TEST(EncoderTest, Json_TimestampIncludedWhenSet) {
    Result r;
    r.url = "http://x/a";
    r.timestamp = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));

    Encoder enc(OutputMode::Json, false, false);
    auto out = enc.encode(r);
    ASSERT_TRUE(out.ok);
    EXPECT_NE(out.data.find("\"timestamp\":\"2023-11-14T22:13:20.000Z\""), std::string::npos);
}

TEST(EncoderTest, Json_FieldSubset) {
    Encoder enc(OutputMode::Json, false, false, {Field::URL, Field::Tag});
    auto out = enc.encode(sample_result());
    ASSERT_TRUE(out.ok);
    EXPECT_EQ(out.data, "{\"endpoint\":\"http://x/a\",\"tag\":\"a\"}");
}

TEST(EncoderTest, Json_FieldSubsetAllUnsetSuppressed) {
    Result r;
    r.url = "http://x/a";
    Encoder enc(OutputMode::Json, false, false, {Field::Body});
    auto out = enc.encode(r);
    ASSERT_TRUE(out.ok);
    EXPECT_TRUE(out.data.empty());
}

TEST(EncoderTest, Json_InvalidUtf8IsFormatError) {
    Result r;
    r.url = "http://x/\xff\xfe";
    Encoder enc(OutputMode::Json, false, false);
    auto out = enc.encode(r);
    ASSERT_FALSE(out.ok);
    EXPECT_EQ(out.error.kind, ErrorKind::Format);
    EXPECT_EQ(out.error.subject, "URL");
}

TEST(EncoderTest, Json_Deterministic) {
    Encoder enc(OutputMode::Json, false, false);
    EXPECT_EQ(enc.encode(sample_result()).data, enc.encode(sample_result()).data);
}

// ==============================================================================
// Text
// ==============================================================================

TEST(EncoderTest, Text_DefaultFieldsNoColor) {
    Encoder enc(OutputMode::Text, false, false);
    auto out = enc.encode(sample_result());
    ASSERT_TRUE(out.ok);
    EXPECT_EQ(out.data, "[GET] [body] [a] [href] http://x/a");
}

TEST(EncoderTest, Text_ColorsApplied) {
    Encoder enc(OutputMode::Text, true, false);
    auto out = enc.encode(sample_result());
    ASSERT_TRUE(out.ok);
    EXPECT_TRUE(has_ansi(out.data));
    EXPECT_NE(out.data.find(console::ansi_color_code(console::Color::Green) + "GET"),
              std::string::npos);
    EXPECT_EQ(decolorize(out.data), "[GET] [body] [a] [href] http://x/a");
}

TEST(EncoderTest, Text_SkipsUnsetFields) {
    Result r;
    r.url = "http://x/a";
    r.tag = "script";
    Encoder enc(OutputMode::Text, false, false);
    EXPECT_EQ(enc.encode(r).data, "[script] http://x/a");
}

TEST(EncoderTest, Text_VerboseAddsTimestampAndBody) {
    Result r = sample_result();
    r.method = "POST";
    r.body = "q=1";
    r.timestamp = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));

    Encoder quiet(OutputMode::Text, false, false);
    EXPECT_EQ(quiet.encode(r).data, "[POST] [body] [a] [href] http://x/a");

    Encoder verbose(OutputMode::Text, false, true);
    EXPECT_EQ(verbose.encode(r).data,
              "[2023-11-14T22:13:20.000Z] [POST] [body] [a] [href] http://x/a q=1");
}

TEST(EncoderTest, Text_FieldSubsetOrderFixed) {
    // Порядок в строке не зависит от порядка в списке
    Encoder enc(OutputMode::Text, false, false, {Field::URL, Field::Method});
    EXPECT_EQ(enc.encode(sample_result()).data, "[GET] http://x/a");
}

TEST(EncoderTest, Text_EmptyResultSuppressed) {
    Encoder enc(OutputMode::Text, true, true);
    auto out = enc.encode(Result{});
    ASSERT_TRUE(out.ok);
    EXPECT_TRUE(out.data.empty());
}

TEST(EncoderTest, Text_LineBreaksInValuesEscaped) {
    Result r = sample_result();
    r.url = "http://x/a\r\nb";
    r.body = "line1\nline2";

    Encoder verbose(OutputMode::Text, false, true);
    auto out = verbose.encode(r);
    ASSERT_TRUE(out.ok);
    EXPECT_EQ(out.data, "[GET] [body] [a] [href] http://x/a%0D%0Ab line1%0Aline2");
    EXPECT_EQ(out.data.find('\n'), std::string::npos);
    EXPECT_EQ(out.data.find('\r'), std::string::npos);
}

TEST(EncoderTest, Json_LineBreaksKeptInValue) {
    Result r = sample_result();
    r.body = "line1\nline2";

    Encoder enc(OutputMode::Json, false, false);
    auto out = enc.encode(r);
    ASSERT_TRUE(out.ok);
    EXPECT_EQ(out.data.find('\n'), std::string::npos);

    auto decoded = decode_json(out.data);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->body, "line1\nline2");
}

TEST(EncoderTest, EscapeLineBreaks) {
    EXPECT_EQ(escape_line_breaks(""), "");
    EXPECT_EQ(escape_line_breaks("plain value"), "plain value");
    EXPECT_EQ(escape_line_breaks("a\nb\rc\r\n"), "a%0Ab%0Dc%0D%0A");
}

TEST(EncoderTest, DefaultTextFields_VerboseSuperset) {
    auto plain = default_text_fields(false);
    auto verbose = default_text_fields(true);
    EXPECT_EQ(plain.size(), 5u);
    EXPECT_EQ(verbose.size(), 7u);
}

// ==============================================================================
// decolorize
// ==============================================================================

TEST(EncoderTest, Decolorize_StripsSgr) {
    EXPECT_EQ(decolorize("\x1b[32mGET\x1b[0m"), "GET");
    EXPECT_EQ(decolorize("\x1b[1;31mred\x1b[0m text"), "red text");
    EXPECT_EQ(decolorize("\x1b[2Kclear"), "clear");
}

TEST(EncoderTest, Decolorize_PlainUnchanged) {
    EXPECT_EQ(decolorize("no color here [x]"), "no color here [x]");
    EXPECT_EQ(decolorize(""), "");
}

TEST(EncoderTest, Decolorize_IncompleteSequenceKept) {
    EXPECT_EQ(decolorize("tail\x1b["), "tail\x1b[");
    EXPECT_EQ(decolorize("\x1b[12"), "\x1b[12");
    EXPECT_EQ(decolorize("\x1bX"), "\x1bX");
}

TEST(EncoderTest, Decolorize_SequenceExposedByRemoval) {
    // После удаления внутренней последовательности слева остаётся "ESC [n"
    EXPECT_EQ(decolorize("\x1b[\x1b[31mnested\x1b[0m"), "ested");
}

TEST(EncoderTest, Decolorize_Idempotent) {
    const std::string inputs[] = {
        "\x1b[32mGET\x1b[0m http://x",
        "\x1b[\x1b[31mnested\x1b[0m",
        "\x1b[1;2;3mA\x1b[mB",
        "plain",
        "\x1b[",
    };
    for (const auto& in : inputs) {
        std::string once = decolorize(in);
        EXPECT_EQ(decolorize(once), once);
    }
}

// ==============================================================================
// decode_json
// ==============================================================================

TEST(EncoderTest, DecodeJson_EncodedResult) {
    Result r = sample_result();
    r.body = "x=1";
    r.timestamp = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123LL));

    Encoder enc(OutputMode::Json, false, false);
    auto decoded = decode_json(enc.encode(r).data);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->method, "GET");
    EXPECT_EQ(decoded->url, "http://x/a");
    EXPECT_EQ(decoded->body, "x=1");
    EXPECT_EQ(decoded->timestamp, r.timestamp);
}

TEST(EncoderTest, DecodeJson_Malformed) {
    EXPECT_FALSE(decode_json("").has_value());
    EXPECT_FALSE(decode_json("{\"endpoint\":").has_value());
    EXPECT_FALSE(decode_json("[1,2]").has_value());
    EXPECT_FALSE(decode_json("{\"endpoint\":5}").has_value());
    EXPECT_FALSE(decode_json("{\"timestamp\":\"never\"}").has_value());
}

TEST(EncoderTest, DecodeJson_UnknownKeysIgnored) {
    auto decoded = decode_json("{\"endpoint\":\"http://x\",\"depth\":3}");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->url, "http://x");
}

}  // namespace crawlsink::encoder::test
