// ==============================================================================
// test_config_gtest.cpp - Тесты конфигурации (GoogleTest)
// ==============================================================================
//
// MOD-0009: config
// yaml-cpp
//
// ==============================================================================

#include "crawlsink/archive.hpp"
#include "crawlsink/config.hpp"
#include "crawlsink/platform.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

namespace crawlsink::config::test {

TEST(ConfigTest, Defaults) {
    Options opt;
    EXPECT_FALSE(opt.colors);
    EXPECT_EQ(opt.mode, encoder::OutputMode::Text);
    EXPECT_FALSE(opt.output_file.has_value());
    EXPECT_FALSE(opt.store_response);
    EXPECT_EQ(opt.store_fields_dir, std::filesystem::path(fields::DEFAULT_STORE_DIR));
}

TEST(ConfigTest, ParseOptions_EmptyDocument) {
    auto parsed = parse_options("");
    ASSERT_TRUE(parsed.ok) << parsed.error.message;
    EXPECT_EQ(parsed.options.mode, encoder::OutputMode::Text);
}

TEST(ConfigTest, ParseOptions_AllKeys) {
    auto parsed = parse_options(
        "colors: true\n"
        "json: true\n"
        "verbose: true\n"
        "quiet: true\n"
        "output: results.jsonl\n"
        "fields: Method,URL\n"
        "store-fields: [URL, Tag]\n"
        "store-fields-dir: fields\n"
        "store-response: true\n"
        "store-response-dir: responses\n");
    ASSERT_TRUE(parsed.ok) << parsed.error.message;

    const Options& opt = parsed.options;
    EXPECT_TRUE(opt.colors);
    EXPECT_EQ(opt.mode, encoder::OutputMode::Json);
    EXPECT_TRUE(opt.verbose);
    EXPECT_TRUE(opt.quiet);
    ASSERT_TRUE(opt.output_file.has_value());
    EXPECT_EQ(*opt.output_file, std::filesystem::path("results.jsonl"));
    EXPECT_EQ(opt.fields, "Method,URL");
    EXPECT_EQ(opt.store_fields, "URL,Tag");
    EXPECT_EQ(opt.store_fields_dir, std::filesystem::path("fields"));
    EXPECT_TRUE(opt.store_response);
    ASSERT_TRUE(opt.store_response_dir.has_value());
    EXPECT_EQ(*opt.store_response_dir, std::filesystem::path("responses"));
}

TEST(ConfigTest, ParseOptions_StoreFieldsString) {
    auto parsed = parse_options("store-fields: URL,Tag\n");
    ASSERT_TRUE(parsed.ok);
    EXPECT_EQ(parsed.options.store_fields, "URL,Tag");
}

TEST(ConfigTest, ParseOptions_UnknownKey) {
    auto parsed = parse_options("colour: true\n");
    ASSERT_FALSE(parsed.ok);
    EXPECT_EQ(parsed.error.kind, ErrorKind::Config);
    EXPECT_EQ(parsed.error.subject, "colour");
}

TEST(ConfigTest, ParseOptions_BadValue) {
    auto parsed = parse_options("json: maybe\n");
    ASSERT_FALSE(parsed.ok);
    EXPECT_EQ(parsed.error.kind, ErrorKind::Config);
}

TEST(ConfigTest, ParseOptions_NotAMapping) {
    auto parsed = parse_options("- a\n- b\n");
    ASSERT_FALSE(parsed.ok);
    EXPECT_EQ(parsed.error.kind, ErrorKind::Config);
}

TEST(ConfigTest, ParseOptions_Malformed) {
    auto parsed = parse_options("json: [true\n");
    ASSERT_FALSE(parsed.ok);
    EXPECT_NE(parsed.error.message.find("YAML"), std::string::npos);
}

TEST(ConfigTest, LoadOptions_File) {
    auto dir = platform::make_temp_dir("crawlsink_config");
    auto path = dir / "sink.yaml";
    std::ofstream(path) << "json: true\noutput: out.txt\n";

    auto loaded = load_options(path);
    ASSERT_TRUE(loaded.ok) << loaded.error.message;
    EXPECT_EQ(loaded.options.mode, encoder::OutputMode::Json);
    EXPECT_EQ(*loaded.options.output_file, std::filesystem::path("out.txt"));

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

TEST(ConfigTest, LoadOptions_MissingFile) {
    auto loaded = load_options("/nonexistent/crawlsink/sink.yaml");
    ASSERT_FALSE(loaded.ok);
    EXPECT_EQ(loaded.error.kind, ErrorKind::Config);
}

TEST(ConfigTest, ResponseDir_DefaultWhenUnset) {
    Options opt;
    EXPECT_EQ(response_dir(opt), std::filesystem::path(archive::DEFAULT_RESPONSE_DIR));

    opt.store_response_dir = std::filesystem::path{};
    EXPECT_EQ(response_dir(opt), std::filesystem::path(archive::DEFAULT_RESPONSE_DIR));

    opt.store_response_dir = std::filesystem::path("custom");
    EXPECT_EQ(response_dir(opt), std::filesystem::path("custom"));
}

}  // namespace crawlsink::config::test
