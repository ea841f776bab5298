// ==============================================================================
// test_file_sink_gtest.cpp - Тесты файлового приёмника (GoogleTest)
// ==============================================================================
//
// MOD-0006: file_sink
//
// ==============================================================================

#include "crawlsink/file_sink.hpp"
#include "crawlsink/platform.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>

namespace crawlsink::io::test {

class FileSinkTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override { test_dir_ = platform::make_temp_dir("crawlsink_sink"); }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    static std::string read_file(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(FileSinkTest, Open_CreatesFile) {
    auto path = test_dir_ / "out.txt";
    auto opened = FileSink::open(path, FileMode::Truncate);
    ASSERT_TRUE(opened.ok) << opened.error.message;
    EXPECT_TRUE(opened.sink->is_open());
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(opened.sink->path(), path);
}

TEST_F(FileSinkTest, Open_MissingDirectoryFails) {
    auto opened = FileSink::open(test_dir_ / "missing" / "out.txt", FileMode::Truncate);
    ASSERT_FALSE(opened.ok);
    EXPECT_EQ(opened.error.kind, ErrorKind::Sink);
    EXPECT_EQ(opened.sink, nullptr);
}

TEST_F(FileSinkTest, Write_VisibleWithoutClose) {
    auto path = test_dir_ / "out.txt";
    auto opened = FileSink::open(path, FileMode::Truncate);
    ASSERT_TRUE(opened.ok);

    ASSERT_TRUE(opened.sink->write("line one\n").ok);
    // Каждая запись сбрасывается сразу
    EXPECT_EQ(read_file(path), "line one\n");
}

TEST_F(FileSinkTest, Truncate_DropsOldContent) {
    auto path = test_dir_ / "out.txt";
    std::ofstream(path) << "old\n";

    auto opened = FileSink::open(path, FileMode::Truncate);
    ASSERT_TRUE(opened.ok);
    ASSERT_TRUE(opened.sink->write("new\n").ok);
    ASSERT_TRUE(opened.sink->close().ok);
    EXPECT_EQ(read_file(path), "new\n");
}

TEST_F(FileSinkTest, Append_KeepsOldContent) {
    auto path = test_dir_ / "out.txt";
    std::ofstream(path) << "old\n";

    auto opened = FileSink::open(path, FileMode::Append);
    ASSERT_TRUE(opened.ok);
    ASSERT_TRUE(opened.sink->write("new\n").ok);
    ASSERT_TRUE(opened.sink->close().ok);
    EXPECT_EQ(read_file(path), "old\nnew\n");
}

TEST_F(FileSinkTest, WriteAfterClose_ClosedSink) {
    auto opened = FileSink::open(test_dir_ / "out.txt", FileMode::Truncate);
    ASSERT_TRUE(opened.ok);
    ASSERT_TRUE(opened.sink->close().ok);
    EXPECT_FALSE(opened.sink->is_open());

    Status st = opened.sink->write("late\n");
    ASSERT_FALSE(st.ok);
    EXPECT_EQ(st.error.kind, ErrorKind::ClosedSink);
}

TEST_F(FileSinkTest, CloseTwice_ClosedSink) {
    auto opened = FileSink::open(test_dir_ / "out.txt", FileMode::Truncate);
    ASSERT_TRUE(opened.ok);
    ASSERT_TRUE(opened.sink->close().ok);

    Status st = opened.sink->close();
    ASSERT_FALSE(st.ok);
    EXPECT_EQ(st.error.kind, ErrorKind::ClosedSink);
}

TEST_F(FileSinkTest, Move_TransfersHandle) {
    auto path = test_dir_ / "out.txt";
    auto opened = FileSink::open(path, FileMode::Truncate);
    ASSERT_TRUE(opened.ok);

    FileSink moved(std::move(*opened.sink));
    EXPECT_TRUE(moved.is_open());
    ASSERT_TRUE(moved.write("moved\n").ok);
    ASSERT_TRUE(moved.close().ok);
    EXPECT_EQ(read_file(path), "moved\n");
}

TEST_F(FileSinkTest, Write_BinarySafe) {
    auto path = test_dir_ / "bin.dat";
    auto opened = FileSink::open(path, FileMode::Truncate);
    ASSERT_TRUE(opened.ok);

    std::string data("a\0b\r\n", 5);
    ASSERT_TRUE(opened.sink->write(data).ok);
    ASSERT_TRUE(opened.sink->close().ok);
    EXPECT_EQ(read_file(path), data);
}

}  // namespace crawlsink::io::test
