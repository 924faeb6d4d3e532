#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "FileSink.hpp"

namespace fs = std::filesystem;


class DirectorySinkTest : public ::testing::Test {
protected:
    fs::path directory;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        directory = fs::path(::testing::TempDir()) / (std::string("ftclient_sink_") + info->name());
        fs::remove_all(directory);
        fs::create_directories(directory);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(directory, ec);
    }

    std::string contents(const std::string& name) {
        std::ifstream in(directory / name, std::ios::binary);
        std::ostringstream out;
        out << in.rdbuf();
        return out.str();
    }
};


TEST_F(DirectorySinkTest, CreatesAndWritesFile) {
    DirectorySink sink(directory);

    EXPECT_FALSE(sink.exists("out.txt"));
    ASSERT_TRUE(sink.create("out.txt"));
    EXPECT_TRUE(sink.write("abc", 3));
    EXPECT_TRUE(sink.write("def", 3));
    EXPECT_TRUE(sink.close());

    EXPECT_TRUE(sink.exists("out.txt"));
    EXPECT_EQ(contents("out.txt"), "abcdef");
}

TEST_F(DirectorySinkTest, CreateNeverReplacesExistingFile) {
    {
        std::ofstream existing(directory / "out.txt", std::ios::binary);
        existing << "keep me";
    }
    DirectorySink sink(directory);

    EXPECT_TRUE(sink.exists("out.txt"));
    EXPECT_FALSE(sink.create("out.txt"));
    EXPECT_FALSE(sink.write("xyz", 3));
    EXPECT_EQ(contents("out.txt"), "keep me");
}

TEST_F(DirectorySinkTest, ServerPathsAreReducedToFileName) {
    DirectorySink sink(directory);

    EXPECT_EQ(sink.resolve("../../etc/passwd"), directory / "passwd");
    EXPECT_EQ(sink.resolve("/tmp/report.csv"), directory / "report.csv");
    EXPECT_TRUE(sink.resolve("..").empty());
    EXPECT_TRUE(sink.resolve("").empty());
    EXPECT_FALSE(sink.create(".."));
}

TEST_F(DirectorySinkTest, OnlyOneFileOpenAtATime) {
    DirectorySink sink(directory);

    ASSERT_TRUE(sink.create("first.bin"));
    EXPECT_FALSE(sink.create("second.bin"));
    EXPECT_TRUE(sink.close());
    EXPECT_TRUE(sink.create("second.bin"));
}
