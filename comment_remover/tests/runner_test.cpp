#include "cli_args.hpp"
#include "logger.hpp"
#include "runner.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <sys/stat.h>   // mkfifo

using namespace comment_remover;
namespace fs = std::filesystem;

class RunRemoverTest : public ::testing::Test {
protected:
    fs::path root_;
    std::ostringstream log_stream_;
    Logger logger_{log_stream_};
    RemoverArgs args_;

    void SetUp() override {
        const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = fs::temp_directory_path() /
                (std::string("comment_remover_") + info->test_suite_name() + "_" + info->name());
        fs::remove_all(root_);
        fs::create_directories(root_);
        args_.encoding = "UTF-8";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void write_bytes(const fs::path& path, const std::string& bytes) {
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    }

    auto read_bytes(const fs::path& path) -> std::string {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream content;
        content << in.rdbuf();
        return content.str();
    }

    auto log() const -> std::string { return log_stream_.str(); }
};

// Fatal paths
TEST_F(RunRemoverTest, MissingPathIsFatalAndWritesNothing) {
    args_.input_path = (root_ / "no_such_page.html").string();
    args_.output_dir = (root_ / "out").string();
    args_.report_path = (root_ / "report.json").string();

    EXPECT_EQ(run_remover(args_, logger_), kExitFatal);
    EXPECT_FALSE(fs::exists(root_ / "out"));
    EXPECT_FALSE(fs::exists(root_ / "report.json"));
    EXPECT_NE(log().find("ERROR - Error: Path '" + args_.input_path + "' does not exist."), std::string::npos);
}

TEST_F(RunRemoverTest, InvalidPathTypeIsFatal) {
    fs::path fifo = root_ / "pipe.html";
    ASSERT_EQ(mkfifo(fifo.c_str(), 0600), 0);
    args_.input_path = fifo.string();
    args_.output_dir = (root_ / "out").string();

    EXPECT_EQ(run_remover(args_, logger_), kExitFatal);
    EXPECT_FALSE(fs::exists(root_ / "out"));
    EXPECT_NE(log().find("ERROR - Error: Invalid path type: " + fifo.string()), std::string::npos);
}

TEST_F(RunRemoverTest, OutputPathThatIsAFileIsFatal) {
    write_bytes(root_ / "page.html", "a<!-- x -->");
    write_bytes(root_ / "taken", "not a directory");
    args_.input_path = (root_ / "page.html").string();
    args_.output_dir = (root_ / "taken").string();

    EXPECT_EQ(run_remover(args_, logger_), kExitFatal);
    EXPECT_EQ(read_bytes(root_ / "taken"), "not a directory");
    EXPECT_EQ(read_bytes(root_ / "page.html"), "a<!-- x -->");
    EXPECT_NE(log().find("is not a directory"), std::string::npos);
}

TEST_F(RunRemoverTest, OutputDirCreationFailureIsFatal) {
    write_bytes(root_ / "page.html", "a<!-- x -->");
    write_bytes(root_ / "blocker", "file in the way");
    args_.input_path = (root_ / "page.html").string();
    args_.output_dir = (root_ / "blocker" / "out").string();

    EXPECT_EQ(run_remover(args_, logger_), kExitFatal);
    EXPECT_EQ(read_bytes(root_ / "page.html"), "a<!-- x -->");
    EXPECT_TRUE(fs::is_regular_file(root_ / "blocker"));
    EXPECT_NE(log().find("ERROR - Error creating output directory"), std::string::npos);
}

// Successful runs
TEST_F(RunRemoverTest, SingleFileIntoNewOutputDir) {
    write_bytes(root_ / "page.html", "<p>hi</p><!-- note -->");
    args_.input_path = (root_ / "page.html").string();
    args_.output_dir = (root_ / "out").string();

    EXPECT_EQ(run_remover(args_, logger_), kExitOk);
    EXPECT_EQ(read_bytes(root_ / "out" / "page.html"), "<p>hi</p>");
    EXPECT_EQ(read_bytes(root_ / "page.html"), "<p>hi</p><!-- note -->");
    EXPECT_NE(log().find("INFO - Created output directory: " + args_.output_dir), std::string::npos);
}

TEST_F(RunRemoverTest, PerFileFailuresKeepExitStatusZero) {
    write_bytes(root_ / "site" / "a.html", "\xFF<!-- x -->");
    write_bytes(root_ / "site" / "b.html", "b<!-- x -->");
    args_.input_path = (root_ / "site").string();

    EXPECT_EQ(run_remover(args_, logger_), kExitOk);
    EXPECT_EQ(read_bytes(root_ / "site" / "b.html"), "b");
    EXPECT_NE(log().find("ERROR - Error processing file"), std::string::npos);
}

TEST_F(RunRemoverTest, DirectoryWithFilterAndReport) {
    write_bytes(root_ / "site" / "a.html", "<!--KEEP--><!--DEBUG: remove--> text");
    write_bytes(root_ / "site" / "b.txt", "<!--DEBUG-->");
    args_.input_path = (root_ / "site").string();
    args_.specific_string = "DEBUG";
    args_.report_path = (root_ / "report.json").string();

    EXPECT_EQ(run_remover(args_, logger_), kExitOk);
    EXPECT_EQ(read_bytes(root_ / "site" / "a.html"), "<!--KEEP--> text");
    EXPECT_EQ(read_bytes(root_ / "site" / "b.txt"), "<!--DEBUG-->");
    EXPECT_NE(read_bytes(root_ / "report.json").find("\"comments_removed\": 1"), std::string::npos);
}
