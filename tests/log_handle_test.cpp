#include <gtest/gtest.h>
#include "log_handle.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

class LogHandleTest : public ::testing::Test {
protected:
    fs::path testDir;

    void SetUp() override {
        testDir = fs::temp_directory_path() / "hostsync_log_test";
        fs::create_directories(testDir);
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }

    static std::string readFile(const fs::path& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(LogHandleTest, WritesToFile) {
    auto path = testDir / "sync.log";
    {
        LoggingOptions options;
        options.console = false;
        options.file = path.string();
        LogHandle handle(options);
        handle.logger()->info("hello from the sync");
        handle.logger()->debug("hidden without verbose");
    }

    auto content = readFile(path);
    EXPECT_NE(content.find("info: hello from the sync"), std::string::npos);
    EXPECT_EQ(content.find("hidden without verbose"), std::string::npos);
}

TEST_F(LogHandleTest, VerboseEnablesDebug) {
    auto path = testDir / "verbose.log";
    {
        LoggingOptions options;
        options.verbose = true;
        options.console = false;
        options.file = path.string();
        LogHandle handle(options);
        handle.logger()->debug("now visible");
    }
    EXPECT_NE(readFile(path).find("now visible"), std::string::npos);
}

// The log file is appended to across runs
TEST_F(LogHandleTest, AppendsToExistingFile) {
    auto path = testDir / "append.log";
    for (const auto* message : {"first run", "second run"}) {
        LoggingOptions options;
        options.console = false;
        options.file = path.string();
        LogHandle handle(options);
        handle.logger()->info(message);
    }
    auto content = readFile(path);
    EXPECT_NE(content.find("first run"), std::string::npos);
    EXPECT_NE(content.find("second run"), std::string::npos);
}

TEST_F(LogHandleTest, NoSinksStillLogs) {
    LoggingOptions options;
    options.console = false;
    LogHandle handle(options);
    ASSERT_NE(handle.logger(), nullptr);
    EXPECT_NO_THROW(handle.logger()->warn("goes nowhere"));
}

TEST_F(LogHandleTest, UnwritableFileThrows) {
    LoggingOptions options;
    options.console = false;
    options.file = (testDir / "missing" / "dir" / "x.log").string();
    // basic_file_sink creates missing parents, a file in the way cannot be
    std::ofstream(testDir / "missing") << "blocker";
    EXPECT_THROW(LogHandle handle(options), spdlog::spdlog_ex);
}
