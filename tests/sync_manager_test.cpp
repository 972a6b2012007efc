#include <gtest/gtest.h>
#include "sync_manager.hpp"
#include "configuration.hpp"
#include "mock_command_executor.hpp"
#include "log_capture.hpp"

#include <json/json.h>
#include <memory>

class SyncManagerTest : public ::testing::Test {
protected:
    static constexpr const char* PREFLIGHT = "preflight-check";

    std::shared_ptr<const Configuration> config;
    std::shared_ptr<MockCommandExecutor> executor;
    LogCapture log;
    HostSet hosts;

    void SetUp() override {
        config = std::make_shared<const Configuration>(Configuration::fromYaml(R"(
host1:
  f1: a/f1
  f2: a/f2
host2:
  f1: b/f1
host3:
  f2: c/f2
)"));
        executor = std::make_shared<MockCommandExecutor>();
        hosts = HostSet{"host1", {"host2", "host3"}};
    }

    SyncOptions options() const {
        SyncOptions opts;
        opts.preflightCommand = PREFLIGHT;
        return opts;
    }
};

// Test that the manager can be built
TEST_F(SyncManagerTest, Construction) {
    EXPECT_NO_THROW({
        SyncManager manager(config, options(), executor, log.logger());
    });
}

// Both directions by default, preflight once for the whole run
TEST_F(SyncManagerTest, RunsBothDirectionsForEveryHost) {
    SyncManager manager(config, options(), executor, log.logger());

    EXPECT_TRUE(manager.run(hosts));
    EXPECT_EQ(executor->countContaining(PREFLIGHT), 1u);
    EXPECT_EQ(executor->countContaining("host2:./b/f1"), 2u);
    EXPECT_EQ(executor->countContaining("host3:./c/f2"), 2u);
    EXPECT_EQ(executor->commands().size(), 5u);

    EXPECT_TRUE(log.contains("Started upload 'host1' --> 'host2'"));
    EXPECT_TRUE(log.contains("Started download 'host2' --> 'host1'"));
    EXPECT_TRUE(log.contains("Completed synchronization between 'host1' and 'host3'"));
}

TEST_F(SyncManagerTest, UploadOnly) {
    auto opts = options();
    opts.upOnly = true;
    SyncManager manager(config, opts, executor, log.logger());

    EXPECT_TRUE(manager.run(hosts));
    EXPECT_EQ(executor->commands().size(), 3u);
    EXPECT_FALSE(log.contains("Started download"));
}

TEST_F(SyncManagerTest, DownloadOnly) {
    auto opts = options();
    opts.downOnly = true;
    SyncManager manager(config, opts, executor, log.logger());

    EXPECT_TRUE(manager.run(hosts));
    EXPECT_FALSE(log.contains("Started upload"));
    EXPECT_TRUE(log.contains("Started download 'host3' --> 'host1'"));
}

// Both "only" flags together select both directions
TEST_F(SyncManagerTest, BothOnlyFlagsMeanBothDirections) {
    auto opts = options();
    opts.upOnly = true;
    opts.downOnly = true;
    EXPECT_TRUE(opts.performUp());
    EXPECT_TRUE(opts.performDown());
}

// Preflight output is logged but never stops the run
TEST_F(SyncManagerTest, PreflightOutputIsOnlyLogged) {
    executor->respondTo(PREFLIGHT, {"ssh agent ready\n", "checkssh: key expired\n", 1});
    SyncManager manager(config, options(), executor, log.logger());

    EXPECT_TRUE(manager.run(hosts));
    EXPECT_TRUE(log.contains("info: ssh agent ready"));
    EXPECT_TRUE(log.contains("error: checkssh: key expired"));
}

// An unreachable peer fails only its own host
TEST_F(SyncManagerTest, UnreachableHostDoesNotStopOthers) {
    executor->respondTo("host2:", {"", "ssh: connect to host host2 port 22: Connection refused\n", 255});
    SyncManager manager(config, options(), executor, log.logger());

    EXPECT_FALSE(manager.run(hosts));
    // the fatal upload does not cancel the download phase
    EXPECT_EQ(executor->countContaining("host2:"), 2u);
    EXPECT_TRUE(log.contains("warning: Completed synchronization between 'host1' and 'host2' with error(s)"));
    EXPECT_TRUE(log.contains("info: Completed synchronization between 'host1' and 'host3'"));

    const auto& report = manager.report();
    ASSERT_EQ(report.hosts().size(), 2u);
    EXPECT_FALSE(report.hosts()[0].success);
    EXPECT_TRUE(report.hosts()[1].success);
    EXPECT_FALSE(report.success());
}

TEST_F(SyncManagerTest, DryRunIsReportedAsSimulated) {
    auto opts = options();
    opts.dryRun = true;
    executor->respondTo("host3:", {"sending incremental file list\nnotes.txt\n", "", 0});
    SyncManager manager(config, opts, executor, log.logger());

    EXPECT_TRUE(manager.run(hosts));
    EXPECT_TRUE(log.contains("Simulated synchronization between 'host1' and 'host3'"));
    EXPECT_TRUE(log.contains("Would move"));
    EXPECT_EQ(executor->countContaining(" -n "), 4u);
}

// Hosts without shared elements still count as synchronized
TEST_F(SyncManagerTest, HostWithoutSharedElements) {
    config = std::make_shared<const Configuration>(Configuration::fromYaml("host1:\n  f1: a\nhost4:\n  f9: z\n"));
    SyncManager manager(config, options(), executor, log.logger());

    EXPECT_TRUE(manager.run(HostSet{"host1", {"host4"}}));
    EXPECT_EQ(executor->commands().size(), 1u); // preflight only
    EXPECT_EQ(log.count("do not share common elements"), 2u);
}

TEST_F(SyncManagerTest, ReportCoversEveryPhase) {
    SyncManager manager(config, options(), executor, log.logger());
    manager.run(hosts);

    auto json = manager.report().toJson();
    EXPECT_EQ(json["thisHost"].asString(), "host1");
    EXPECT_TRUE(json["success"].asBool());
    ASSERT_EQ(json["hosts"].size(), 2u);
    EXPECT_EQ(json["hosts"][0]["host"].asString(), "host2");
    ASSERT_EQ(json["hosts"][0]["phases"].size(), 2u);
    EXPECT_EQ(json["hosts"][0]["phases"][0]["direction"].asString(), "up");
    EXPECT_EQ(json["hosts"][0]["phases"][1]["direction"].asString(), "down");
    EXPECT_EQ(json["hosts"][0]["phases"][0]["tasks"].asUInt64(), 1u);
}

// Transfers dropped after an unreachable peer show up in the report
TEST_F(SyncManagerTest, ReportCountsSkippedTransfers) {
    config = std::make_shared<const Configuration>(Configuration::fromYaml(
        "host1:\n  f1: a/f1\n  f2: a/f2\n  f3: a/f3\nhost2:\n  f1: b/f1\n  f2: b/f2\n  f3: b/f3\n"));
    executor->respondTo("b/f1", {"", "ssh: connect to host host2 port 22: Connection refused\n", 255});
    auto opts = options();
    opts.upOnly = true;
    opts.concurrencyLimit = 1;
    SyncManager manager(config, opts, executor, log.logger());

    EXPECT_FALSE(manager.run(HostSet{"host1", {"host2"}}));
    auto json = manager.report().toJson();
    ASSERT_EQ(json["hosts"][0]["phases"].size(), 1u);
    EXPECT_TRUE(json["hosts"][0]["phases"][0]["fatal"].asBool());
    EXPECT_EQ(json["hosts"][0]["phases"][0]["tasks"].asUInt64(), 3u);
    EXPECT_EQ(json["hosts"][0]["phases"][0]["skipped"].asUInt64(), 2u);
}

// A failing executor costs its host, not the run
TEST_F(SyncManagerTest, ExecutorExceptionDoesNotEndRun) {
    executor->crashOn("host2:");
    SyncManager manager(config, options(), executor, log.logger());

    bool result = true;
    EXPECT_NO_THROW(result = manager.run(hosts));
    EXPECT_FALSE(result);
    EXPECT_EQ(executor->countContaining("host3:"), 2u);
    EXPECT_TRUE(log.contains("with error(s)"));
    EXPECT_TRUE(log.contains("info: Completed synchronization between 'host1' and 'host3'"));
}
