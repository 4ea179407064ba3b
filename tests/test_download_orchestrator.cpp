#include "download/download_orchestrator.hpp"
#include "testing.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <string>

namespace {

namespace fs = std::filesystem;

class DownloadOrchestratorTests : public ::testing::Test {
  protected:
    void SetUp() override {
        opt.download_path = tmp.Path() + "/ipsw";
        opt.verify_checksums = false;
    }

    void AddDevice(const std::string& name, const std::string& id, const std::string& body) {
        client.devices.push_back(testutil::MakeDevice(name, id));
        ipswdl::FirmwareListing l;
        l.name = name;
        l.identifier = id;
        l.firmwares.push_back(testutil::MakeEntry(id, "16.0", "X1", body.size()));
        client.listings[id] = l;
        client.bodies[id] = {.data = body, .declared = body.size(), .chunk = 8};
    }

    ipswdl::RunSummary Run() {
        ipswdl::DownloadOrchestrator orch(client, opt, cancel, status);
        return orch.Run(client.devices);
    }

    testutil::TemporaryDirectory tmp;
    testutil::FakeCatalogClient client;
    testutil::RecordingStatusSink status;
    ipswdl::CancellationSignal cancel;
    ipswdl::RunOptions opt;
};

TEST(SelectDevicesTest, FilterIsCaseSensitiveSubstring) {
    const std::vector<ipswdl::Device> devices = {
        testutil::MakeDevice("iPhone 1", "a"),
        testutil::MakeDevice("iPad Pro", "b"),
        testutil::MakeDevice("ipad mini", "c"),
    };

    auto all = ipswdl::SelectDevices(devices, std::nullopt);
    EXPECT_EQ(all.size(), 3u);

    auto ipad = ipswdl::SelectDevices(devices, std::string("iPad"));
    ASSERT_EQ(ipad.size(), 1u);
    EXPECT_EQ(ipad[0].name, "iPad Pro");
}

TEST_F(DownloadOrchestratorTests, FilterLimitsTotal) {
    AddDevice("iPhone 1", "iPhone1,1", "phone");
    AddDevice("iPad Pro", "iPad6,7", "tablet");
    opt.filter_term = "iPad";

    auto summary = Run();

    EXPECT_EQ(summary.total, 1u);
    EXPECT_EQ(summary.done, 1u);
    EXPECT_EQ(summary.completed, 1u);
    EXPECT_EQ(client.list_firmware_calls, 1);
    EXPECT_TRUE(fs::exists(opt.download_path + "/iPad Pro/16.0.ipsw"));
    EXPECT_FALSE(fs::exists(opt.download_path + "/iPhone 1"));
    EXPECT_TRUE(status.Contains("Ended work on: iPad Pro (1/1)"));
}

TEST_F(DownloadOrchestratorTests, ProcessesAllInCatalogOrder) {
    AddDevice("iPhone 1", "iPhone1,1", "phone");
    AddDevice("iPad Pro", "iPad6,7", "tablet");
    ASSERT_TRUE(testutil::WriteTextFile(opt.download_path + "/iPad Pro/16.0.ipsw", "tablet"));

    auto summary = Run();

    EXPECT_EQ(summary.total, 2u);
    EXPECT_EQ(summary.done, 2u);
    EXPECT_EQ(summary.completed, 1u);
    EXPECT_EQ(summary.skipped, 1u);
    EXPECT_FALSE(summary.interrupted);

    std::vector<std::string> ended;
    for (const auto& [tone, line] : status.lines) {
        if (line.rfind("Ended work on:", 0) == 0) ended.push_back(line);
    }
    ASSERT_EQ(ended.size(), 2u);
    EXPECT_EQ(ended[0], "Ended work on: iPhone 1 (1/2)");
    EXPECT_EQ(ended[1], "Ended work on: iPad Pro (2/2)");

    ASSERT_GE(status.lines.size(), 2u);
    EXPECT_EQ(status.lines[status.lines.size() - 2].second.rfind("Finished in ", 0), 0u);
    EXPECT_EQ(status.lines.back().second, "1 downloaded, 1 skipped, 0 failed");
}

TEST_F(DownloadOrchestratorTests, ListingFailureDoesNotStopRun) {
    AddDevice("iPhone 1", "iPhone1,1", "phone");
    AddDevice("iPad Pro", "iPad6,7", "tablet");
    client.listing_errors["iPhone1,1"] = "HTTP 500";

    auto summary = Run();

    EXPECT_EQ(summary.done, 2u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.completed, 1u);
    EXPECT_TRUE(status.Contains("Process errored when downloading firmware for iPhone 1. Description: HTTP 500"));
    EXPECT_TRUE(fs::exists(opt.download_path + "/iPad Pro/16.0.ipsw"));
}

TEST_F(DownloadOrchestratorTests, CancelledBeforeStartMakesNoCalls) {
    AddDevice("iPhone 1", "iPhone1,1", "phone");
    cancel.Trigger();

    auto summary = Run();

    EXPECT_TRUE(summary.interrupted);
    EXPECT_EQ(summary.done, 0u);
    EXPECT_EQ(client.list_firmware_calls, 0);
    EXPECT_EQ(client.open_calls, 0);
    EXPECT_TRUE(status.Contains("Finished in "));
}

TEST_F(DownloadOrchestratorTests, CancelDuringListingSkipsDownload) {
    AddDevice("iPhone 1", "iPhone1,1", "phone");
    AddDevice("iPad Pro", "iPad6,7", "tablet");
    client.on_list_firmware = [this](const ipswdl::Device&) { cancel.Trigger(); };

    auto summary = Run();

    EXPECT_TRUE(summary.interrupted);
    EXPECT_EQ(client.list_firmware_calls, 1);
    EXPECT_EQ(client.open_calls, 0);
    EXPECT_EQ(summary.done, 0u);
}

TEST_F(DownloadOrchestratorTests, CancelMidDownloadStopsLoop) {
    AddDevice("iPhone 1", "iPhone1,1", std::string(64, 'p'));
    AddDevice("iPad Pro", "iPad6,7", "tablet");
    client.bodies["iPhone1,1"].on_chunk = [this](std::uint64_t delivered) {
        if (delivered >= 16) cancel.Trigger();
    };

    auto summary = Run();

    EXPECT_TRUE(summary.interrupted);
    EXPECT_EQ(summary.done, 0u);
    EXPECT_EQ(summary.cancelled, 1u);
    EXPECT_EQ(client.list_firmware_calls, 1);
    EXPECT_FALSE(fs::exists(opt.download_path + "/iPhone 1/16.0.ipsw"));
    EXPECT_FALSE(status.Contains("Ended work on:"));
}

TEST_F(DownloadOrchestratorTests, RunReclaimsOrphanedStages) {
    AddDevice("iPhone 1", "iPhone1,1", "phone");
    const std::string orphan = opt.StagingDir() + "/ipswdl-Zz9Yy8.download";
    ASSERT_TRUE(testutil::WriteTextFile(orphan, std::string(4096, 'x')));

    auto summary = Run();

    EXPECT_EQ(summary.completed, 1u);
    EXPECT_FALSE(fs::exists(orphan));
    EXPECT_TRUE(testutil::ListDir(opt.StagingDir()).empty());
}

} // namespace
