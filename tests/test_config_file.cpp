#include "testing.hpp"
#include "util/config_file.hpp"

#include <gtest/gtest.h>

namespace {

using ipswdl::config::ConfigFile;

TEST(ConfigFileTest, AppliesPresentKeysOnly) {
    ConfigFile cfg;
    auto r = cfg.LoadString(R"({"DownloadPath":"/srv/ipsw","DeleteOldFirmware":true,
                               "VerifyChecksums":false,"ConnectTimeoutSec":30})",
                            "inline");
    ASSERT_TRUE(r.ok) << r.msg;

    ipswdl::RunOptions opt;
    cfg.ApplyTo(opt);
    EXPECT_EQ(opt.download_path, "/srv/ipsw");
    EXPECT_TRUE(opt.delete_old_fw);
    EXPECT_FALSE(opt.verify_checksums);
    EXPECT_EQ(opt.connect_timeout_sec, 30);
    EXPECT_TRUE(opt.progress);
    EXPECT_FALSE(opt.log_path.has_value());
    EXPECT_EQ(opt.StagingDir(), "/srv/ipsw/.staging");
}

TEST(ConfigFileTest, StagingDirOverridesDefault) {
    ConfigFile cfg;
    ASSERT_TRUE(cfg.LoadString(R"({"StagingDir":"/var/tmp/ipswdl"})", "inline").ok);
    ipswdl::RunOptions opt;
    cfg.ApplyTo(opt);
    EXPECT_EQ(opt.StagingDir(), "/var/tmp/ipswdl");
}

TEST(ConfigFileTest, WrongTypeFailsAndResets) {
    ConfigFile cfg;
    auto r = cfg.LoadString(R"({"DownloadPath":"/a","DeleteOldFirmware":"yes"})", "inline");
    ASSERT_FALSE(r.ok);
    EXPECT_NE(r.msg.find("DeleteOldFirmware"), std::string::npos);
    EXPECT_FALSE(cfg.download_path.has_value());
}

TEST(ConfigFileTest, NonObjectRootFails) {
    ConfigFile cfg;
    EXPECT_FALSE(cfg.LoadString("[1,2]", "inline").ok);
    EXPECT_FALSE(cfg.LoadString("{oops", "inline").ok);
}

TEST(ConfigFileTest, LoadFileReadsDisk) {
    testutil::TemporaryDirectory tmp;
    const std::string p = tmp.Path() + "/ipswdl.json";
    ASSERT_TRUE(testutil::WriteTextFile(p, R"({"CatalogBaseUrl":"http://127.0.0.1:9/v4","Progress":false})"));

    ConfigFile cfg;
    ASSERT_TRUE(cfg.LoadFile(p).ok);
    ipswdl::RunOptions opt;
    cfg.ApplyTo(opt);
    EXPECT_EQ(opt.catalog_base_url, "http://127.0.0.1:9/v4");
    EXPECT_FALSE(opt.progress);

    EXPECT_FALSE(cfg.LoadFile(tmp.Path() + "/missing.json").ok);
}

} // namespace
