#pragma once

#include <optional>
#include <string>

namespace ipswdl {

inline constexpr const char* kDefaultDownloadPath = "./ipsw";
inline constexpr const char* kStagingDirName = ".staging";

// Read-only configuration of one run, assembled from the config file and CLI.
struct RunOptions {
    std::string download_path = kDefaultDownloadPath;
    bool delete_old_fw = false;
    std::optional<std::string> filter_term;
    std::optional<std::string> log_path;

    // Defaults to "<download_path>/.staging" so promotion is a same-volume rename.
    std::optional<std::string> staging_dir;
    bool verify_checksums = true;
    bool progress = true;
    // Empty selects the catalog client's built-in endpoint.
    std::string catalog_base_url;
    long connect_timeout_sec = 15;

    std::string StagingDir() const {
        if (staging_dir && !staging_dir->empty()) return *staging_dir;
        return download_path + "/" + kStagingDirName;
    }
};

} // namespace ipswdl
