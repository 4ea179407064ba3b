#pragma once

#include "util/result.hpp"
#include "util/run_options.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace ipswdl::config {

// Environment variable naming a config file when -c is not given.
inline constexpr const char* kConfigEnvVar = "IPSWDL_CONFIG";

// Values read from a JSON config file. Absent keys stay unset so that CLI
// flags and built-in defaults can fill them.
struct ConfigFile {
    std::optional<std::string> download_path;
    std::optional<bool> delete_old_fw;
    std::optional<std::string> log_path;
    std::optional<std::string> staging_dir;
    std::optional<bool> verify_checksums;
    std::optional<std::string> catalog_base_url;
    std::optional<std::uint64_t> connect_timeout_sec;
    std::optional<bool> progress;

    void Reset();
    Result LoadFile(const std::string& path);
    Result LoadString(const std::string& json_text, const std::string& origin);

    void ApplyTo(RunOptions& opt) const;
};

} // namespace ipswdl::config
