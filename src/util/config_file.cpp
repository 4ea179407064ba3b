#include "util/config_file.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace ipswdl::config {

namespace {

bool GetStringIfPresent(const nlohmann::json& j, const char* key,
                        std::optional<std::string>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key,
                     std::optional<std::uint64_t>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_number_unsigned()) {
        err = std::string(key) + " must be a non-negative integer";
        return false;
    }
    out = it->get<std::uint64_t>();
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key,
                      std::optional<bool>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

} // namespace

void ConfigFile::Reset() {
    *this = ConfigFile{};
}

Result ConfigFile::LoadFile(const std::string& path) {
    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(-1, "cannot open config: " + path);
    }
    std::ostringstream ss;
    ss << is.rdbuf();
    return LoadString(ss.str(), path);
}

Result ConfigFile::LoadString(const std::string& json_text, const std::string& origin) {
    Reset();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const std::exception& e) {
        return Result::Fail(-1, "invalid JSON in " + origin + ": " + e.what());
    }
    if (!j.is_object()) {
        return Result::Fail(-1, "config root must be a JSON object: " + origin);
    }

    std::string err;
    const bool ok = GetStringIfPresent(j, "DownloadPath", download_path, err) &&
                    GetBoolIfPresent(j, "DeleteOldFirmware", delete_old_fw, err) &&
                    GetStringIfPresent(j, "LogPath", log_path, err) &&
                    GetStringIfPresent(j, "StagingDir", staging_dir, err) &&
                    GetBoolIfPresent(j, "VerifyChecksums", verify_checksums, err) &&
                    GetStringIfPresent(j, "CatalogBaseUrl", catalog_base_url, err) &&
                    GetU64IfPresent(j, "ConnectTimeoutSec", connect_timeout_sec, err) &&
                    GetBoolIfPresent(j, "Progress", progress, err);
    if (!ok) {
        Reset();
        return Result::Fail(-1, err + " in " + origin);
    }
    return Result::Ok();
}

void ConfigFile::ApplyTo(RunOptions& opt) const {
    if (download_path) opt.download_path = *download_path;
    if (delete_old_fw) opt.delete_old_fw = *delete_old_fw;
    if (log_path) opt.log_path = *log_path;
    if (staging_dir) opt.staging_dir = *staging_dir;
    if (verify_checksums) opt.verify_checksums = *verify_checksums;
    if (catalog_base_url) opt.catalog_base_url = *catalog_base_url;
    if (connect_timeout_sec) opt.connect_timeout_sec = static_cast<long>(*connect_timeout_sec);
    if (progress) opt.progress = *progress;
}

} // namespace ipswdl::config
