#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ipswdl {

struct Device {
    std::string name;
    std::string identifier;
    std::string platform;
    std::uint32_t cpid = 0;
    std::uint32_t bdid = 0;
};

struct FirmwareEntry {
    std::string identifier;
    std::string version;
    std::string buildid;
    std::string sha1sum;
    std::string md5sum;
    std::uint64_t filesize = 0;
    std::string url;
    std::string uploaddate; // ISO-8601 as served by the catalog
};

// Firmware images available for one device. `name` is the sanitized display
// name and `firmwares` is newest-first as served by the catalog.
struct FirmwareListing {
    std::string name;
    std::string identifier;
    std::string platform;
    std::string boardconfig;
    std::uint32_t cpid = 0;
    std::uint32_t bdid = 0;
    std::vector<FirmwareEntry> firmwares;
};

} // namespace ipswdl
