#include "catalog/catalog_parser.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>

namespace ipswdl {

using json = nlohmann::json;

namespace {

bool IsBlank(const std::string& s) {
    return s.find_first_not_of(" \t\n\r") == std::string::npos;
}

std::expected<std::string, std::string> RequireString(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return std::unexpected(std::string("missing field '") + key + "'");
    }
    if (!it->is_string()) {
        return std::unexpected(std::string("field '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

template <typename T>
std::expected<T, std::string> RequireUnsigned(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return std::unexpected(std::string("missing field '") + key + "'");
    }
    if (!it->is_number_unsigned()) {
        return std::unexpected(std::string("field '") + key + "' must be an unsigned number");
    }
    const auto wide = it->get<std::uint64_t>();
    if (wide > std::numeric_limits<T>::max()) {
        return std::unexpected(std::string("field '") + key + "' is out of range");
    }
    return static_cast<T>(wide);
}

std::string OptionalString(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

std::expected<Device, std::string> ParseDevice(const json& item) {
    if (!item.is_object()) {
        return std::unexpected("device entry must be an object");
    }

    Device d;
    auto name = RequireString(item, "name");
    if (!name) return std::unexpected(name.error());
    d.name = std::move(*name);

    auto identifier = RequireString(item, "identifier");
    if (!identifier) return std::unexpected(identifier.error());
    d.identifier = std::move(*identifier);

    d.platform = OptionalString(item, "platform");

    auto cpid = RequireUnsigned<std::uint32_t>(item, "cpid");
    if (!cpid) return std::unexpected(cpid.error());
    d.cpid = *cpid;

    auto bdid = RequireUnsigned<std::uint32_t>(item, "bdid");
    if (!bdid) return std::unexpected(bdid.error());
    d.bdid = *bdid;

    return d;
}

std::expected<FirmwareEntry, std::string> ParseFirmwareEntry(const json& item) {
    if (!item.is_object()) {
        return std::unexpected("firmware entry must be an object");
    }

    FirmwareEntry f;
    auto identifier = RequireString(item, "identifier");
    if (!identifier) return std::unexpected(identifier.error());
    f.identifier = std::move(*identifier);

    auto version = RequireString(item, "version");
    if (!version) return std::unexpected(version.error());
    f.version = std::move(*version);

    auto buildid = RequireString(item, "buildid");
    if (!buildid) return std::unexpected(buildid.error());
    f.buildid = std::move(*buildid);

    auto filesize = RequireUnsigned<std::uint64_t>(item, "filesize");
    if (!filesize) return std::unexpected(filesize.error());
    f.filesize = *filesize;

    f.sha1sum = OptionalString(item, "sha1sum");
    f.md5sum = OptionalString(item, "md5sum");
    f.url = OptionalString(item, "url");
    f.uploaddate = OptionalString(item, "uploaddate");
    return f;
}

} // namespace

std::expected<std::vector<Device>, std::string> CatalogParser::ParseDevices(const std::string& json_input) const {
    try {
        if (IsBlank(json_input)) {
            return std::unexpected("Empty input");
        }

        auto j = json::parse(json_input);
        if (!j.is_array()) {
            return std::unexpected("device list must be a JSON array");
        }

        std::vector<Device> out;
        out.reserve(j.size());
        for (const auto& item : j) {
            auto d = ParseDevice(item);
            if (!d) return std::unexpected("device #" + std::to_string(out.size()) + ": " + d.error());
            out.push_back(std::move(*d));
        }
        return out;
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Internal Error: ") + e.what());
    }
}

std::expected<FirmwareListing, std::string> CatalogParser::ParseFirmwareListing(const std::string& json_input) const {
    try {
        if (IsBlank(json_input)) {
            return std::unexpected("Empty input");
        }

        auto j = json::parse(json_input);
        if (!j.is_object()) {
            return std::unexpected("firmware listing must be a JSON object");
        }

        FirmwareListing l;
        auto name = RequireString(j, "name");
        if (!name) return std::unexpected(name.error());
        l.name = std::move(*name);

        auto identifier = RequireString(j, "identifier");
        if (!identifier) return std::unexpected(identifier.error());
        l.identifier = std::move(*identifier);

        l.platform = OptionalString(j, "platform");
        l.boardconfig = OptionalString(j, "boardconfig");
        l.cpid = j.value("cpid", 0U);
        l.bdid = j.value("bdid", 0U);

        auto it = j.find("firmwares");
        if (it == j.end()) {
            return std::unexpected("missing field 'firmwares'");
        }
        if (!it->is_array()) {
            return std::unexpected("'firmwares' must be an array");
        }

        l.firmwares.reserve(it->size());
        for (const auto& item : *it) {
            auto f = ParseFirmwareEntry(item);
            if (!f) {
                return std::unexpected("firmware #" + std::to_string(l.firmwares.size()) + ": " + f.error());
            }
            l.firmwares.push_back(std::move(*f));
        }
        return l;
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Internal Error: ") + e.what());
    }
}

} // namespace ipswdl
