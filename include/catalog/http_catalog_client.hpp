#pragma once

#include "catalog/catalog_client.hpp"
#include "catalog/catalog_parser.hpp"
#include "catalog/http_byte_stream.hpp"

#include <string>

namespace ipswdl {

inline constexpr const char* kDefaultCatalogBaseUrl = "https://api.ipsw.me/v4";

// Catalog client for the ipsw.me v4 REST API, implemented with libcurl.
class HttpCatalogClient final : public ICatalogClient {
public:
    struct Options {
        std::string base_url = kDefaultCatalogBaseUrl;
        HttpTransferOptions transfer;
    };

    explicit HttpCatalogClient(Options opt);

    Result ListDevices(std::vector<Device>& out) override;
    Result ListFirmware(const Device& device, FirmwareListing& out) override;
    Result OpenDownloadStream(const FirmwareEntry& entry,
                              std::unique_ptr<IByteStream>& out) override;

private:
    Result GetText(const std::string& url, std::string& out) const;
    std::string Escape(const std::string& s) const;

    Options opt_;
    CatalogParser parser_;
};

} // namespace ipswdl
