#pragma once

#include "catalog/byte_stream.hpp"
#include "catalog/catalog_types.hpp"
#include "util/result.hpp"

#include <memory>
#include <vector>

namespace ipswdl {

class ICatalogClient {
public:
    virtual ~ICatalogClient() = default;

    virtual Result ListDevices(std::vector<Device>& out) = 0;

    // On success out.name is already sanitized and out.firmwares is newest-first.
    virtual Result ListFirmware(const Device& device, FirmwareListing& out) = 0;

    virtual Result OpenDownloadStream(const FirmwareEntry& entry,
                                      std::unique_ptr<IByteStream>& out) = 0;
};

} // namespace ipswdl
