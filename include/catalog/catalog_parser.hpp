#pragma once

#include "catalog/catalog_types.hpp"

#include <expected>
#include <string>
#include <vector>

namespace ipswdl {

class CatalogParser {
  public:
    std::expected<std::vector<Device>, std::string> ParseDevices(const std::string& json_input) const;

    // The returned listing keeps the catalog's name verbatim; callers sanitize.
    std::expected<FirmwareListing, std::string> ParseFirmwareListing(const std::string& json_input) const;
};

} // namespace ipswdl
