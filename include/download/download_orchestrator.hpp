#pragma once

#include "catalog/catalog_client.hpp"
#include "download/firmware_materializer.hpp"
#include "download/status_sink.hpp"
#include "system/cancellation.hpp"
#include "util/run_options.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ipswdl {

struct RunSummary {
    std::uint32_t total = 0;
    std::uint32_t done = 0;
    std::uint32_t completed = 0;
    std::uint32_t skipped = 0;
    std::uint32_t failed = 0;
    std::uint32_t cancelled = 0;
    bool interrupted = false;
};

// Case-sensitive substring filter on display names; no term keeps every device.
std::vector<Device> SelectDevices(const std::vector<Device>& devices,
                                  const std::optional<std::string>& filter_term);

// Walks the selected devices in catalog order, one at a time. Device-level
// failures are reported and skipped over; only cancellation ends the walk early.
class DownloadOrchestrator {
public:
    DownloadOrchestrator(ICatalogClient& client,
                         const RunOptions& options,
                         const CancellationSignal& cancel,
                         IStatusSink& status,
                         IProgress* progress = nullptr);

    RunSummary Run(const std::vector<Device>& devices);

private:
    ICatalogClient& client_;
    const RunOptions& options_;
    const CancellationSignal& cancel_;
    IStatusSink& status_;
    FirmwareMaterializer materializer_;
};

} // namespace ipswdl
