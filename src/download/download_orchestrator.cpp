#include "download/download_orchestrator.hpp"

#include "download/run_report.hpp"
#include "io/staging_file.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

namespace ipswdl {

std::vector<Device> SelectDevices(const std::vector<Device>& devices,
                                  const std::optional<std::string>& filter_term) {
    if (!filter_term) return devices;

    std::vector<Device> out;
    for (const auto& d : devices) {
        if (d.name.find(*filter_term) != std::string::npos) out.push_back(d);
    }
    return out;
}

DownloadOrchestrator::DownloadOrchestrator(ICatalogClient& client,
                                           const RunOptions& options,
                                           const CancellationSignal& cancel,
                                           IStatusSink& status,
                                           IProgress* progress)
    : client_(client),
      options_(options),
      cancel_(cancel),
      status_(status),
      materializer_(client, options, cancel, status, progress) {}

RunSummary DownloadOrchestrator::Run(const std::vector<Device>& devices) {
    const std::vector<Device> selected = SelectDevices(devices, options_.filter_term);
    RunReport report(static_cast<std::uint32_t>(selected.size()));
    bool interrupted = false;

    LogInfo("processing %zu of %zu devices", selected.size(), devices.size());

    if (const std::size_t n = StagingFile::ReclaimOrphans(options_.StagingDir()); n > 0) {
        LogInfo("reclaimed %zu orphaned stage file(s)", n);
    }

    std::uint32_t position = 0;
    for (const auto& device : selected) {
        if (cancel_.Triggered()) {
            interrupted = true;
            break;
        }
        ++position;

        FirmwareListing listing;
        DownloadOutcome outcome;
        if (auto r = client_.ListFirmware(device, listing); !r.is_ok()) {
            const std::string name = SanitizeDisplayName(device.name);
            status_.Emit(StatusTone::Failure,
                         "Process errored when downloading firmware for " + name +
                             ". Description: " + r.message());
            LogWarn("listing for %s failed: %s", device.identifier.c_str(), r.message().c_str());
            outcome = Failed{.kind = ErrorKind::RemoteUnavailable, .message = r.message()};
            listing.name = name;
        } else {
            if (cancel_.Triggered()) {
                interrupted = true;
                break;
            }
            materializer_.SetRunPosition(position, report.Total());
            outcome = materializer_.Materialize(listing);
        }

        LogDebug("%s: %s", listing.name.c_str(), Describe(outcome).c_str());
        report.Record(outcome);
        if (IsCancelled(outcome)) {
            interrupted = true;
            break;
        }
        status_.Emit(StatusTone::Plain, report.ProgressLine(listing.name));
    }

    status_.Emit(StatusTone::Plain, report.ElapsedLine());
    status_.Emit(StatusTone::Plain, report.TallyLine());

    return RunSummary{
        .total = report.Total(),
        .done = report.Done(),
        .completed = report.CompletedCount(),
        .skipped = report.SkippedCount(),
        .failed = report.FailedCount(),
        .cancelled = report.CancelledCount(),
        .interrupted = interrupted,
    };
}

} // namespace ipswdl
