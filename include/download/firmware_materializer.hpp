#pragma once

#include "catalog/catalog_client.hpp"
#include "download/download_outcome.hpp"
#include "download/progress.hpp"
#include "download/status_sink.hpp"
#include "io/file_reader.hpp"
#include "io/io.hpp"
#include "system/cancellation.hpp"
#include "util/run_options.hpp"

#include <cstdint>
#include <string>

namespace ipswdl {

// Turns the newest entry of a firmware listing into
// <download_path>/<name>/<version>.ipsw. Bytes land in a staging file first
// and only reach the final path through Promote(), so a cancelled or failed
// download never leaves a partial file behind.
class FirmwareMaterializer {
public:
    FirmwareMaterializer(ICatalogClient& client,
                         const RunOptions& options,
                         const CancellationSignal& cancel,
                         IStatusSink& status,
                         IProgress* progress = nullptr);

    // Position reported alongside byte progress.
    void SetRunPosition(std::uint32_t index, std::uint32_t total);

    DownloadOutcome Materialize(const FirmwareListing& listing);

    std::string FinalPathFor(const FirmwareListing& listing) const;

private:
    DownloadOutcome Fail(const FirmwareListing& listing, ErrorKind kind, std::string message);
    Result ReceiveBody(const FirmwareListing& listing,
                       IByteStream& stream,
                       IWriter& writer,
                       bool& cancelled,
                       std::uint64_t& received,
                       ErrorKind& failure);
    Result VerifyStage(const FirmwareEntry& entry, FileReader& reader, bool& matched);
    void DeleteStaleFiles(const FirmwareListing& listing, const std::string& keep_path);

    ICatalogClient& client_;
    const RunOptions& options_;
    const CancellationSignal& cancel_;
    IStatusSink& status_;
    IProgress* progress_;

    std::uint32_t run_index_ = 0;
    std::uint32_t run_total_ = 0;
};

} // namespace ipswdl
