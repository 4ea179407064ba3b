#include "download/firmware_materializer.hpp"

#include "crypto/digest.hpp"
#include "io/staging_file.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace ipswdl {

namespace fs = std::filesystem;

FirmwareMaterializer::FirmwareMaterializer(ICatalogClient& client,
                                           const RunOptions& options,
                                           const CancellationSignal& cancel,
                                           IStatusSink& status,
                                           IProgress* progress)
    : client_(client), options_(options), cancel_(cancel), status_(status), progress_(progress) {}

void FirmwareMaterializer::SetRunPosition(std::uint32_t index, std::uint32_t total) {
    run_index_ = index;
    run_total_ = total;
}

std::string FirmwareMaterializer::FinalPathFor(const FirmwareListing& listing) const {
    if (listing.firmwares.empty()) return {};
    const std::string file = SanitizeDisplayName(listing.firmwares.front().version) + ".ipsw";
    return (fs::path(options_.download_path) / SanitizeDisplayName(listing.name) / file).string();
}

DownloadOutcome FirmwareMaterializer::Fail(const FirmwareListing& listing,
                                           ErrorKind kind,
                                           std::string message) {
    switch (kind) {
        case ErrorKind::RemoteUnavailable: {
            const auto& fw = listing.firmwares.front();
            status_.Emit(StatusTone::Failure,
                         "Downloading " + listing.name + " " + fw.identifier +
                             " errored on Apples API. Skipping download... (" + message + ")");
            break;
        }
        case ErrorKind::Cancelled:
            status_.Emit(StatusTone::Failure, "Download of " + listing.name + " cancelled");
            break;
        case ErrorKind::ChecksumMismatch:
        case ErrorKind::IoError:
            status_.Emit(StatusTone::Failure,
                         "Process errored when downloading firmware for " + listing.name +
                             ". Description: " + message);
            break;
    }
    LogWarn("%s: %s: %s", listing.name.c_str(), ErrorKindName(kind), message.c_str());
    return Failed{.kind = kind, .message = std::move(message)};
}

DownloadOutcome FirmwareMaterializer::Materialize(const FirmwareListing& listing) {
    if (listing.firmwares.empty()) {
        status_.Emit(StatusTone::Notice, listing.name + " has no firmware for download");
        return Skipped{kReasonNoFirmware};
    }

    const FirmwareEntry& fw = listing.firmwares.front();
    const std::string final_path = FinalPathFor(listing);

    std::error_code ec;
    if (fs::exists(final_path, ec)) {
        status_.Emit(StatusTone::Muted, listing.name + " is already downloaded, skipping");
        return Skipped{kReasonAlreadyDownloaded};
    }

    status_.Emit(StatusTone::Emphasis, "Beginning to download " + listing.name + " " + fw.version + "...");
    LogInfo("%s: %s (%s) -> %s", listing.name.c_str(), fw.version.c_str(), fw.buildid.c_str(),
            final_path.c_str());

    StagingFile stage;
    if (auto r = StagingFile::Create(options_.StagingDir(), stage); !r.is_ok()) {
        return Fail(listing, ErrorKind::IoError, r.message());
    }
    LogDebug("staging %s at %s", listing.name.c_str(), stage.Path().c_str());

    std::unique_ptr<IByteStream> stream;
    if (auto r = client_.OpenDownloadStream(fw, stream); !r.is_ok() || !stream) {
        return Fail(listing, ErrorKind::RemoteUnavailable,
                    r.is_ok() ? std::string("no stream returned") : r.message());
    }

    bool cancelled = false;
    std::uint64_t received = 0;
    ErrorKind failure = ErrorKind::RemoteUnavailable;
    if (auto r = ReceiveBody(listing, *stream, stage.Writer(), cancelled, received, failure); !r.is_ok()) {
        return Fail(listing, failure, r.message());
    }
    if (cancelled) {
        stage.Discard();
        return Fail(listing, ErrorKind::Cancelled, "interrupted");
    }

    const std::uint64_t declared = stream->DeclaredLength();
    if (declared > 0 && received != declared) {
        return Fail(listing, ErrorKind::RemoteUnavailable,
                    "stream ended after " + std::to_string(received) + " of " +
                        std::to_string(declared) + " bytes");
    }

    if (options_.verify_checksums) {
        bool matched = true;
        if (auto r = VerifyStage(fw, stage.Reader(), matched); !r.is_ok()) {
            return Fail(listing, ErrorKind::IoError, r.message());
        }
        if (!matched) {
            return Fail(listing, ErrorKind::ChecksumMismatch,
                        "staged bytes do not match the published checksum");
        }
    }

    if (options_.delete_old_fw) {
        DeleteStaleFiles(listing, final_path);
    }

    const fs::path device_dir = fs::path(final_path).parent_path();
    fs::create_directories(device_dir, ec);
    if (ec) {
        return Fail(listing, ErrorKind::IoError,
                    "cannot create " + device_dir.string() + ": " + ec.message());
    }

    if (auto r = stage.Promote(final_path); !r.is_ok()) {
        return Fail(listing, ErrorKind::IoError, r.message());
    }

    status_.Emit(StatusTone::Success,
                 "Downloaded " + listing.name + " " + fw.version + " (" + std::to_string(received) + " bytes)");
    LogInfo("%s: stored %s", listing.name.c_str(), final_path.c_str());
    return Completed{.bytes_written = received};
}

Result FirmwareMaterializer::ReceiveBody(const FirmwareListing& listing,
                                         IByteStream& stream,
                                         IWriter& writer,
                                         bool& cancelled,
                                         std::uint64_t& received,
                                         ErrorKind& failure) {
    cancelled = false;
    received = 0;
    const std::uint64_t declared = stream.DeclaredLength();

    StreamEvent ev;
    for (;;) {
        if (cancel_.Triggered()) {
            cancelled = true;
            return Result::Ok();
        }

        if (auto r = stream.WaitNext(cancel_.WaitFd(), ev); !r.is_ok()) {
            failure = ErrorKind::RemoteUnavailable;
            return r;
        }

        switch (ev.kind) {
            case StreamEvent::Kind::Woken:
                if (cancel_.Triggered()) {
                    cancelled = true;
                    return Result::Ok();
                }
                continue;
            case StreamEvent::Kind::End:
                return Result::Ok();
            case StreamEvent::Kind::Chunk:
                break;
        }

        if (ev.data.empty()) continue;
        if (auto w = writer.WriteAll(ev.data); !w.is_ok()) {
            failure = ErrorKind::IoError;
            return w;
        }
        received += ev.data.size();

        if (progress_) {
            progress_->OnProgress(ProgressEvent{
                .device = listing.name,
                .bytes_done = received,
                .bytes_total = declared,
                .device_index = run_index_,
                .device_total = run_total_,
            });
        }
    }
}

Result FirmwareMaterializer::VerifyStage(const FirmwareEntry& entry, FileReader& reader, bool& matched) {
    matched = true;

    DigestAlgorithm alg = DigestAlgorithm::Sha1;
    const std::string* expected = &entry.sha1sum;
    if (expected->empty()) {
        alg = DigestAlgorithm::Md5;
        expected = &entry.md5sum;
    }
    if (expected->empty()) {
        LogDebug("%s: no published checksum, skipping verification", entry.identifier.c_str());
        return Result::Ok();
    }

    if (auto r = reader.Rewind(); !r.is_ok()) return r;

    const std::string actual = DigestHex(alg, reader);
    if (actual.empty()) {
        return Result::Fail(-1, std::string("failed to compute ") + DigestName(alg) + " of staged file");
    }

    matched = DigestEquals(actual, *expected);
    if (!matched) {
        LogError("%s mismatch for %s: expected %s, got %s", DigestName(alg), entry.identifier.c_str(),
                 expected->c_str(), actual.c_str());
    } else {
        LogDebug("%s verified for %s", DigestName(alg), entry.identifier.c_str());
    }
    return Result::Ok();
}

void FirmwareMaterializer::DeleteStaleFiles(const FirmwareListing& listing, const std::string& keep_path) {
    const fs::path device_dir = fs::path(keep_path).parent_path();

    std::error_code ec;
    fs::directory_iterator it(device_dir, ec);
    if (ec) {
        // Nothing downloaded for this device yet.
        if (ec != std::errc::no_such_file_or_directory) {
            LogWarn("cannot list %s: %s", device_dir.c_str(), ec.message().c_str());
        }
        return;
    }

    for (const auto& entry : it) {
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec)) continue;
        if (entry.path() == fs::path(keep_path)) continue;

        const std::string old_name = entry.path().filename().string();
        std::error_code rm_ec;
        if (fs::remove(entry.path(), rm_ec)) {
            status_.Emit(StatusTone::Removed, "deleted old file " + old_name);
            LogInfo("%s: removed %s", listing.name.c_str(), entry.path().c_str());
        } else {
            status_.Emit(StatusTone::Failure, "failed to delete old file " + old_name);
            LogWarn("%s: cannot remove %s: %s", listing.name.c_str(), entry.path().c_str(),
                    rm_ec.message().c_str());
        }
    }
}

} // namespace ipswdl
