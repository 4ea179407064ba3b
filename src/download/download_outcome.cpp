#include "download/download_outcome.hpp"

namespace ipswdl {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::RemoteUnavailable: return "remote unavailable";
        case ErrorKind::IoError:           return "io error";
        case ErrorKind::Cancelled:         return "cancelled";
        case ErrorKind::ChecksumMismatch:  return "checksum mismatch";
    }
    return "error";
}

std::string Describe(const DownloadOutcome& o) {
    if (const auto* s = std::get_if<Skipped>(&o)) {
        return "skipped: " + s->reason;
    }
    if (const auto* c = std::get_if<Completed>(&o)) {
        return "completed: " + std::to_string(c->bytes_written) + " bytes";
    }
    const auto& f = std::get<Failed>(o);
    return std::string("failed (") + ErrorKindName(f.kind) + "): " + f.message;
}

} // namespace ipswdl
