#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace ipswdl {

inline constexpr const char* kReasonNoFirmware = "no firmware available";
inline constexpr const char* kReasonAlreadyDownloaded = "already downloaded";

enum class ErrorKind {
    RemoteUnavailable,
    IoError,
    Cancelled,
    ChecksumMismatch,
};

const char* ErrorKindName(ErrorKind kind);

struct Skipped {
    std::string reason;
};

struct Completed {
    std::uint64_t bytes_written = 0;
};

struct Failed {
    ErrorKind kind = ErrorKind::IoError;
    std::string message;
};

// Result of processing one device in one run. Never persisted.
using DownloadOutcome = std::variant<Skipped, Completed, Failed>;

inline bool IsCancelled(const DownloadOutcome& o) {
    const auto* f = std::get_if<Failed>(&o);
    return f && f->kind == ErrorKind::Cancelled;
}

std::string Describe(const DownloadOutcome& o);

} // namespace ipswdl
