// file_writer.cpp - Writer implementation for staged and promoted files.

#include "io/file_writer.hpp"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace ipswdl {

Result FileWriter::Open(std::string path, FileWriter& out) {
    out.path_ = std::move(path);
    out.written_ = 0;

    int fd = ::open(out.path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Result::Errno(errno, "Failed to open output: " + out.path_);
    }
    out.fd_.Reset(fd);
    return Result::Ok();
}

FileWriter FileWriter::Adopt(Fd fd, std::string path) {
    FileWriter w;
    w.fd_ = std::move(fd);
    w.path_ = std::move(path);
    return w;
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            written_ += static_cast<std::uint64_t>(n);
            continue;
        }
        if (n == 0) {
            return Result::Errno(EIO, "Write made no progress: " + path_);
        }
        if (errno == EINTR) {
            continue;
        }
        return Result::Errno(errno, "Write failed: " + path_);
    }

    return Result::Ok();
}

Result FileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        return Result::Errno(errno, "fsync failed: " + path_);
    }
    return Result::Ok();
}

} // namespace ipswdl
