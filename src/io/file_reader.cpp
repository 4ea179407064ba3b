#include "io/file_reader.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ipswdl {

Result FileReader::Open(std::string path, FileReader& out) {
    out.path_ = std::move(path);

    int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return Result::Errno(errno, "Failed to open for reading: " + out.path_);
    }
    out.fd_.Reset(fd);
    return Result::Ok();
}

// Size is queried on demand: the file may still be growing through another handle.
std::optional<std::uint64_t> FileReader::TotalSize() const {
    struct stat st{};
    if (::fstat(fd_.Get(), &st) != 0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(st.st_size);
}

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

Result FileReader::Rewind() {
    if (::lseek(fd_.Get(), 0, SEEK_SET) == static_cast<off_t>(-1)) {
        return Result::Errno(errno, "lseek failed: " + path_);
    }
    return Result::Ok();
}

} // namespace ipswdl
