#include "io/staging_file.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <string_view>
#include <sys/file.h>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace ipswdl {

namespace {

constexpr const char* kStageTemplate = "ipswdl-XXXXXX.download";
constexpr std::string_view kStagePrefix = "ipswdl-";
constexpr std::string_view kStageSuffix = ".download";

bool IsStageName(std::string_view name) {
    return name.size() > kStagePrefix.size() + kStageSuffix.size() && name.starts_with(kStagePrefix) &&
           name.ends_with(kStageSuffix);
}

Result FsyncDirectory(const std::string& dir) {
    Fd fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!fd.Valid()) {
        return Result::Errno(errno, "cannot open directory: " + dir);
    }
    if (::fsync(fd.Get()) != 0) {
        return Result::Errno(errno, "fsync failed: " + dir);
    }
    return Result::Ok();
}

std::string ParentOf(const std::string& path) {
    const std::filesystem::path p = std::filesystem::path(path).parent_path();
    return p.empty() ? std::string(".") : p.string();
}

} // namespace

Result StagingFile::Create(const std::string& dir, StagingFile& out) {
    out.Discard();

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return Result::Fail(ec.value(), "cannot create staging directory " + dir + ": " + ec.message());
    }

    std::string tmpl = (std::filesystem::path(dir) / kStageTemplate).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    const int fd = ::mkstemps(buf.data(), static_cast<int>(kStageSuffix.size()));
    if (fd < 0) {
        return Result::Errno(errno, "mkstemps failed in " + dir);
    }
    (void)::fcntl(fd, F_SETFD, FD_CLOEXEC);
    // Marks the stage as owned by a live process for ReclaimOrphans().
    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        LogDebug("cannot lock stage %s: %s", buf.data(), std::strerror(errno));
    }
    out.path_ = buf.data();
    out.writer_ = FileWriter::Adopt(Fd(fd), out.path_);

    auto rr = FileReader::Open(out.path_, out.reader_);
    if (!rr.is_ok()) {
        out.Discard();
        return rr;
    }
    return Result::Ok();
}

std::size_t StagingFile::ReclaimOrphans(const std::string& dir) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        if (ec != std::errc::no_such_file_or_directory) {
            LogWarn("cannot list staging directory %s: %s", dir.c_str(), ec.message().c_str());
        }
        return 0;
    }

    std::size_t removed = 0;
    for (const auto& entry : it) {
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec)) continue;
        if (!IsStageName(entry.path().filename().string())) continue;

        const std::string path = entry.path().string();
        Fd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
        if (!fd.Valid()) continue;
        if (::flock(fd.Get(), LOCK_EX | LOCK_NB) != 0) {
            LogDebug("stage %s is in use, keeping it", path.c_str());
            continue;
        }
        if (::unlink(path.c_str()) != 0) {
            LogWarn("cannot remove orphaned stage %s: %s", path.c_str(), std::strerror(errno));
            continue;
        }
        LogWarn("removed orphaned stage %s", path.c_str());
        ++removed;
    }
    return removed;
}

StagingFile::StagingFile(StagingFile&& other) noexcept { *this = std::move(other); }

StagingFile& StagingFile::operator=(StagingFile&& other) noexcept {
    if (this != &other) {
        Discard();
        writer_ = std::move(other.writer_);
        reader_ = std::move(other.reader_);
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

StagingFile::~StagingFile() { Discard(); }

void StagingFile::Discard() {
    writer_.Close();
    reader_ = FileReader{};
    if (!path_.empty()) {
        if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
            LogWarn("cannot remove stage %s: %s", path_.c_str(), std::strerror(errno));
        }
        path_.clear();
    }
}

Result StagingFile::Promote(const std::string& final_path) {
    if (path_.empty()) {
        return Result::Fail(-1, "no staged file to promote");
    }

    auto fr = writer_.FsyncNow();
    if (!fr.is_ok()) return fr;
    writer_.Close();

    if (::rename(path_.c_str(), final_path.c_str()) == 0) {
        LogDebug("renamed %s -> %s", path_.c_str(), final_path.c_str());
        path_.clear();
        reader_ = FileReader{};
        // The file is complete at final_path; a lost directory entry flush is not a failure.
        if (auto dr = FsyncDirectory(ParentOf(final_path)); !dr.is_ok()) {
            LogWarn("%s", dr.message().c_str());
        }
        return Result::Ok();
    }

    const int err = errno;
    if (err != EXDEV) {
        return Result::Errno(err, "rename " + path_ + " -> " + final_path + " failed");
    }

    LogDebug("stage is on another filesystem, copying into %s", final_path.c_str());
    auto cr = CopyAcrossDevices(final_path);
    if (!cr.is_ok()) return cr;
    Discard();
    return Result::Ok();
}

Result StagingFile::CopyAcrossDevices(const std::string& final_path) {
    auto rw = reader_.Rewind();
    if (!rw.is_ok()) return rw;

    const std::string part_path = final_path + ".part";
    FileWriter part;
    auto op = FileWriter::Open(part_path, part);
    if (!op.is_ok()) return op;

    std::vector<std::uint8_t> buf(1024 * 1024);
    while (true) {
        const ssize_t n = reader_.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) {
            const int err = errno;
            ::unlink(part_path.c_str());
            return Result::Errno(err, "read failed on stage " + path_);
        }
        auto wr = part.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!wr.is_ok()) {
            ::unlink(part_path.c_str());
            return wr;
        }
    }

    auto fs = part.FsyncNow();
    part.Close();
    if (!fs.is_ok()) {
        ::unlink(part_path.c_str());
        return fs;
    }

    if (::rename(part_path.c_str(), final_path.c_str()) != 0) {
        const int err = errno;
        ::unlink(part_path.c_str());
        return Result::Errno(err, "rename " + part_path + " -> " + final_path + " failed");
    }
    return FsyncDirectory(ParentOf(final_path));
}

} // namespace ipswdl
