#pragma once

#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <string>

namespace ipswdl {

// Temporary file that receives bytes before they are trusted. The stage owns
// two independent handles onto the same inode: a writer for the incoming
// stream and a reader for verification. The file is unlinked on destruction
// unless Promote() moved it to its final location.
class StagingFile {
public:
    static Result Create(const std::string& dir, StagingFile& out);

    // Removes stage files left in `dir` by a process that died mid-download.
    // Live stages hold an exclusive flock and are left alone. Returns the
    // number of files removed.
    static std::size_t ReclaimOrphans(const std::string& dir);

    StagingFile() = default;
    StagingFile(const StagingFile&) = delete;
    StagingFile& operator=(const StagingFile&) = delete;
    StagingFile(StagingFile&& other) noexcept;
    StagingFile& operator=(StagingFile&& other) noexcept;
    ~StagingFile();

    IWriter& Writer() { return writer_; }
    FileReader& Reader() { return reader_; }
    const std::string& Path() const { return path_; }
    std::uint64_t BytesWritten() const { return writer_.BytesWritten(); }

    // Flushes the stage and moves it to final_path with rename(2). When the
    // stage lives on another filesystem the content is copied into
    // "<final_path>.part" first, which is then renamed into place.
    Result Promote(const std::string& final_path);

    void Discard();

private:
    Result CopyAcrossDevices(const std::string& final_path);

    FileWriter writer_;
    FileReader reader_;
    std::string path_;
};

} // namespace ipswdl
