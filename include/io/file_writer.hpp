#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>

namespace ipswdl {

// Sequential writer over a regular file descriptor. Either opens (creating or
// truncating) a path, or adopts a descriptor that is already open.
class FileWriter final : public IWriter {
  public:
    static Result Open(std::string path, FileWriter& out);
    static FileWriter Adopt(Fd fd, std::string path);

    FileWriter() = default;

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;

    std::uint64_t BytesWritten() const { return written_; }
    void Close() { fd_.Close(); }

  private:
    std::string path_;
    Fd fd_;
    std::uint64_t written_ = 0;
};

} // namespace ipswdl
