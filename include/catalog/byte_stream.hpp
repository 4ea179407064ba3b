#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <vector>

namespace ipswdl {

struct StreamEvent {
    enum class Kind {
        Chunk, // `data` holds the next bytes of the body
        End,   // the body is exhausted
        Woken, // the wake descriptor became readable first
    };

    Kind kind = Kind::End;
    std::vector<std::uint8_t> data;
};

// Pull-based body of a firmware download.
class IByteStream {
public:
    virtual ~IByteStream() = default;

    // Length announced by the server before the body; 0 when unknown.
    virtual std::uint64_t DeclaredLength() const = 0;

    // Blocks until the next chunk is available, the body ends, or `wake_fd`
    // becomes readable, whichever happens first. When both a chunk and the
    // wake descriptor are ready, Woken is reported. Transport failures are
    // returned as a failed Result.
    virtual Result WaitNext(int wake_fd, StreamEvent& out) = 0;
};

} // namespace ipswdl
