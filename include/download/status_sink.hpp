#pragma once

#include <cstdio>
#include <string>

namespace ipswdl {

enum class StatusTone {
    Plain,
    Notice,   // nothing to do for a device
    Muted,    // already present
    Emphasis, // work starting
    Success,
    Failure,
    Removed,  // stale file deleted
};

// Receives the human-readable lines a run reports to the user.
class IStatusSink {
public:
    virtual ~IStatusSink() = default;
    virtual void Emit(StatusTone tone, const std::string& line) = 0;
};

// Writes status lines to a stream, colouring them when it is a terminal.
class ConsoleStatusSink final : public IStatusSink {
public:
    explicit ConsoleStatusSink(std::FILE* out = stdout);

    void Emit(StatusTone tone, const std::string& line) override;

private:
    std::FILE* out_;
    bool color_;
};

} // namespace ipswdl
