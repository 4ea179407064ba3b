#pragma once

#include "io/fd.hpp"

#include <atomic>
#include <csignal>

namespace ipswdl {

// One-shot cancellation latch. Starts untriggered, flips exactly once and never
// resets. Besides the flag it owns a self-pipe whose read end becomes readable
// on Trigger() and stays readable, so it can be raced against other
// descriptors with poll(2).
class CancellationSignal {
public:
    // Throws std::system_error when the pipe cannot be created.
    CancellationSignal();

    CancellationSignal(const CancellationSignal&) = delete;
    CancellationSignal& operator=(const CancellationSignal&) = delete;

    // Async-signal-safe. Only the first call has an effect.
    void Trigger() noexcept;
    bool Triggered() const noexcept;

    int WaitFd() const noexcept { return read_end_.Get(); }

private:
    std::atomic<bool> triggered_{false};
    Fd read_end_;
    Fd write_end_;
};

// Routes SIGINT and SIGTERM into a CancellationSignal for its lifetime and
// restores the previous dispositions on destruction. The OS handler slot is
// process-global, so only one hook may be live; constructing a second one
// aborts the process.
class InterruptHook {
public:
    explicit InterruptHook(CancellationSignal& signal);
    ~InterruptHook();

    InterruptHook(const InterruptHook&) = delete;
    InterruptHook& operator=(const InterruptHook&) = delete;

private:
    struct sigaction old_int_{};
    struct sigaction old_term_{};
};

} // namespace ipswdl
