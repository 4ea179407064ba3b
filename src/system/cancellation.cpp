// cancellation.cpp - Cancellation latch and interrupt routing.

#include "system/cancellation.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>

namespace ipswdl {

namespace {

std::atomic<CancellationSignal*> g_hook_target{nullptr};

constexpr char kInterruptMessage[] = "\ninterrupt received, stopping...\n";

void HandleInterrupt(int) {
    const int saved_errno = errno;
    (void)!::write(STDERR_FILENO, kInterruptMessage, sizeof(kInterruptMessage) - 1);
    if (CancellationSignal* target = g_hook_target.load()) {
        target->Trigger();
    }
    errno = saved_errno;
}

} // namespace

CancellationSignal::CancellationSignal() {
    static_assert(std::atomic<bool>::is_always_lock_free);

    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC | O_NONBLOCK) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
    read_end_.Reset(fds[0]);
    write_end_.Reset(fds[1]);
}

void CancellationSignal::Trigger() noexcept {
    if (triggered_.exchange(true)) return;
    // The byte is never consumed, which keeps WaitFd() readable from now on.
    const char b = 1;
    (void)!::write(write_end_.Get(), &b, 1);
}

bool CancellationSignal::Triggered() const noexcept {
    return triggered_.load();
}

InterruptHook::InterruptHook(CancellationSignal& signal) {
    CancellationSignal* expected = nullptr;
    if (!g_hook_target.compare_exchange_strong(expected, &signal)) {
        std::fprintf(stderr, "fatal: a second InterruptHook was created while one is installed\n");
        std::abort();
    }

    struct sigaction sa{};
    sa.sa_handler = HandleInterrupt;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    ::sigaction(SIGINT, &sa, &old_int_);
    ::sigaction(SIGTERM, &sa, &old_term_);
}

InterruptHook::~InterruptHook() {
    ::sigaction(SIGINT, &old_int_, nullptr);
    ::sigaction(SIGTERM, &old_term_, nullptr);
    g_hook_target.store(nullptr);
}

} // namespace ipswdl
